#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstring>
#include <sodium.h>
#include <utility>

#include "proto/wire.hpp"
#include "util/log.hpp"

namespace proto
{

namespace
{

void put_u16(std::vector<std::uint8_t> &out, std::uint16_t v)
{
    std::uint16_t be = htons(v);
    const auto   *p  = reinterpret_cast<const std::uint8_t *>(&be);
    out.insert(out.end(), p, p + sizeof be);
}

void put_u32(std::vector<std::uint8_t> &out, std::uint32_t v)
{
    std::uint32_t be = htonl(v);
    const auto   *p  = reinterpret_cast<const std::uint8_t *>(&be);
    out.insert(out.end(), p, p + sizeof be);
}

void put_u64(std::vector<std::uint8_t> &out, std::uint64_t v)
{
    put_u32(out, static_cast<std::uint32_t>(v >> 32));
    put_u32(out, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
}

std::uint16_t get_u16(const std::uint8_t *in)
{
    std::uint16_t be;
    std::memcpy(&be, in, sizeof be);
    return ntohs(be);
}

std::uint32_t get_u32(const std::uint8_t *in)
{
    std::uint32_t be;
    std::memcpy(&be, in, sizeof be);
    return ntohl(be);
}

std::uint64_t get_u64(const std::uint8_t *in)
{
    return (static_cast<std::uint64_t>(get_u32(in)) << 32) | get_u32(in + 4);
}

bool fail(DecodeError *err, Field f, const char *reason)
{
    if (err)
    {
        err->field  = f;
        err->reason = reason;
    }
    return false;
}

void checksum(const std::uint8_t *in, std::size_t len, std::uint8_t out[CHECK_SIZE])
{
    ensure_sodium_init();
    crypto_generichash(out, CHECK_SIZE, in, len, nullptr, 0);
}

// [ver][type][file_id][index]
void put_prefix(std::vector<std::uint8_t> &out,
                PacketType                 type,
                const FileId              &id,
                std::uint32_t              index)
{
    out.push_back(PROTO_VER);
    out.push_back(static_cast<std::uint8_t>(type));
    out.insert(out.end(), id.bytes.begin(), id.bytes.end());
    put_u32(out, index);
}

void seal(std::vector<std::uint8_t> &out)
{
    std::uint8_t check[CHECK_SIZE];
    checksum(out.data(), out.size(), check);
    out.insert(out.end(), check, check + CHECK_SIZE);
}

bool known_type(std::uint8_t t)
{
    return t == static_cast<std::uint8_t>(PacketType::Chunk) ||
           t == static_cast<std::uint8_t>(PacketType::Ack) ||
           t == static_cast<std::uint8_t>(PacketType::Cancel);
}

}  // namespace

const char *field_name(Field f)
{
    switch (f)
    {
        case Field::Frame:
            return "frame";
        case Field::Version:
            return "version";
        case Field::Type:
            return "type";
        case Field::FileId:
            return "file_id";
        case Field::Index:
            return "index";
        case Field::Length:
            return "length";
        case Field::Payload:
            return "payload";
        case Field::Checksum:
            return "checksum";
        case Field::Name:
            return "name";
        case Field::FileSize:
            return "file_size";
        case Field::ChunkCount:
            return "chunk_count";
    }
    return "?";
}

std::vector<std::uint8_t> serialize(const Chunk &c)
{
    if (c.payload.size() > MAX_PAYLOAD)
    {
        LOG_ERROR("serialize: payload too large (%zu > %zu)", c.payload.size(), MAX_PAYLOAD);
        return {};
    }

    std::vector<std::uint8_t> out;
    out.reserve(CHUNK_OVERHEAD + c.payload.size());
    put_prefix(out, PacketType::Chunk, c.file_id, c.index);
    put_u32(out, static_cast<std::uint32_t>(c.payload.size()));
    out.insert(out.end(), c.payload.begin(), c.payload.end());
    seal(out);
    return out;
}

std::vector<std::uint8_t> serialize(const ControlEvent &ev)
{
    std::vector<std::uint8_t> out;
    out.reserve(CONTROL_FRAME_SIZE);
    if (ev.kind == ControlKind::Cancel)
        put_prefix(out, PacketType::Cancel, ev.file_id, HEADER_INDEX);
    else
        put_prefix(out, PacketType::Ack, ev.file_id, ev.index);
    seal(out);
    return out;
}

std::vector<std::uint8_t> encode_header(const FileHeader &h)
{
    // Refuse anything decode_header would drop, or the header is never acked.
    if (h.file_name.empty())
    {
        LOG_ERROR("encode_header: empty file name");
        return {};
    }
    if (h.file_name.size() > MAX_NAME_LEN)
    {
        LOG_ERROR("encode_header: name too long (%zu > %zu)", h.file_name.size(), MAX_NAME_LEN);
        return {};
    }
    if (!is_valid_utf8(reinterpret_cast<const std::uint8_t *>(h.file_name.data()),
                       h.file_name.size()))
    {
        LOG_ERROR("encode_header: file name is not valid UTF-8");
        return {};
    }
    if (h.chunk_count > MAX_CHUNK_COUNT || (h.chunk_count == 0) != (h.file_size == 0) ||
        h.chunk_count > h.file_size)
    {
        LOG_ERROR("encode_header: chunk count %u does not fit file size %llu", h.chunk_count,
                  static_cast<unsigned long long>(h.file_size));
        return {};
    }

    std::vector<std::uint8_t> out;
    out.reserve(2 + h.file_name.size() + 8 + 4 + 11);
    put_u16(out, static_cast<std::uint16_t>(h.file_name.size()));
    out.insert(out.end(), h.file_name.begin(), h.file_name.end());
    put_u64(out, h.file_size);
    put_u32(out, h.chunk_count);

    if (h.date)
    {
        out.push_back(T_DATE);
        put_u16(out, 8);
        put_u64(out, static_cast<std::uint64_t>(*h.date));
    }
    return out;
}

Chunk make_header_chunk(const FileId &id, const FileHeader &h)
{
    Chunk c;
    c.file_id = id;
    c.index   = HEADER_INDEX;
    c.payload = encode_header(h);
    return c;
}

std::optional<Packet> parse(const std::vector<std::uint8_t> &frame, DecodeError *err)
{
    // Layout is checked field by field, the checksum last, so a damaged
    // length is reported as such instead of as a bad checksum.
    if (frame.size() < CONTROL_FRAME_SIZE)
    {
        fail(err, Field::Frame, "frame shorter than the smallest packet");
        return std::nullopt;
    }
    if (frame[0] != PROTO_VER)
    {
        fail(err, Field::Version, "unsupported protocol version");
        return std::nullopt;
    }
    if (!known_type(frame[1]))
    {
        fail(err, Field::Type, "unknown packet type");
        return std::nullopt;
    }

    Packet p;
    p.type = static_cast<PacketType>(frame[1]);

    FileId id;
    std::memcpy(id.bytes.data(), frame.data() + 2, FILE_ID_SIZE);
    const std::uint32_t index = get_u32(frame.data() + 2 + FILE_ID_SIZE);

    std::size_t body_end = PREFIX_SIZE;
    if (p.type == PacketType::Chunk)
    {
        if (frame.size() < CHUNK_OVERHEAD)
        {
            fail(err, Field::Length, "chunk frame truncated before payload length");
            return std::nullopt;
        }
        const std::uint32_t len = get_u32(frame.data() + PREFIX_SIZE);
        if (len > MAX_PAYLOAD)
        {
            fail(err, Field::Length, "declared payload length exceeds maximum");
            return std::nullopt;
        }
        const std::size_t room = frame.size() - CHUNK_OVERHEAD;
        if (len > room)
        {
            fail(err, Field::Length, "declared payload length exceeds frame");
            return std::nullopt;
        }
        if (len < room)
        {
            fail(err, Field::Frame, "trailing bytes after payload");
            return std::nullopt;
        }
        body_end = PREFIX_SIZE + LEN_SIZE + len;
    }
    else if (frame.size() != CONTROL_FRAME_SIZE)
    {
        fail(err, Field::Frame, "control frame has wrong size");
        return std::nullopt;
    }
    else if (p.type == PacketType::Cancel && index != HEADER_INDEX)
    {
        fail(err, Field::Index, "cancel must carry the header index");
        return std::nullopt;
    }

    std::uint8_t check[CHECK_SIZE];
    checksum(frame.data(), body_end, check);
    if (std::memcmp(check, frame.data() + body_end, CHECK_SIZE) != 0)
    {
        fail(err, Field::Checksum, "checksum mismatch");
        return std::nullopt;
    }

    if (id.is_nil())
    {
        fail(err, Field::FileId, "nil file id");
        return std::nullopt;
    }

    if (p.type == PacketType::Chunk)
    {
        p.chunk.file_id = id;
        p.chunk.index   = index;
        p.chunk.payload.assign(frame.begin() + PREFIX_SIZE + LEN_SIZE, frame.begin() + body_end);
    }
    else
    {
        p.control.kind    = p.type == PacketType::Ack ? ControlKind::Ack : ControlKind::Cancel;
        p.control.file_id = id;
        p.control.index   = index;
    }
    return p;
}

std::optional<Chunk> parse_chunk(const std::vector<std::uint8_t> &frame, DecodeError *err)
{
    auto p = parse(frame, err);
    if (!p)
        return std::nullopt;
    if (p->type != PacketType::Chunk)
    {
        fail(err, Field::Type, "expected a chunk packet");
        return std::nullopt;
    }
    return std::move(p->chunk);
}

std::optional<ControlEvent> parse_control(const std::vector<std::uint8_t> &frame,
                                          DecodeError                     *err)
{
    auto p = parse(frame, err);
    if (!p)
        return std::nullopt;
    if (p->type == PacketType::Chunk)
    {
        fail(err, Field::Type, "expected a control packet");
        return std::nullopt;
    }
    return p->control;
}

std::optional<FileHeader> decode_header(const std::uint8_t *buf, std::size_t len, DecodeError *err)
{
    if (!buf && len)
    {
        fail(err, Field::Payload, "null header buffer");
        return std::nullopt;
    }
    std::size_t i = 0;
    if (len < 2)
    {
        fail(err, Field::Name, "header truncated before name length");
        return std::nullopt;
    }
    const std::uint16_t name_len = get_u16(buf);
    i += 2;
    if (name_len == 0)
    {
        fail(err, Field::Name, "empty file name");
        return std::nullopt;
    }
    if (name_len > MAX_NAME_LEN)
    {
        fail(err, Field::Name, "file name longer than allowed");
        return std::nullopt;
    }
    if (name_len > len - i)
    {
        fail(err, Field::Name, "declared name length exceeds payload");
        return std::nullopt;
    }
    if (!is_valid_utf8(buf + i, name_len))
    {
        fail(err, Field::Name, "file name is not valid UTF-8");
        return std::nullopt;
    }

    FileHeader h;
    h.file_name.assign(reinterpret_cast<const char *>(buf + i), name_len);
    i += name_len;

    if (len - i < 8)
    {
        fail(err, Field::FileSize, "header truncated in file size");
        return std::nullopt;
    }
    h.file_size = get_u64(buf + i);
    i += 8;

    if (len - i < 4)
    {
        fail(err, Field::ChunkCount, "header truncated in chunk count");
        return std::nullopt;
    }
    h.chunk_count = get_u32(buf + i);
    i += 4;

    if (h.chunk_count > MAX_CHUNK_COUNT)
    {
        fail(err, Field::ChunkCount, "chunk count collides with the header index");
        return std::nullopt;
    }
    if ((h.chunk_count == 0) != (h.file_size == 0))
    {
        fail(err, Field::ChunkCount, "chunk count and file size disagree on emptiness");
        return std::nullopt;
    }
    if (h.chunk_count > h.file_size)
    {
        fail(err, Field::ChunkCount, "more chunks than bytes");
        return std::nullopt;
    }

    // Trailing metadata: [tag][len u16][value]. Unknown tags are skipped and a
    // cut-off record ends the scan, so newer senders don't break older receivers.
    while (len - i >= 3)
    {
        const std::uint8_t  t = buf[i];
        const std::uint16_t L = get_u16(buf + i + 1);
        i += 3;
        if (L > len - i)
            break;
        if (t == T_DATE && L == 8)
            h.date = static_cast<std::int64_t>(get_u64(buf + i));
        i += L;
    }
    return h;
}

std::optional<FileHeader> decode_header(const std::vector<std::uint8_t> &payload, DecodeError *err)
{
    return decode_header(payload.data(), payload.size(), err);
}

bool is_valid_utf8(const std::uint8_t *s, std::size_t n)
{
    std::size_t i = 0;
    while (i < n)
    {
        const std::uint8_t c = s[i];
        std::size_t        extra;
        std::uint32_t      cp;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp    = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp    = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp    = c & 0x07;
        }
        else
        {
            return false;
        }
        if (n - i <= extra)
            return false;
        for (std::size_t k = 1; k <= extra; ++k)
        {
            if ((s[i + k] & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }
        // overlong forms, surrogates, beyond U+10FFFF
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += extra + 1;
    }
    return true;
}

}  // namespace proto
