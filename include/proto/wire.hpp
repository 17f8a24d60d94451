#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "proto/file_id.hpp"

/*
SENDER:
sender::load_file(path, S)
  -> make_file_chunks(bytes, S)     // header chunk + ceil(size/S) data chunks
     -> SenderEngine::enqueue(file)
        -> next_batch(n) -> serialize(Chunk) -> transport.send(frame)

RECEIVER:
transport.on_rx(frame)
  -> parse(frame)                   // structure + checksum, or MalformedPacket
     -> ReassemblyStore             // header/data bookkeeping
        -> ControlEventQueue        // one Ack per accepted chunk
        -> IFileSink::write_file    // once the file is complete

ACKS:
ControlEventQueue::drain() -> serialize(ControlEvent) -> uplink -> SenderEngine::ingest
*/

namespace proto
{

// --- Protocol constants ---
inline constexpr std::uint8_t  PROTO_VER       = 1;
inline constexpr std::uint32_t HEADER_INDEX    = 0xFFFFFFFFu;  // sentinel: chunk carries the header
inline constexpr std::uint32_t MAX_CHUNK_COUNT = HEADER_INDEX - 1;
inline constexpr std::size_t   PREFIX_SIZE     = 1 + 1 + FILE_ID_SIZE + 4;  // ver, type, id, index
inline constexpr std::size_t   LEN_SIZE        = 4;
inline constexpr std::size_t   CHECK_SIZE      = 16;       // BLAKE2b-128 over the frame
inline constexpr std::size_t   MAX_PAYLOAD     = 1048576;  // 1 MiB per chunk
inline constexpr std::size_t   MAX_NAME_LEN    = 1024;
inline constexpr std::size_t   CONTROL_FRAME_SIZE = PREFIX_SIZE + CHECK_SIZE;
inline constexpr std::size_t   CHUNK_OVERHEAD     = PREFIX_SIZE + LEN_SIZE + CHECK_SIZE;

// header metadata TLV tags
inline constexpr std::uint8_t T_DATE = 0x01;

enum class PacketType : std::uint8_t
{
    Chunk  = 0x01,
    Ack    = 0x80,
    Cancel = 0x81,
};

struct Chunk
{
    FileId                    file_id;
    std::uint32_t             index{0};
    std::vector<std::uint8_t> payload;

    bool is_header() const { return index == HEADER_INDEX; }
    bool operator==(const Chunk &o) const
    {
        return file_id == o.file_id && index == o.index && payload == o.payload;
    }
};

struct FileHeader
{
    std::string                 file_name;
    std::uint64_t               file_size{0};
    std::uint32_t               chunk_count{0};
    std::optional<std::int64_t> date;  // ns since the unix epoch

    bool operator==(const FileHeader &o) const
    {
        return file_name == o.file_name && file_size == o.file_size &&
               chunk_count == o.chunk_count && date == o.date;
    }
    bool operator!=(const FileHeader &o) const { return !(*this == o); }
};

enum class ControlKind : std::uint8_t
{
    Ack,     // one chunk was received
    Cancel,  // receiver gave up on the file, stop offering it
};

struct ControlEvent
{
    ControlKind   kind{ControlKind::Ack};
    FileId        file_id;
    std::uint32_t index{0};

    static ControlEvent ack(const FileId &id, std::uint32_t index)
    {
        return ControlEvent{ControlKind::Ack, id, index};
    }
    static ControlEvent cancel(const FileId &id)
    {
        return ControlEvent{ControlKind::Cancel, id, HEADER_INDEX};
    }

    bool operator==(const ControlEvent &o) const
    {
        return kind == o.kind && file_id == o.file_id && index == o.index;
    }
};

// Which field made a decode fail
enum class Field
{
    Frame,
    Version,
    Type,
    FileId,
    Index,
    Length,
    Payload,
    Checksum,
    Name,
    FileSize,
    ChunkCount,
};

const char *field_name(Field f);

struct DecodeError
{
    Field       field{Field::Frame};
    std::string reason;
};

struct Packet
{
    PacketType   type{PacketType::Chunk};
    Chunk        chunk;    // valid when type == Chunk
    ControlEvent control;  // valid when type is Ack or Cancel
};

// TX
std::vector<std::uint8_t> serialize(const Chunk &c);
std::vector<std::uint8_t> serialize(const ControlEvent &ev);
std::vector<std::uint8_t> encode_header(const FileHeader &h);
Chunk                     make_header_chunk(const FileId &id, const FileHeader &h);

// RX: never throws, never reads past `frame`, allocates at most frame.size() bytes
std::optional<Packet>       parse(const std::vector<std::uint8_t> &frame, DecodeError *err = nullptr);
std::optional<Chunk>        parse_chunk(const std::vector<std::uint8_t> &frame,
                                        DecodeError                     *err = nullptr);
std::optional<ControlEvent> parse_control(const std::vector<std::uint8_t> &frame,
                                          DecodeError                     *err = nullptr);
std::optional<FileHeader>   decode_header(const std::uint8_t *buf,
                                          std::size_t         len,
                                          DecodeError        *err = nullptr);
std::optional<FileHeader>   decode_header(const std::vector<std::uint8_t> &payload,
                                          DecodeError                     *err = nullptr);

bool is_valid_utf8(const std::uint8_t *s, std::size_t n);

}  // namespace proto
