#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "sender/chunk_source.hpp"
#include "util/log.hpp"

namespace sender
{

std::optional<OutgoingFile> make_file_chunks(const std::vector<std::uint8_t> &bytes,
                                             std::size_t                      max_payload,
                                             const std::string               &name,
                                             std::optional<std::int64_t>      date)
{
    if (max_payload < 1 || max_payload > proto::MAX_PAYLOAD)
    {
        LOG_ERROR("make_file_chunks: invalid max_payload (%zu)", max_payload);
        return std::nullopt;
    }
    if (name.empty() || name.size() > proto::MAX_NAME_LEN)
    {
        LOG_ERROR("make_file_chunks: invalid file name length (%zu)", name.size());
        return std::nullopt;
    }
    if (!proto::is_valid_utf8(reinterpret_cast<const std::uint8_t *>(name.data()), name.size()))
    {
        LOG_ERROR("make_file_chunks: file name is not valid UTF-8");
        return std::nullopt;
    }

    const std::size_t num_chunks = (bytes.size() + max_payload - 1) / max_payload;
    if (num_chunks > proto::MAX_CHUNK_COUNT)
    {
        LOG_ERROR("make_file_chunks: file too large (%zu bytes, needs %zu chunks)", bytes.size(),
                  num_chunks);
        return std::nullopt;
    }

    OutgoingFile f;
    f.id                 = proto::FileId::generate();
    f.header.file_name   = name;
    f.header.file_size   = bytes.size();
    f.header.chunk_count = static_cast<std::uint32_t>(num_chunks);
    f.header.date        = date;

    f.chunks.reserve(num_chunks + 1);
    f.chunks.push_back(proto::make_header_chunk(f.id, f.header));
    if (f.chunks.back().payload.empty())
        return std::nullopt;  // encode_header already logged

    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * max_payload;
        const std::size_t take  = std::min(max_payload, bytes.size() - start);
        proto::Chunk      c;
        c.file_id = f.id;
        c.index   = static_cast<std::uint32_t>(i);
        c.payload.assign(bytes.begin() + start, bytes.begin() + start + take);
        f.chunks.push_back(std::move(c));
    }

    LOG_DEBUG("make_file_chunks: %s '%s' %zu bytes -> %zu chunks", f.id.to_string().c_str(),
              name.c_str(), bytes.size(), num_chunks);
    return f;
}

std::optional<OutgoingFile> load_file(const std::string &path, std::size_t max_payload)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        LOG_ERROR("load_file: not a regular file: %s", path.c_str());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("load_file: cannot open %s", path.c_str());
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad())
    {
        LOG_ERROR("load_file: read failed for %s", path.c_str());
        return std::nullopt;
    }

    std::optional<std::int64_t> date;
    const auto                  mtime = fs::last_write_time(path, ec);
    if (!ec)
    {
        // file_clock has no portable epoch in C++17, rebase through now()
        const auto sys = std::chrono::system_clock::now() +
                         (mtime - fs::file_time_type::clock::now());
        date = std::chrono::duration_cast<std::chrono::nanoseconds>(sys.time_since_epoch()).count();
    }

    return make_file_chunks(bytes, max_payload, fs::path(path).filename().string(), date);
}

}  // namespace sender
