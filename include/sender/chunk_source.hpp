#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "proto/wire.hpp"

namespace sender
{

// A file cut into wire chunks: chunks[0] is the header, chunks[1 + i] is data index i.
struct OutgoingFile
{
    proto::FileId             id;
    proto::FileHeader         header;
    std::vector<proto::Chunk> chunks;
};

// Split `bytes` into ceil(size / max_payload) data chunks under a fresh FileId.
// An empty file yields the header chunk only.
std::optional<OutgoingFile> make_file_chunks(const std::vector<std::uint8_t> &bytes,
                                             std::size_t                      max_payload,
                                             const std::string               &name,
                                             std::optional<std::int64_t>      date = std::nullopt);

// Read `path` and split it; the header carries the basename and the mtime.
std::optional<OutgoingFile> load_file(const std::string &path, std::size_t max_payload);

}  // namespace sender
