#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace proto
{

inline constexpr std::size_t FILE_ID_SIZE = 16;

// 128-bit transfer identifier (RFC 4122 v4 layout)
struct FileId
{
    std::array<std::uint8_t, FILE_ID_SIZE> bytes{};

    // Fresh random id from libsodium's CSPRNG
    static FileId generate();
    // Parses the canonical 8-4-4-4-12 hex form (either case)
    static std::optional<FileId> from_string(std::string_view s);

    std::string to_string() const;
    bool        is_nil() const;

    bool operator==(const FileId &o) const { return bytes == o.bytes; }
    bool operator!=(const FileId &o) const { return bytes != o.bytes; }
    bool operator<(const FileId &o) const { return bytes < o.bytes; }
};

// Initialises libsodium once; false if the library could not start.
bool ensure_sodium_init();

}  // namespace proto

namespace std
{
template <>
struct hash<proto::FileId>
{
    std::size_t operator()(const proto::FileId &id) const noexcept
    {
        std::uint64_t a, b;
        std::memcpy(&a, id.bytes.data(), sizeof a);
        std::memcpy(&b, id.bytes.data() + 8, sizeof b);
        return static_cast<std::size_t>(a ^ (b * 0x9E3779B97F4A7C15ull));
    }
};
}  // namespace std
