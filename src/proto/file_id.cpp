#include <sodium.h>

#include "proto/file_id.hpp"
#include "util/log.hpp"

namespace proto
{

bool ensure_sodium_init()
{
    static const bool ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

FileId FileId::generate()
{
    if (!ensure_sodium_init())
        LOG_ERROR("sodium_init failed, ids come from an uninitialised RNG");

    FileId id;
    randombytes_buf(id.bytes.data(), id.bytes.size());
    // version 4, variant 10xx
    id.bytes[6] = static_cast<std::uint8_t>((id.bytes[6] & 0x0F) | 0x40);
    id.bytes[8] = static_cast<std::uint8_t>((id.bytes[8] & 0x3F) | 0x80);
    return id;
}

static int hex_val(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
        return 10 + (c - 'A');
    return -1;
}

std::optional<FileId> FileId::from_string(std::string_view s)
{
    if (s.size() != 36)
        return std::nullopt;
    FileId      id;
    std::size_t j = 0;
    for (std::size_t i = 0; i < s.size();)
    {
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (s[i] != '-')
                return std::nullopt;
            ++i;
            continue;
        }
        const int hi = hex_val(s[i]);
        const int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        id.bytes[j++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return id;
}

std::string FileId::to_string() const
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string           out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0F]);
    }
    return out;
}

bool FileId::is_nil() const
{
    for (auto b : bytes)
    {
        if (b != 0)
            return false;
    }
    return true;
}

}  // namespace proto
