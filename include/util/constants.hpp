#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Defaults for the downlink-sim tool; every one can be overridden from the environment.
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024;
inline constexpr std::size_t DEFAULT_BATCH      = 32;
inline constexpr unsigned    DEFAULT_SEED       = 1;
inline constexpr int         DEFAULT_MAX_ROUNDS = 100000;
// downlink-sim gives up once this many file writes have failed
inline constexpr std::size_t MAX_STORAGE_FAILURES = 8;

inline constexpr std::string_view ENV_OUTPUT_DIR = "DOWNLINK_OUTPUT_DIR";

// Directory the receiver finalizes files into
[[maybe_unused]] static std::string output_dir()
{
    if (const char *p = std::getenv(ENV_OUTPUT_DIR.data()); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string dir  = base + "/.cache/downlink/out";
    LOG_SYSTEM("Writing received files to %s", dir.c_str());
    return dir;
}

}  // namespace constants
