#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace config
{

// Settings for downlink-sim, read once from DOWNLINK_* environment variables.
struct Settings
{
    std::size_t   chunk_size    = 1024;
    std::size_t   batch         = 32;
    std::size_t   max_in_flight = 0;  // 0 = unlimited
    std::string   output_dir;
    unsigned      drop_pct      = 0;
    unsigned      dup_pct       = 0;
    unsigned      corrupt_pct   = 0;
    unsigned      ack_drop_pct  = 0;
    std::uint32_t seed          = 1;
    bool          ack_dedup     = false;
    unsigned      ack_every     = 4;  // rounds between uplink flushes
    int           max_rounds    = 100000;
};

// Parse an unsigned decimal in [lo, hi]; nullopt on garbage or out of range.
std::optional<unsigned long> parse_ulong(const char *s, unsigned long lo, unsigned long hi);

// Reads `key`; invalid values are logged and `defv` is returned.
unsigned long env_ulong(const char *key, unsigned long defv, unsigned long lo, unsigned long hi);
bool          env_flag(const char *key, bool defv);

Settings load_from_env();

}  // namespace config
