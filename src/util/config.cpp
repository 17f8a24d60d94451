#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "proto/wire.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

std::optional<unsigned long> parse_ulong(const char *s, unsigned long lo, unsigned long hi)
{
    if (!s || !*s)
        return std::nullopt;
    // strtoul accepts a leading '-', we don't
    if (*s == '-' || *s == '+' || *s == ' ')
        return std::nullopt;
    char *end = nullptr;
    errno     = 0;
    unsigned long v = std::strtoul(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return std::nullopt;
    if (v < lo || v > hi)
        return std::nullopt;
    return v;
}

unsigned long env_ulong(const char *key, unsigned long defv, unsigned long lo, unsigned long hi)
{
    const char *e = std::getenv(key);
    if (!e)
        return defv;
    if (auto v = parse_ulong(e, lo, hi))
    {
        LOG_INFO("Using %s=%lu", key, *v);
        return *v;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
    return defv;
}

bool env_flag(const char *key, bool defv)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return defv;
    if (std::strcmp(e, "1") == 0 || std::strcmp(e, "on") == 0 || std::strcmp(e, "true") == 0)
        return true;
    if (std::strcmp(e, "0") == 0 || std::strcmp(e, "off") == 0 || std::strcmp(e, "false") == 0)
        return false;
    LOG_WARN("Ignoring invalid %s='%s' (expect 0|1)", key, e);
    return defv;
}

Settings load_from_env()
{
    Settings s{};
    s.chunk_size = env_ulong("DOWNLINK_CHUNK_SIZE", constants::DEFAULT_CHUNK_SIZE, 1,
                             proto::MAX_PAYLOAD);
    s.batch      = env_ulong("DOWNLINK_BATCH", constants::DEFAULT_BATCH, 1, 65536);
    s.max_in_flight = env_ulong("DOWNLINK_MAX_IN_FLIGHT", 0, 0, 65536);
    s.output_dir    = constants::output_dir();
    s.drop_pct      = env_ulong("DOWNLINK_DROP_PCT", 0, 0, 100);
    s.dup_pct       = env_ulong("DOWNLINK_DUP_PCT", 0, 0, 100);
    s.corrupt_pct   = env_ulong("DOWNLINK_CORRUPT_PCT", 0, 0, 100);
    s.ack_drop_pct  = env_ulong("DOWNLINK_ACK_DROP_PCT", 0, 0, 100);
    s.seed          = static_cast<std::uint32_t>(
        env_ulong("DOWNLINK_SEED", constants::DEFAULT_SEED, 0, UINT32_MAX));
    s.ack_dedup  = env_flag("DOWNLINK_ACK_DEDUP", false);
    s.ack_every  = env_ulong("DOWNLINK_ACK_EVERY", 4, 1, 1000000);
    s.max_rounds = static_cast<int>(
        env_ulong("DOWNLINK_MAX_ROUNDS", constants::DEFAULT_MAX_ROUNDS, 1, 100000000));
    return s;
}

}  // namespace config
