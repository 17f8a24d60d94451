#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "app/downlink_session.hpp"
#include "receiver/file_sink.hpp"
#include "receiver/receiver_engine.hpp"
#include "sender/chunk_source.hpp"
#include "sender/sender_engine.hpp"
#include "transport/lossy_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  downlink-sim <file>...\n"
                         "\n"
                         "Sends every file over a simulated lossy downlink with a sparse\n"
                         "uplink for acks, and writes what arrives to DOWNLINK_OUTPUT_DIR.\n"
                         "\n"
                         "Environment:\n"
                         "  DOWNLINK_LOG_LEVEL      debug|info|warn|error|system\n"
                         "  DOWNLINK_CHUNK_SIZE     payload bytes per chunk (1..1048576)\n"
                         "  DOWNLINK_BATCH          chunks sent per round\n"
                         "  DOWNLINK_MAX_IN_FLIGHT  files offered at once (0 = all)\n"
                         "  DOWNLINK_DROP_PCT / DOWNLINK_DUP_PCT / DOWNLINK_CORRUPT_PCT\n"
                         "  DOWNLINK_ACK_DROP_PCT   uplink loss\n"
                         "  DOWNLINK_ACK_EVERY      rounds between ack flushes\n"
                         "  DOWNLINK_ACK_DEDUP      0|1\n"
                         "  DOWNLINK_SEED, DOWNLINK_MAX_ROUNDS\n");
}

int main(int argc, char **argv)
{
    // log level from env var
    if (const char *log_level = std::getenv("DOWNLINK_LOG_LEVEL"))
        downlink::set_log_level_by_name(log_level);

    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)
    {
        print_usage();
        return argc < 2 ? exitc::bad_args : exitc::ok;
    }

    const config::Settings cfg = config::load_from_env();
    LOG_SYSTEM("Config: chunk=%zu batch=%zu drop=%u%% dup=%u%% corrupt=%u%% ack_drop=%u%% "
               "ack_every=%u seed=%u out=%s",
               cfg.chunk_size, cfg.batch, cfg.drop_pct, cfg.dup_pct, cfg.corrupt_pct,
               cfg.ack_drop_pct, cfg.ack_every, cfg.seed, cfg.output_dir.c_str());

    sender::SenderConfig scfg{};
    scfg.max_in_flight = cfg.max_in_flight;
    sender::SenderEngine snd(scfg);

    std::size_t acked = 0;
    snd.set_on_acknowledged([&acked](const proto::FileId &, const std::string &) { ++acked; });

    std::size_t enqueued = 0;
    for (int i = 1; i < argc; ++i)
    {
        auto f = sender::load_file(argv[i], cfg.chunk_size);
        if (!f)
            return exitc::io_error;
        if (snd.enqueue(std::move(*f)))
            ++enqueued;
    }

    receiver::DirectorySink   sink(cfg.output_dir);
    receiver::ReceiverConfig  rcfg{};
    rcfg.dedup = cfg.ack_dedup ? receiver::DedupPolicy::PendingBatch : receiver::DedupPolicy::None;
    receiver::ReceiverEngine rcv(sink, rcfg);

    transport::LossyConfig dcfg{};
    dcfg.drop_pct    = cfg.drop_pct;
    dcfg.dup_pct     = cfg.dup_pct;
    dcfg.corrupt_pct = cfg.corrupt_pct;
    dcfg.seed        = cfg.seed;
    transport::LossyTransport down(dcfg);

    transport::LossyConfig ucfg{};
    ucfg.drop_pct    = cfg.ack_drop_pct;
    ucfg.corrupt_pct = cfg.corrupt_pct;
    ucfg.seed        = cfg.seed + 1;
    transport::LossyTransport up(ucfg);

    app::DownlinkSession session(down, up, snd, rcv);
    if (!session.start())
    {
        LOG_ERROR("session start failed");
        return exitc::io_error;
    }

    int round = 0;
    for (; round < cfg.max_rounds && !snd.idle(); ++round)
    {
        session.send_round(cfg.batch);
        down.pump();
        if ((round + 1) % cfg.ack_every == 0)
        {
            session.flush_acks();
            up.pump();
            if (rcv.stats().storage_failures >= constants::MAX_STORAGE_FAILURES)
            {
                LOG_ERROR("giving up after %zu failed file writes", rcv.stats().storage_failures);
                break;
            }
        }
    }
    // whatever is still queued
    session.flush_acks();
    up.pump();

    for (const auto &o : rcv.take_outcomes())
    {
        const char *what = o.status == receiver::OutcomeStatus::Finalized       ? "finalized"
                           : o.status == receiver::OutcomeStatus::StorageFailed ? "storage failed"
                                                                                : "abandoned";
        LOG_SYSTEM("[RESULT] %s '%s': %s %s", o.id.to_string().c_str(), o.name.c_str(), what,
                   o.detail.c_str());
    }

    const auto &st = rcv.stats();
    const auto  dc = down.counters();
    LOG_SYSTEM("Done after %d rounds: %zu/%zu files acked; downlink sent=%zu dropped=%zu "
               "dup=%zu corrupted=%zu; receiver malformed=%zu violations=%zu finalized=%zu",
               round, acked, enqueued, dc.sent, dc.dropped, dc.duplicated, dc.corrupted,
               st.malformed, st.violations, st.finalized);

    session.stop();
    return snd.idle() ? exitc::ok : exitc::incomplete;
}
