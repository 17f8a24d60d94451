#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "proto/wire.hpp"
#include "receiver/receiver_engine.hpp"
#include "sender/chunk_source.hpp"

using namespace receiver;
using proto::Chunk;
using proto::ControlEvent;
using proto::ControlKind;
using proto::FileId;
using proto::HEADER_INDEX;

// Sink that keeps everything in memory and can be told to refuse writes.
struct MemorySink : IFileSink
{
    std::map<std::string, std::vector<std::uint8_t>> files;
    int                                              attempts = 0;
    bool                                             fail     = false;

    bool write_file(const std::string               &name,
                    const std::vector<std::uint8_t> &bytes,
                    std::string                     &err) override
    {
        ++attempts;
        if (fail)
        {
            err = "disk full";
            return false;
        }
        files[name] = bytes;
        return true;
    }
};

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 13 + 1) & 0xFF);
    return v;
}

static sender::OutgoingFile make_file(std::size_t size, std::size_t S, const std::string &name)
{
    auto f = sender::make_file_chunks(gen_bytes(size), S, name);
    EXPECT_TRUE(f.has_value());
    return std::move(*f);
}

static std::vector<std::uint32_t> ack_indices(const std::vector<ControlEvent> &ev)
{
    std::vector<std::uint32_t> out;
    for (const auto &e : ev)
    {
        EXPECT_EQ(e.kind, ControlKind::Ack);
        out.push_back(e.index);
    }
    return out;
}

TEST(ReceiverEngine, OutOfOrderDeliveryAcksEveryChunk)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(17, 8, "a.bin");
    // chunks[0] is the header, chunks[1 + i] is data i

    EXPECT_EQ(rx.on_rx(proto::serialize(f.chunks[3])), IngestResult::Accepted);  // data 2
    EXPECT_EQ(rx.on_rx(proto::serialize(f.chunks[0])), IngestResult::Accepted);  // header
    EXPECT_EQ(rx.on_rx(proto::serialize(f.chunks[1])), IngestResult::Accepted);  // data 0
    EXPECT_TRUE(sink.files.empty());
    EXPECT_EQ(rx.on_rx(proto::serialize(f.chunks[2])), IngestResult::Accepted);  // data 1

    EXPECT_EQ(ack_indices(rx.drain_control()),
              (std::vector<std::uint32_t>{2, HEADER_INDEX, 0, 1}));
    ASSERT_EQ(sink.files.count("a.bin"), 1u);
    EXPECT_EQ(sink.files["a.bin"], gen_bytes(17));

    auto out = rx.take_outcomes();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, f.id);
    EXPECT_EQ(out[0].name, "a.bin");
    EXPECT_EQ(out[0].status, OutcomeStatus::Finalized);
    EXPECT_EQ(rx.stats().finalized, 1u);
}

TEST(ReceiverEngine, EveryPermutationFinalizesOnce)
{
    auto f = make_file(5, 1, "perm.bin");  // header + 5 data chunks
    std::vector<std::size_t> order(f.chunks.size());
    for (std::size_t i = 0; i < order.size(); ++i)
        order[i] = i;

    int perms = 0;
    do
    {
        MemorySink     sink;
        ReceiverEngine rx(sink);
        for (std::size_t k = 0; k < order.size(); ++k)
        {
            EXPECT_EQ(rx.on_chunk(f.chunks[order[k]]), IngestResult::Accepted);
            // nothing is written before the last missing chunk arrives
            EXPECT_EQ(sink.attempts, k + 1 == order.size() ? 1 : 0);
        }
        EXPECT_EQ(sink.files["perm.bin"], gen_bytes(5));
        EXPECT_EQ(rx.drain_control().size(), order.size());
        ++perms;
    } while (std::next_permutation(order.begin(), order.end()));
    EXPECT_EQ(perms, 720);
}

TEST(ReceiverEngine, DuplicatesAndShufflesAreIdempotent)
{
    std::mt19937 rng(42);
    for (int round = 0; round < 50; ++round)
    {
        auto f = make_file(40 + round, 3, "dup.bin");

        std::vector<std::size_t>           seq;
        std::uniform_int_distribution<int> copies(1, 3);
        for (std::size_t i = 0; i < f.chunks.size(); ++i)
            for (int k = copies(rng); k > 0; --k)
                seq.push_back(i);
        std::shuffle(seq.begin(), seq.end(), rng);

        MemorySink     sink;
        ReceiverEngine rx(sink);
        for (auto i : seq)
        {
            const auto r = rx.on_chunk(f.chunks[i]);
            EXPECT_TRUE(r == IngestResult::Accepted || r == IngestResult::Duplicate);
        }
        EXPECT_EQ(sink.attempts, 1);
        EXPECT_EQ(sink.files["dup.bin"], gen_bytes(40 + round));
        // one ack per delivery, duplicates included
        EXPECT_EQ(rx.drain_control().size(), seq.size());
        EXPECT_EQ(rx.stats().accepted, f.chunks.size());
        EXPECT_EQ(rx.stats().duplicates, seq.size() - f.chunks.size());
    }
}

TEST(ReceiverEngine, RedeliveryAfterFinalizeOnlyAcks)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(10, 4, "again.bin");
    for (const auto &c : f.chunks)
        rx.on_chunk(c);
    ASSERT_EQ(sink.attempts, 1);
    (void)rx.drain_control();

    for (const auto &c : f.chunks)
        EXPECT_EQ(rx.on_chunk(c), IngestResult::Duplicate);
    EXPECT_EQ(sink.attempts, 1);
    EXPECT_EQ(rx.drain_control().size(), f.chunks.size());

    const FileRecord *rec = rx.store().find(f.id);
    ASSERT_NE(rec, nullptr);
    EXPECT_TRUE(rec->finalized);
    EXPECT_EQ(rx.store().buffered_bytes(), 0u);
}

TEST(ReceiverEngine, EmptyFileFinalizesOnHeader)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(0, 8, "empty.txt");
    ASSERT_EQ(f.chunks.size(), 1u);

    EXPECT_EQ(rx.on_chunk(f.chunks[0]), IngestResult::Accepted);
    ASSERT_EQ(sink.files.count("empty.txt"), 1u);
    EXPECT_TRUE(sink.files["empty.txt"].empty());
    EXPECT_EQ(ack_indices(rx.drain_control()), std::vector<std::uint32_t>{HEADER_INDEX});
}

TEST(ReceiverEngine, InterleavedFiles)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           a = make_file(30, 4, "a");
    auto           b = make_file(25, 4, "b");
    const std::size_t n = std::max(a.chunks.size(), b.chunks.size());
    for (std::size_t i = n; i-- > 0;)
    {
        if (i < a.chunks.size())
            rx.on_chunk(a.chunks[i]);
        if (i < b.chunks.size())
            rx.on_chunk(b.chunks[i]);
    }
    EXPECT_EQ(sink.files["a"], gen_bytes(30));
    EXPECT_EQ(sink.files["b"], gen_bytes(25));
}

TEST(ReceiverEngine, MalformedFramesAreDiscarded)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(9, 4, "m.bin");

    auto frame = proto::serialize(f.chunks[1]);
    frame[frame.size() / 2] ^= 0x10;
    EXPECT_EQ(rx.on_rx(frame), IngestResult::Malformed);
    EXPECT_EQ(rx.on_rx({0x01, 0x02, 0x03}), IngestResult::Malformed);

    // well-formed frame, undecodable header payload
    Chunk bad_header;
    bad_header.file_id = f.id;
    bad_header.index   = HEADER_INDEX;
    bad_header.payload = {0x00, 0x00};
    EXPECT_EQ(rx.on_rx(proto::serialize(bad_header)), IngestResult::Malformed);

    EXPECT_TRUE(rx.drain_control().empty());
    EXPECT_EQ(rx.stats().malformed, 3u);
    EXPECT_EQ(rx.stats().frames, 3u);
}

TEST(ReceiverEngine, ControlPacketOnDataLinkIgnored)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    EXPECT_EQ(rx.on_rx(proto::serialize(ControlEvent::ack(FileId::generate(), 1))),
              IngestResult::Ignored);
    EXPECT_TRUE(rx.drain_control().empty());
    EXPECT_EQ(rx.store().size(), 0u);
}

TEST(ReceiverEngine, ConflictingHeaderKeepsFirst)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(12, 4, "first.bin");
    ASSERT_EQ(rx.on_chunk(f.chunks[0]), IngestResult::Accepted);

    proto::FileHeader other = f.header;
    other.file_name         = "second.bin";
    EXPECT_EQ(rx.on_chunk(proto::make_header_chunk(f.id, other)), IngestResult::Violation);
    EXPECT_EQ(rx.on_chunk(f.chunks[0]), IngestResult::Duplicate);

    for (std::size_t i = 1; i < f.chunks.size(); ++i)
        rx.on_chunk(f.chunks[i]);
    EXPECT_EQ(sink.files.count("first.bin"), 1u);
    EXPECT_EQ(sink.files.count("second.bin"), 0u);
    // the conflicting header was not acked
    EXPECT_EQ(rx.drain_control().size(), f.chunks.size() + 1);
}

TEST(ReceiverEngine, IndexBeyondChunkCountIsViolation)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(8, 4, "x");  // two data chunks
    rx.on_chunk(f.chunks[0]);
    (void)rx.drain_control();

    Chunk stray  = f.chunks[1];
    stray.index  = 2;
    EXPECT_EQ(rx.on_chunk(stray), IngestResult::Violation);
    EXPECT_TRUE(rx.drain_control().empty());
    EXPECT_EQ(rx.stats().violations, 1u);
}

TEST(ReceiverEngine, HeaderPurgesEarlyStrays)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(8, 4, "purge.bin");

    Chunk stray = f.chunks[1];
    stray.index = 9;
    EXPECT_EQ(rx.on_chunk(stray), IngestResult::Accepted);  // nothing to check it against yet
    for (const auto &c : f.chunks)
        rx.on_chunk(c);

    EXPECT_EQ(rx.stats().violations, 1u);
    EXPECT_EQ(sink.files["purge.bin"], gen_bytes(8));
}

TEST(ReceiverEngine, StorageFailureWaitsForRetry)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(12, 5, "disk.bin");

    sink.fail = true;
    for (const auto &c : f.chunks)
        rx.on_chunk(c);
    EXPECT_EQ(sink.attempts, 1);
    auto out = rx.take_outcomes();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, OutcomeStatus::StorageFailed);
    EXPECT_EQ(out[0].detail, "disk full");

    // redelivery does not trigger another write on its own
    EXPECT_EQ(rx.on_chunk(f.chunks[1]), IngestResult::Duplicate);
    EXPECT_EQ(sink.attempts, 1);
    EXPECT_EQ(rx.retry_finalize(), 0u);
    EXPECT_EQ(sink.attempts, 2);

    sink.fail = false;
    EXPECT_EQ(rx.retry_finalize(), 1u);
    EXPECT_EQ(sink.files["disk.bin"], gen_bytes(12));
    out = rx.take_outcomes();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].status, OutcomeStatus::StorageFailed);
    EXPECT_EQ(out[1].status, OutcomeStatus::Finalized);
    EXPECT_EQ(rx.stats().storage_failures, 2u);
    EXPECT_EQ(rx.retry_finalize(), 0u);
}

TEST(ReceiverEngine, SizeMismatchAbandonsAndCancels)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    const FileId   id = FileId::generate();

    proto::FileHeader h;
    h.file_name   = "liar.bin";
    h.file_size   = 10;
    h.chunk_count = 2;
    rx.on_chunk(proto::make_header_chunk(id, h));
    for (std::uint32_t i = 0; i < 2; ++i)
    {
        Chunk c;
        c.file_id = id;
        c.index   = i;
        c.payload = {1, 2, 3};
        rx.on_chunk(c);
    }

    EXPECT_TRUE(sink.files.empty());
    auto ev = rx.drain_control();
    ASSERT_EQ(ev.size(), 4u);
    EXPECT_EQ(ev.back(), ControlEvent::cancel(id));
    auto out = rx.take_outcomes();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, OutcomeStatus::Abandoned);
    EXPECT_EQ(rx.stats().abandoned, 1u);

    // late chunks re-announce the cancel
    Chunk late;
    late.file_id = id;
    late.index   = 0;
    late.payload = {1, 2, 3};
    EXPECT_EQ(rx.on_chunk(late), IngestResult::Ignored);
    EXPECT_EQ(rx.drain_control(), std::vector<ControlEvent>{ControlEvent::cancel(id)});
}

TEST(ReceiverEngine, ExplicitAbandon)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);
    auto           f = make_file(20, 4, "drop.bin");
    rx.on_chunk(f.chunks[0]);
    rx.on_chunk(f.chunks[1]);
    (void)rx.drain_control();

    EXPECT_TRUE(rx.abandon(f.id, "operator request"));
    EXPECT_FALSE(rx.abandon(f.id, "again"));
    EXPECT_FALSE(rx.abandon(FileId::generate(), "unknown"));
    EXPECT_EQ(rx.drain_control(), std::vector<ControlEvent>{ControlEvent::cancel(f.id)});
    EXPECT_EQ(rx.store().buffered_bytes(), 0u);
}

TEST(ReceiverEngine, UnsafeNamesAreReduced)
{
    MemorySink     sink;
    ReceiverEngine rx(sink);

    auto evil = make_file(3, 4, "../../etc/passwd");
    for (const auto &c : evil.chunks)
        rx.on_chunk(c);
    EXPECT_EQ(sink.files.count("passwd"), 1u);

    auto dots = make_file(3, 4, "..");
    for (const auto &c : dots.chunks)
        rx.on_chunk(c);
    EXPECT_EQ(sink.files.count(dots.id.to_string()), 1u);

    EXPECT_EQ(safe_file_name("dir\\win.txt"), "win.txt");
    EXPECT_EQ(safe_file_name("plain"), "plain");
    EXPECT_EQ(safe_file_name("a/."), "");
}

TEST(ReceiverEngine, PendingBatchDedupPolicy)
{
    MemorySink     sink;
    ReceiverConfig cfg;
    cfg.dedup = DedupPolicy::PendingBatch;
    ReceiverEngine rx(sink, cfg);
    auto           f = make_file(8, 4, "d");

    rx.on_chunk(f.chunks[1]);
    rx.on_chunk(f.chunks[1]);
    rx.on_chunk(f.chunks[1]);
    EXPECT_EQ(rx.drain_control().size(), 1u);
    rx.on_chunk(f.chunks[1]);
    EXPECT_EQ(rx.drain_control().size(), 1u);
}

TEST(ReceiverEngine, ForgetFinalizedDropsRecord)
{
    MemorySink     sink;
    ReceiverConfig cfg;
    cfg.forget_finalized = true;
    ReceiverEngine rx(sink, cfg);
    auto           f = make_file(8, 4, "gone");
    for (const auto &c : f.chunks)
        rx.on_chunk(c);
    EXPECT_EQ(sink.attempts, 1);
    EXPECT_EQ(rx.store().find(f.id), nullptr);
    EXPECT_EQ(rx.store().size(), 0u);
    EXPECT_EQ(rx.take_outcomes().size(), 1u);
    rx.drain_control();

    // the sender re-offers everything while its acks are in flight
    for (const auto &c : f.chunks)
        EXPECT_EQ(rx.on_chunk(c), IngestResult::Duplicate);
    // a partial redelivery alone
    EXPECT_EQ(rx.on_rx(proto::serialize(f.chunks[1])), IngestResult::Duplicate);

    EXPECT_EQ(sink.attempts, 1);
    EXPECT_TRUE(rx.take_outcomes().empty());
    EXPECT_EQ(rx.stats().finalized, 1u);
    EXPECT_EQ(rx.store().size(), 0u);
    EXPECT_EQ(rx.store().buffered_bytes(), 0u);
    // still acked, so the sender can retire them
    EXPECT_EQ(rx.drain_control().size(), f.chunks.size() + 1);
}
