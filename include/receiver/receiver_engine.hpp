#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "proto/wire.hpp"
#include "receiver/control_queue.hpp"
#include "receiver/file_sink.hpp"
#include "receiver/reassembly_store.hpp"
#include "transport/itransport.hpp"

namespace receiver
{

struct ReceiverConfig
{
    DedupPolicy dedup            = DedupPolicy::None;
    bool        forget_finalized = false;  // keep only the id of a finalized file, not its record
};

enum class IngestResult
{
    Accepted,   // new chunk stored and acked
    Duplicate,  // already had it, acked again
    Malformed,  // failed to decode, discarded
    Violation,  // well-formed but inconsistent with what we know, ignored
    Ignored,    // not for us (control packet, abandoned file)
};

const char *result_name(IngestResult r);

enum class OutcomeStatus
{
    Finalized,
    StorageFailed,
    Abandoned,
};

struct FileOutcome
{
    proto::FileId id;
    std::string   name;
    OutcomeStatus status{OutcomeStatus::Finalized};
    std::string   detail;
};

struct ReceiverStats
{
    std::size_t frames           = 0;
    std::size_t accepted         = 0;
    std::size_t duplicates       = 0;
    std::size_t malformed        = 0;
    std::size_t violations       = 0;
    std::size_t ignored          = 0;
    std::size_t finalized        = 0;
    std::size_t storage_failures = 0;
    std::size_t abandoned        = 0;
};

// Receiving half of a session. Owns its reassembly store and ack queue, so dropping
// the engine drops every unfinished transfer and nothing else. on_rx is meant for a
// single thread; the ack queue alone tolerates concurrent producers.
class ReceiverEngine
{
  public:
    explicit ReceiverEngine(IFileSink &sink, ReceiverConfig cfg = {});

    IngestResult on_rx(const transport::Frame &f);
    IngestResult on_chunk(const proto::Chunk &c);

    std::vector<proto::ControlEvent> drain_control() { return queue_.drain(); }
    ControlEventQueue               &control_queue() { return queue_; }

    // Re-attempt every complete file whose write failed; returns how many succeeded
    std::size_t retry_finalize();
    // Give up on a file: buffers dropped, Cancel queued for the sender
    bool abandon(const proto::FileId &id, const std::string &why);

    std::vector<FileOutcome> take_outcomes();
    const ReceiverStats     &stats() const { return stats_; }
    const ReassemblyStore   &store() const { return store_; }

  private:
    void        ack(const proto::FileId &id, std::uint32_t index);
    bool        finalize(const proto::FileId &id);
    std::string output_name(const FileRecord &r) const;

    IFileSink               &sink_;
    ReceiverConfig           cfg_;
    ReassemblyStore          store_;
    ControlEventQueue        queue_;
    std::vector<FileOutcome> outcomes_;
    ReceiverStats            stats_{};
};

}  // namespace receiver
