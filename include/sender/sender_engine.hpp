#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "proto/wire.hpp"
#include "sender/chunk_source.hpp"

namespace sender
{

enum class FileState
{
    Queued,        // waiting for a rotation slot
    InFlight,      // chunks are being offered
    Acknowledged,  // every chunk was acked, file retired
};

const char *state_name(FileState s);

struct SenderConfig
{
    std::size_t max_in_flight = 0;    // files offered at once, 0 = unlimited
    std::size_t recent_acked  = 256;  // retired ids state() still reports
};

using OnAcknowledged = std::function<void(const proto::FileId &, const std::string &name)>;

// Streams the unacknowledged chunks of every in-flight file, round-robin across
// files and cyclically within a file. There is no retransmission timer: a chunk
// keeps being offered until its ack arrives. All public members are thread-safe.
class SenderEngine
{
  public:
    explicit SenderEngine(SenderConfig cfg = {});

    // Fires once per file when its last chunk is acked (outside the engine lock)
    void set_on_acknowledged(OnAcknowledged cb);

    bool enqueue(OutgoingFile f);
    bool cancel(const proto::FileId &id);

    // Up to n chunks, never blocks; empty when nothing is in flight
    std::vector<proto::Chunk> next_batch(std::size_t n);
    // Unknown files and repeated acks are ignored
    void ingest(const proto::ControlEvent &ev);

    std::optional<FileState> state(const proto::FileId &id) const;
    std::size_t              in_flight_count() const;
    std::size_t              queued_count() const;
    std::size_t              unacked_count(const proto::FileId &id) const;
    bool                     idle() const;
    std::size_t              recent_acked_count() const;

  private:
    struct FileSlot
    {
        OutgoingFile      file;
        std::vector<bool> acked;  // by position: 0 = header, 1 + i = data i
        std::size_t       remaining = 0;
        std::size_t       cursor    = 0;
        FileState         state     = FileState::Queued;
    };

    static std::optional<std::size_t> position_of(const FileSlot &s, std::uint32_t index);

    void remove_from_rotation_locked(const proto::FileId &id);
    void promote_locked();
    void admit_locked(const proto::FileId &id, FileSlot &slot);
    void remember_acked_locked(const proto::FileId &id);

    SenderConfig                                      cfg_;
    mutable std::mutex                                mu_;
    std::unordered_map<proto::FileId, FileSlot>       files_;
    std::vector<proto::FileId>                        rotation_;  // InFlight, offer order
    std::size_t                                       rr_ = 0;    // next rotation slot
    std::deque<proto::FileId>                         queued_;
    std::unordered_set<proto::FileId>                 acknowledged_;  // last recent_acked retired
    std::deque<proto::FileId>                         acked_order_;   // oldest first
    OnAcknowledged                                    on_acked_;
};

}  // namespace sender
