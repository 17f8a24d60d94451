#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

#include "proto/wire.hpp"

namespace receiver
{

enum class DedupPolicy
{
    None,          // every accepted chunk yields an event
    PendingBatch,  // drop an event equal to one already waiting for the next drain
};

// Acks waiting to go uplink. push() may be called from several threads;
// drain() hands the whole batch over in append order and empties the queue.
class ControlEventQueue
{
  public:
    explicit ControlEventQueue(DedupPolicy policy = DedupPolicy::None) : policy_(policy) {}

    // false when the event was dropped by the dedup policy
    bool                             push(const proto::ControlEvent &ev);
    std::vector<proto::ControlEvent> drain();
    std::size_t                      size() const;
    bool                             empty() const { return size() == 0; }

    DedupPolicy policy() const { return policy_; }

  private:
    DedupPolicy                      policy_;
    mutable std::mutex               mu_;
    std::vector<proto::ControlEvent> pending_;
};

}  // namespace receiver
