#include <algorithm>
#include <utility>

#include "receiver/control_queue.hpp"

namespace receiver
{

bool ControlEventQueue::push(const proto::ControlEvent &ev)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (policy_ == DedupPolicy::PendingBatch &&
        std::find(pending_.begin(), pending_.end(), ev) != pending_.end())
        return false;
    pending_.push_back(ev);
    return true;
}

std::vector<proto::ControlEvent> ControlEventQueue::drain()
{
    std::vector<proto::ControlEvent> out;
    std::lock_guard<std::mutex>      lk(mu_);
    out.swap(pending_);
    return out;
}

std::size_t ControlEventQueue::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

}  // namespace receiver
