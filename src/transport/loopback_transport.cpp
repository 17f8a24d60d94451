#include <utility>

#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a lossless link to exercise sender -> receiver without a channel model.
bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    on_rx_     = std::move(on_rx);
    max_frame_ = s.max_frame;
    sent_      = 0;
    started_   = true;
    return true;
}

bool LoopbackTransport::send(const Frame &frame)
{
    if (!started_ || !on_rx_)
        return false;
    if (max_frame_ != 0 && frame.size() > max_frame_)
    {
        LOG_WARN("loopback: frame of %zu bytes exceeds limit %zu", frame.size(), max_frame_);
        return false;
    }
    ++sent_;
    on_rx_(frame);
    return true;
}

void LoopbackTransport::stop()
{
    started_ = false;
    on_rx_   = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    return started_;
}

}  // namespace transport
