#include <algorithm>
#include <utility>

#include "transport/lossy_transport.hpp"
#include "util/log.hpp"

namespace transport
{

bool LossyTransport::start(const Settings &s, OnFrame on_rx)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_rx_     = std::move(on_rx);
    max_frame_ = s.max_frame;
    if (!s.name.empty())
        label_ = s.name;
    started_ = true;
    return true;
}

bool LossyTransport::roll(unsigned pct)
{
    if (pct == 0)
        return false;
    std::uniform_int_distribution<unsigned> d(0, 99);
    return d(rng_) < pct;
}

void LossyTransport::corrupt(Frame &f)
{
    if (f.empty())
        return;
    std::uniform_int_distribution<std::size_t> pos(0, f.size() - 1);
    std::uniform_int_distribution<unsigned>    flips(1, 3);
    std::uniform_int_distribution<unsigned>    bit(0, 7);
    const unsigned                             n = flips(rng_);
    for (unsigned i = 0; i < n; ++i)
        f[pos(rng_)] ^= static_cast<std::uint8_t>(1u << bit(rng_));
}

bool LossyTransport::send(const Frame &frame)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!started_)
        return false;
    if (max_frame_ != 0 && frame.size() > max_frame_)
    {
        LOG_WARN("%s: frame of %zu bytes exceeds limit %zu", label_.c_str(), frame.size(),
                 max_frame_);
        return false;
    }
    ++counters_.sent;
    // best-effort: a dropped frame still counts as sent
    if (roll(cfg_.drop_pct))
    {
        ++counters_.dropped;
        return true;
    }
    const int copies = roll(cfg_.dup_pct) ? 2 : 1;
    if (copies == 2)
        ++counters_.duplicated;
    for (int i = 0; i < copies; ++i)
    {
        Frame f = frame;
        if (roll(cfg_.corrupt_pct))
        {
            corrupt(f);
            ++counters_.corrupted;
        }
        in_flight_.push_back(std::move(f));
    }
    return true;
}

std::size_t LossyTransport::pump()
{
    std::vector<Frame> batch;
    OnFrame            cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_ || !on_rx_)
            return 0;
        batch.swap(in_flight_);
        if (cfg_.reorder)
            std::shuffle(batch.begin(), batch.end(), rng_);
        counters_.delivered += batch.size();
        cb = on_rx_;
    }
    // callback may send on another transport; don't hold our lock across it
    for (const auto &f : batch)
        cb(f);
    return batch.size();
}

void LossyTransport::stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_ = false;
    on_rx_   = nullptr;
    in_flight_.clear();
}

bool LossyTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return started_;
}

LossyTransport::Counters LossyTransport::counters() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return counters_;
}

}  // namespace transport
