#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

struct LossyConfig
{
    unsigned      drop_pct    = 0;  // frame never arrives
    unsigned      dup_pct     = 0;  // frame arrives twice
    unsigned      corrupt_pct = 0;  // one to three bytes flipped
    bool          reorder     = true;
    std::uint32_t seed        = 1;
};

// Channel model for tests and simulation. send() only buffers; pump() delivers
// everything buffered so far, shuffled when `reorder` is set.
class LossyTransport final : public ITransport
{
  public:
    explicit LossyTransport(LossyConfig cfg) : cfg_(cfg), rng_(cfg.seed) {}

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &frame) override;
    void        stop() override;
    std::string name() const override { return label_; }
    bool        link_ready() const override;

    // Returns the number of frames handed to the receive callback
    std::size_t pump();

    struct Counters
    {
        std::size_t sent = 0, dropped = 0, duplicated = 0, corrupted = 0, delivered = 0;
    };
    Counters counters() const;

  private:
    bool roll(unsigned pct);
    void corrupt(Frame &f);

    LossyConfig        cfg_;
    mutable std::mutex mu_;
    std::mt19937       rng_;
    std::vector<Frame> in_flight_;
    OnFrame            on_rx_{};
    std::string        label_ = "lossy";
    std::size_t        max_frame_{0};
    bool               started_{false};
    Counters           counters_{};
};

}  // namespace transport
