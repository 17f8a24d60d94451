#pragma once
#include <cstddef>
#include <string>

#include "transport/itransport.hpp"

namespace transport
{

// Perfect in-process link: send() delivers synchronously to the receive callback,
// so a session over two loopbacks runs to completion without pumping.
class LoopbackTransport final : public ITransport
{
  public:
    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &frame) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

    // Frames delivered since start()
    std::size_t sent() const { return sent_; }

  private:
    OnFrame     on_rx_{};
    std::size_t max_frame_{0};
    std::size_t sent_{0};
    bool        started_{false};
};

}  // namespace transport
