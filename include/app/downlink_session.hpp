#pragma once
#include <cstddef>

#include "receiver/receiver_engine.hpp"
#include "sender/sender_engine.hpp"
#include "transport/itransport.hpp"

namespace app
{

// Both ends of one transfer link in one process: the sender's chunks go out on
// `down`, the receiver's acks come back on `up`. Used by downlink-sim and tests.
class DownlinkSession
{
  public:
    DownlinkSession(transport::ITransport    &down,
                    transport::ITransport    &up,
                    sender::SenderEngine     &snd,
                    receiver::ReceiverEngine &rcv);
    ~DownlinkSession() { stop(); }

    bool start();
    void stop();

    // Pull up to `batch` chunks from the sender and put them on the downlink.
    // Returns how many frames were handed to the transport.
    std::size_t send_round(std::size_t batch);
    // Retry files whose write failed, then put every queued ack on the uplink
    std::size_t flush_acks();

    void on_downlink_rx(const transport::Frame &f);
    void on_uplink_rx(const transport::Frame &f);

    std::size_t bad_ack_frames() const { return bad_ack_frames_; }

  private:
    transport::ITransport    &down_;
    transport::ITransport    &up_;
    sender::SenderEngine     &snd_;
    receiver::ReceiverEngine &rcv_;
    std::size_t               bad_ack_frames_{0};
    bool                      started_{false};
};

}  // namespace app
