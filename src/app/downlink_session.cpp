#include "app/downlink_session.hpp"
#include "proto/wire.hpp"
#include "util/log.hpp"

namespace app
{

DownlinkSession::DownlinkSession(transport::ITransport    &down,
                                 transport::ITransport    &up,
                                 sender::SenderEngine     &snd,
                                 receiver::ReceiverEngine &rcv)
    : down_(down), up_(up), snd_(snd), rcv_(rcv)
{
}

bool DownlinkSession::start()
{
    // in case we were already running
    stop();

    transport::Settings ds{};
    ds.name      = "downlink";
    ds.max_frame = proto::CHUNK_OVERHEAD + proto::MAX_PAYLOAD;
    if (!down_.start(ds, [this](const transport::Frame &f) { this->on_downlink_rx(f); }))
    {
        LOG_ERROR("start: downlink transport failed to start");
        return false;
    }

    transport::Settings us{};
    us.name      = "uplink";
    us.max_frame = proto::CONTROL_FRAME_SIZE;
    if (!up_.start(us, [this](const transport::Frame &f) { this->on_uplink_rx(f); }))
    {
        LOG_ERROR("start: uplink transport failed to start");
        down_.stop();
        return false;
    }
    started_ = true;
    return true;
}

void DownlinkSession::stop()
{
    if (!started_)
        return;
    down_.stop();
    up_.stop();
    started_ = false;
}

std::size_t DownlinkSession::send_round(std::size_t batch)
{
    std::size_t sent = 0;
    for (const auto &c : snd_.next_batch(batch))
    {
        auto frame = proto::serialize(c);
        if (frame.empty())
        {
            LOG_ERROR("send_round: serialize failed for %s/%u", c.file_id.to_string().c_str(),
                      c.index);
            continue;
        }
        // best-effort link; a refused frame is offered again next lap
        if (!down_.send(frame))
        {
            LOG_WARN("send_round: downlink refused frame");
            continue;
        }
        ++sent;
    }
    return sent;
}

std::size_t DownlinkSession::flush_acks()
{
    if (!rcv_.store().pending_finalize().empty())
    {
        const std::size_t done = rcv_.retry_finalize();
        LOG_INFO("flush_acks: %zu pending file writes succeeded on retry", done);
    }

    std::size_t sent = 0;
    for (const auto &ev : rcv_.drain_control())
    {
        if (up_.send(proto::serialize(ev)))
            ++sent;
        else
            LOG_WARN("flush_acks: uplink refused frame");
    }
    return sent;
}

void DownlinkSession::on_downlink_rx(const transport::Frame &f)
{
    rcv_.on_rx(f);
}

void DownlinkSession::on_uplink_rx(const transport::Frame &f)
{
    proto::DecodeError err;
    auto               ev = proto::parse_control(f, &err);
    if (!ev)
    {
        ++bad_ack_frames_;
        LOG_DEBUG("on_uplink_rx: dropping bad control frame (%s: %s)",
                  proto::field_name(err.field), err.reason.c_str());
        return;
    }
    snd_.ingest(*ev);
}

}  // namespace app
