#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Frame   = std::vector<std::uint8_t>;
using OnFrame = std::function<void(const Frame &)>;

struct Settings
{
    std::string name;               // label used in logs ("downlink", "uplink")
    std::size_t max_frame = 0;      // 0 = no limit
};

// Best-effort link: frames may be lost, duplicated, reordered or corrupted.
struct ITransport
{
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual bool        send(const Frame &frame)                = 0;
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
