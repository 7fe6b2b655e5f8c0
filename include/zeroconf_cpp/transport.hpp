#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace zeroconf_cpp
{

enum class IpVersion
{
    V4Only,
    V6Only,
    All
};

struct Endpoint
{
    std::string address;
    std::uint16_t port{0};
};

using DatagramHandler = std::function<void(const std::vector<std::uint8_t>& data, const Endpoint& from)>;

// Datagram transport of the engine. Send may be called from several threads
// at once, Receive only from the engine's receive thread.
class Transport
{
public:
    virtual ~Transport() = default;

    // Sends to the mDNS group when to is empty. Throws on failure.
    virtual void Send(const std::vector<std::uint8_t>& packet, const std::optional<Endpoint>& to) = 0;

    // Waits up to timeout for datagrams and passes each to handler. Returns
    // false once the transport is closed.
    virtual bool Receive(std::chrono::milliseconds timeout, const DatagramHandler& handler) = 0;

    virtual void Close() = 0;
};

}
