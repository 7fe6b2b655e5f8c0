#pragma once

#include "zeroconf_cpp/constants.hpp"
#include "zeroconf_cpp/exceptions.hpp"
#include "zeroconf_cpp/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace zeroconf_cpp
{

// In-memory transport: records what the engine sends and, while looping back,
// delivers it to the engine's own receive loop as if it came off the wire
class LoopbackTransport : public Transport
{
public:
    struct Sent
    {
        std::vector<std::uint8_t> packet;
        std::optional<Endpoint> to;
    };

    void Send(const std::vector<std::uint8_t>& packet, const std::optional<Endpoint>& to) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw Error("Send on closed loopback transport");
        }
        if (m_failSends) {
            throw Error("Simulated send failure");
        }
        m_sent.push_back(Sent{packet, to});
        if (m_loopback) {
            m_inbox.emplace_back(packet, Endpoint{"127.0.0.1", kMdnsPort});
        }
        m_condition.notify_all();
    }

    bool Receive(std::chrono::milliseconds timeout, const DatagramHandler& handler) override
    {
        std::vector<std::pair<std::vector<std::uint8_t>, Endpoint>> datagrams;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait_for(lock, timeout, [this](){
                return m_closed || !m_inbox.empty();
            });
            if (m_closed) {
                return false;
            }
            datagrams.swap(m_inbox);
        }
        for (const auto& [data, from] : datagrams) {
            handler(data, from);
        }
        return true;
    }

    void Close() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_condition.notify_all();
    }

    // Queues a datagram for the receive loop
    void Inject(std::vector<std::uint8_t> packet, Endpoint from)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inbox.emplace_back(std::move(packet), std::move(from));
        m_condition.notify_all();
    }

    void SetLoopback(bool loopback)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_loopback = loopback;
    }

    void SetFailSends(bool fail)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failSends = fail;
    }

    std::vector<Sent> SentPackets() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sent;
    }

    void ClearSent()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sent.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::vector<Sent> m_sent;
    std::vector<std::pair<std::vector<std::uint8_t>, Endpoint>> m_inbox;
    bool m_loopback{true};
    bool m_failSends{false};
    bool m_closed{false};
};

}
