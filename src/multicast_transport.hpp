#pragma once

#include "zeroconf_cpp/transport.hpp"

#include <atomic>
#include <shared_mutex>
#include <string>
#include <vector>

namespace zeroconf_cpp
{

// UDP transport on the mDNS group. One socket per address family is bound to
// the wildcard address on port 5353 and receives the multicast traffic. One
// more socket per interface address, also on port 5353, selects the outgoing
// interface for multicast sends and receives unicast replies.
class MulticastTransport : public Transport
{
public:
	// Throws Error when no socket could be opened
	MulticastTransport(const std::vector<std::string>& interfaces, IpVersion ip_version);
	~MulticastTransport() override;

	void Send(const std::vector<std::uint8_t>& packet, const std::optional<Endpoint>& to) override;
	bool Receive(std::chrono::milliseconds timeout, const DatagramHandler& handler) override;
	void Close() override;

private:
	struct Socket
	{
		int fd;
		int family;
		bool wildcard;
	};

	void OpenSockets(const std::vector<std::string>& interfaces, IpVersion ip_version);
	int UnicastSocketLocked(int family) const;

	mutable std::shared_mutex m_mutex;
	std::vector<Socket> m_sockets;
	std::atomic<bool> m_closed{false};
	std::vector<std::uint8_t> m_buffer;
};

}
