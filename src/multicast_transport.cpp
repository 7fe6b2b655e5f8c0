#include "multicast_transport.hpp"
#include "socket_utils.hpp"
#include "zeroconf_cpp/constants.hpp"
#include "zeroconf_cpp/exceptions.hpp"

#include "mdns.h"

#include <cerrno>
#include <mutex>
#include <utility>

#include <sys/select.h>

#include "log.hpp"
#include <fmt/format.h>

namespace zeroconf_cpp
{

namespace
{

// Largest UDP payload
constexpr std::size_t kReceiveBufferSize = 65536;

}

MulticastTransport::MulticastTransport(const std::vector<std::string>& interfaces, IpVersion ip_version)
: m_buffer(kReceiveBufferSize)
{
	OpenSockets(interfaces, ip_version);
	const auto num_sockets = m_sockets.size();
	if (num_sockets == 0) {
		Log(LogLevel::Error, "Failed to open any mDNS sockets.");
		throw Error("Failed to open any mDNS sockets.");
	}
	Log(LogLevel::Info, fmt::format("Opened {} socket{} for mDNS.", num_sockets, num_sockets > 1 ? "s" : ""));
}

MulticastTransport::~MulticastTransport()
{
	Close();
}

void MulticastTransport::OpenSockets(const std::vector<std::string>& interfaces, IpVersion ip_version)
{
	const bool useIpv4 = ip_version != IpVersion::V6Only;
	const bool useIpv6 = ip_version != IpVersion::V4Only;
	auto addresses = interfaces.empty() ? ListInterfaceAddresses() : ParseInterfaceAddresses(interfaces);

	if (useIpv4) {
		struct sockaddr_in sock_addr;
		memset(&sock_addr, 0, sizeof(struct sockaddr_in));
		sock_addr.sin_family = AF_INET;
		sock_addr.sin_addr.s_addr = INADDR_ANY;
		sock_addr.sin_port = htons(MDNS_PORT);
#ifdef __APPLE__
		sock_addr.sin_len = sizeof(struct sockaddr_in);
#endif
		int sock = mdns_socket_open_ipv4(&sock_addr);
		if (sock >= 0) {
			m_sockets.push_back(Socket{sock, AF_INET, true});
		} else {
			Log(LogLevel::Warn, fmt::format("Failed to open IPv4 mDNS socket: {}", strerror(errno)));
		}

		for (auto& saddr : addresses.ipv4) {
			saddr.sin_port = htons(MDNS_PORT);
			sock = mdns_socket_open_ipv4(&saddr);
			const auto addr = IPV4AddressToString(&saddr, sizeof(struct sockaddr_in));
			if (sock >= 0) {
				m_sockets.push_back(Socket{sock, AF_INET, false});
				Log(LogLevel::Debug, "Socket opened for interface with local IPv4 address: " + addr);
			} else {
				Log(LogLevel::Warn, fmt::format("Failed to open socket for {}: {}", addr, strerror(errno)));
			}
		}
	}

	if (useIpv6) {
		struct sockaddr_in6 sock_addr;
		memset(&sock_addr, 0, sizeof(struct sockaddr_in6));
		sock_addr.sin6_family = AF_INET6;
		sock_addr.sin6_addr = in6addr_any;
		sock_addr.sin6_port = htons(MDNS_PORT);
#ifdef __APPLE__
		sock_addr.sin6_len = sizeof(struct sockaddr_in6);
#endif
		int sock = mdns_socket_open_ipv6(&sock_addr);
		if (sock >= 0) {
			m_sockets.push_back(Socket{sock, AF_INET6, true});
		} else {
			Log(LogLevel::Warn, fmt::format("Failed to open IPv6 mDNS socket: {}", strerror(errno)));
		}

		for (auto& saddr : addresses.ipv6) {
			saddr.sin6_port = htons(MDNS_PORT);
			sock = mdns_socket_open_ipv6(&saddr);
			const auto addr = IPV6AddressToString(&saddr, sizeof(struct sockaddr_in6));
			if (sock >= 0) {
				m_sockets.push_back(Socket{sock, AF_INET6, false});
				Log(LogLevel::Debug, "Socket opened for interface with local IPv6 address: " + addr);
			} else {
				Log(LogLevel::Warn, fmt::format("Failed to open socket for {}: {}", addr, strerror(errno)));
			}
		}
	}
}

int MulticastTransport::UnicastSocketLocked(int family) const
{
	// The wildcard socket answers from port 5353 on whichever interface routes
	for (const auto& socket : m_sockets) {
		if (socket.family == family && socket.wildcard) {
			return socket.fd;
		}
	}
	for (const auto& socket : m_sockets) {
		if (socket.family == family) {
			return socket.fd;
		}
	}
	return -1;
}

void MulticastTransport::Send(const std::vector<std::uint8_t>& packet, const std::optional<Endpoint>& to)
{
	std::shared_lock<std::shared_mutex> lock(m_mutex);
	if (m_closed.load(std::memory_order_acquire)) {
		throw Error("Send on closed transport");
	}

	if (to) {
		sockaddr_storage addr;
		const auto addrlen = FromEndpoint(*to, addr);
		if (addrlen == 0) {
			throw Error(fmt::format("Invalid destination address {}", to->address));
		}
		const int sock = UnicastSocketLocked(addr.ss_family);
		if (sock < 0) {
			throw Error(fmt::format("No socket for destination {}", to->address));
		}
		if (mdns_unicast_send(sock, &addr, addrlen, packet.data(), packet.size()) != 0) {
			throw Error(fmt::format("Failed to send to {}:{}: {}", to->address, to->port, strerror(errno)));
		}
		return;
	}

	// Interface sockets pick the outgoing interface. A family without any
	// falls back to its wildcard socket and the default route.
	bool hasInterfaceV4 = false;
	bool hasInterfaceV6 = false;
	for (const auto& socket : m_sockets) {
		if (!socket.wildcard) {
			(socket.family == AF_INET ? hasInterfaceV4 : hasInterfaceV6) = true;
		}
	}

	int failures = 0;
	int lastError = 0;
	for (const auto& socket : m_sockets) {
		const bool hasInterface = socket.family == AF_INET ? hasInterfaceV4 : hasInterfaceV6;
		if (socket.wildcard == hasInterface) {
			continue;
		}
		if (mdns_multicast_send(socket.fd, packet.data(), packet.size()) != 0) {
			++failures;
			lastError = errno;
		}
	}
	if (failures > 0) {
		throw Error(fmt::format("Failed to send multicast on {} socket{}: {}", failures, failures > 1 ? "s" : "",
		                        strerror(lastError)));
	}
}

bool MulticastTransport::Receive(std::chrono::milliseconds timeout, const DatagramHandler& handler)
{
	std::vector<std::pair<std::vector<std::uint8_t>, Endpoint>> datagrams;
	{
		std::shared_lock<std::shared_mutex> lock(m_mutex);
		if (m_closed.load(std::memory_order_acquire)) {
			return false;
		}

		struct timeval tv;
		tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
		tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

		int nfds = 0;
		fd_set readfs;
		FD_ZERO(&readfs);
		for (const auto& socket : m_sockets) {
			if (socket.fd >= nfds)
				nfds = socket.fd + 1;
			FD_SET(socket.fd, &readfs);
		}

		const int numberOfReadyDescriptors = select(nfds, &readfs, nullptr, nullptr, &tv);
		if (numberOfReadyDescriptors < 0) {
			if (errno != EINTR) {
				Log(LogLevel::Debug, fmt::format("select() failed: {}", strerror(errno)));
			}
			return !m_closed.load(std::memory_order_acquire);
		}

		for (const auto& socket : m_sockets) {
			if (!FD_ISSET(socket.fd, &readfs)) {
				continue;
			}
			sockaddr_storage from;
			socklen_t fromlen = sizeof(from);
			const auto received = recvfrom(socket.fd, m_buffer.data(), m_buffer.size(), 0,
			                               reinterpret_cast<sockaddr*>(&from), &fromlen);
			if (received < 0) {
				Log(LogLevel::Debug, fmt::format("recvfrom() failed: {}", strerror(errno)));
				continue;
			}
			datagrams.emplace_back(std::vector<std::uint8_t>(m_buffer.begin(), m_buffer.begin() + received),
			                       ToEndpoint(from));
		}
	}

	// Outside the lock, the handler may send
	for (const auto& [data, from] : datagrams) {
		handler(data, from);
	}
	return !m_closed.load(std::memory_order_acquire);
}

void MulticastTransport::Close()
{
	if (m_closed.exchange(true, std::memory_order_acq_rel) == true) {
		return;
	}
	std::unique_lock<std::shared_mutex> lock(m_mutex);
	for (const auto& socket : m_sockets) {
		mdns_socket_close(socket.fd);
	}
	m_sockets.clear();
	Log(LogLevel::Debug, "Closed sockets.");
}

}
