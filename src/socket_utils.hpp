#pragma once

#include "zeroconf_cpp/transport.hpp"

#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/core.h>

namespace zeroconf_cpp
{

inline std::string IPV4AddressToString(const sockaddr_in *addr, size_t addrlen) {
	char host[NI_MAXHOST] = {0};
	char service[NI_MAXSERV] = {0};
	const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
	if (ret == 0) {
		if (addr->sin_port != 0) {
			return fmt::format("{}:{}", host, service);
		} else {
			return fmt::format("{}", host);
		}
	}
	return "";
}

inline std::string IPV6AddressToString(const sockaddr_in6 *addr, size_t addrlen) {
	char host[NI_MAXHOST] = {0};
	char service[NI_MAXSERV] = {0};
	const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
	if (ret == 0) {
		if (addr->sin6_port != 0) {
			return fmt::format("[{}]:{}", host, service);
		} else {
			return fmt::format("{}", host);
		}
	}
	return "";
}

// Numeric host and port of a received datagram's source
inline Endpoint ToEndpoint(const sockaddr_storage& addr) {
	char host[NI_MAXHOST] = {0};
	Endpoint endpoint;
	if (addr.ss_family == AF_INET) {
		const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
		if (inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host)) != nullptr) {
			endpoint.address = host;
		}
		endpoint.port = ntohs(in->sin_port);
	} else if (addr.ss_family == AF_INET6) {
		const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
		if (inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host)) != nullptr) {
			endpoint.address = host;
		}
		endpoint.port = ntohs(in6->sin6_port);
	}
	return endpoint;
}

// Inverse of ToEndpoint, returns the address length or 0 when endpoint does not parse
inline socklen_t FromEndpoint(const Endpoint& endpoint, sockaddr_storage& addr) {
	std::memset(&addr, 0, sizeof(addr));
	auto* in = reinterpret_cast<sockaddr_in*>(&addr);
	if (inet_pton(AF_INET, endpoint.address.c_str(), &in->sin_addr) == 1) {
		in->sin_family = AF_INET;
		in->sin_port = htons(endpoint.port);
		return sizeof(sockaddr_in);
	}
	auto* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
	if (inet_pton(AF_INET6, endpoint.address.c_str(), &in6->sin6_addr) == 1) {
		in6->sin6_family = AF_INET6;
		in6->sin6_port = htons(endpoint.port);
		return sizeof(sockaddr_in6);
	}
	return 0;
}

struct InterfaceAddresses {
	std::vector<sockaddr_in> ipv4;
	std::vector<sockaddr_in6> ipv6;
};

// Local addresses of every interface that is up and multicast capable,
// skipping loopback, point to point and link-local IPv6 addresses
inline InterfaceAddresses ListInterfaceAddresses() {
	InterfaceAddresses addresses;

	struct ifaddrs* ifaddr = nullptr;
	struct ifaddrs* ifa = nullptr;

	if (getifaddrs(&ifaddr) < 0) {
		Log(LogLevel::Warn, "Unable to get interface addresses");
		return addresses;
	}

	for (ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
		if (!ifa->ifa_addr)
			continue;
		if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST))
			continue;
		if ((ifa->ifa_flags & IFF_LOOPBACK) || (ifa->ifa_flags & IFF_POINTOPOINT))
			continue;

		if (ifa->ifa_addr->sa_family == AF_INET) {
			const auto* saddr = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
			if (saddr->sin_addr.s_addr != htonl(INADDR_LOOPBACK)) {
				addresses.ipv4.push_back(*saddr);
			}
		} else if (ifa->ifa_addr->sa_family == AF_INET6) {
			const auto* saddr = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
			// Ignore link-local addresses
			if (saddr->sin6_scope_id)
				continue;
			const unsigned char localhost[] = {0, 0, 0, 0, 0, 0, 0, 0,
			                                   0, 0, 0, 0, 0, 0, 0, 1};
			const unsigned char localhost_mapped[] = {0, 0, 0,    0,    0,    0, 0, 0,
			                                          0, 0, 0xff, 0xff, 0x7f, 0, 0, 1};
			if (memcmp(saddr->sin6_addr.s6_addr, localhost, 16) &&
			    memcmp(saddr->sin6_addr.s6_addr, localhost_mapped, 16)) {
				addresses.ipv6.push_back(*saddr);
			}
		}
	}

	freeifaddrs(ifaddr);
	return addresses;
}

// Interface addresses given as strings, unparsable ones are logged and skipped
inline InterfaceAddresses ParseInterfaceAddresses(const std::vector<std::string>& interfaces) {
	InterfaceAddresses addresses;
	for (const auto& iface : interfaces) {
		sockaddr_storage storage;
		const auto length = FromEndpoint(Endpoint{iface, 0}, storage);
		if (length == sizeof(sockaddr_in)) {
			addresses.ipv4.push_back(*reinterpret_cast<const sockaddr_in*>(&storage));
		} else if (length == sizeof(sockaddr_in6)) {
			addresses.ipv6.push_back(*reinterpret_cast<const sockaddr_in6*>(&storage));
		} else {
			Log(LogLevel::Warn, fmt::format("Ignoring interface {}, not an IP address", iface));
		}
	}
	return addresses;
}

}
