#pragma once

#include "zeroconf_cpp/constants.hpp"
#include "zeroconf_cpp/listeners.hpp"
#include "zeroconf_cpp/types.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zeroconf_cpp
{

class Zeroconf;

// TXT key/value pairs. A key without a value is a boolean attribute.
using Properties = std::map<std::string, std::optional<std::string>>;

struct ServiceInfoSettings
{
    std::string type{"_http._tcp.local."};
    std::string name; // example: "My Service._http._tcp.local."
    std::vector<Address> addresses;
    std::uint16_t port{0};
    std::uint16_t weight{0};
    std::uint16_t priority{0};
    Properties properties;
    std::string server; // example: "myhost.local."
    std::uint32_t host_ttl{kDnsHostTtl};
    std::uint32_t other_ttl{kDnsOtherTtl};
};

// A service instance, either published by us or resolved from the network.
// Shared through std::shared_ptr; all accessors are thread safe since the
// receive thread updates resolving instances.
class ServiceInfo : public RecordUpdateListener
{
public:
    // Throws BadTypeInNameError when name is not an instance of type
    explicit ServiceInfo(ServiceInfoSettings settings);
    ServiceInfo(std::string type, std::string name);

    ServiceInfo(const ServiceInfo&) = delete;
    ServiceInfo& operator=(const ServiceInfo&) = delete;

    std::string Type() const;
    std::string Name() const;
    std::string Key() const; // Lower-cased name
    // Name without the service type, example: "My Service"
    std::string InstanceName() const;
    std::string Server() const;
    std::string ServerKey() const;
    std::uint16_t Port() const;
    std::uint16_t Weight() const;
    std::uint16_t Priority() const;
    std::uint32_t HostTtl() const;
    std::uint32_t OtherTtl() const;
    std::vector<Address> Addresses() const;
    std::vector<std::string> ParsedAddresses() const;
    bool HasIpv6Address() const;
    Properties GetProperties() const;
    // Encoded TXT record data
    std::string Text() const;

    void SetName(std::string name);
    void SetServer(std::string server);
    void SetPort(std::uint16_t port);
    void SetAddresses(std::vector<Address> addresses);
    void SetProperties(const Properties& properties);
    void SetText(std::string text);
    void SetTtls(std::uint32_t host_ttl, std::uint32_t other_ttl);

    Record DnsPointer(std::optional<std::uint32_t> ttl = std::nullopt) const;
    Record DnsService(std::optional<std::uint32_t> ttl = std::nullopt) const;
    Record DnsText(std::optional<std::uint32_t> ttl = std::nullopt) const;
    std::vector<Record> DnsAddresses(std::optional<std::uint32_t> ttl = std::nullopt) const;

    // Server, port, TXT and at least one address are known
    bool Resolved() const;

    // Fills in what the cache of zc knows. Returns Resolved().
    bool LoadFromCache(Zeroconf& zc);

    // Resolves through the cache, then queries the network at doubling
    // intervals until resolved or timeout passes. Returns Resolved().
    bool Request(Zeroconf& zc, std::chrono::milliseconds timeout);

    void UpdateRecord(Zeroconf& zc, TimePoint now, const Record& record) override;

private:
    void ApplyRecordLocked(Zeroconf& zc, TimePoint now, const Record& record);
    bool ResolvedLocked() const;

    mutable std::mutex m_mutex;
    std::string m_type;
    std::string m_name;
    std::vector<Address> m_addresses;
    std::uint16_t m_port{0};
    std::uint16_t m_weight{0};
    std::uint16_t m_priority{0};
    std::string m_server;
    std::optional<std::string> m_text;
    std::uint32_t m_hostTtl{kDnsHostTtl};
    std::uint32_t m_otherTtl{kDnsOtherTtl};
};

// Validates a service type or instance name and returns the bare service
// type, example: "_http._tcp.local.". Non strict mode accepts any name ending
// in ".local." and underscores in the service label. Throws BadTypeInNameError.
std::string ServiceTypeName(const std::string& type_name, bool strict = true);

std::string EncodeProperties(const Properties& properties);
Properties DecodeProperties(const std::string& text);

}
