#pragma once

#include "zeroconf_cpp/cache.hpp"
#include "zeroconf_cpp/constants.hpp"
#include "zeroconf_cpp/incoming_message.hpp"
#include "zeroconf_cpp/listeners.hpp"
#include "zeroconf_cpp/outgoing_message.hpp"
#include "zeroconf_cpp/query_handler.hpp"
#include "zeroconf_cpp/service_info.hpp"
#include "zeroconf_cpp/service_registry.hpp"
#include "zeroconf_cpp/transport.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zeroconf_cpp
{

struct ZeroconfSettings
{
    // Interface addresses to bind, all multicast capable interfaces when empty
    std::vector<std::string> interfaces;
    IpVersion ip_version{IpVersion::V4Only};
    // Replaces the multicast sockets, used by tests
    std::shared_ptr<Transport> transport;

    std::size_t max_packet_size{kMaxMsgTypical};
    std::chrono::milliseconds probe_interval{kCheckTime};
    std::chrono::milliseconds announce_interval{kRegisterTime};
    std::chrono::milliseconds unregister_interval{kUnregisterTime};
    std::chrono::milliseconds cache_cleanup_interval{kCacheCleanupInterval};
    // Zero disables periodic re-announcement
    std::chrono::milliseconds reannounce_interval{std::chrono::seconds(90)};
    std::chrono::milliseconds log_backoff_window{std::chrono::seconds(10)};
    int max_name_changes{1000};
};

// The mDNS engine: owns the transport, the record cache and the registry of
// published services, answers queries and runs the receive and housekeeping
// threads. Close() or destruction sends goodbyes for every published service.
class Zeroconf
{
public:
    using InfoPtr = std::shared_ptr<ServiceInfo>;

    // Throws Error when no socket could be opened
    explicit Zeroconf(ZeroconfSettings settings = ZeroconfSettings());
    ~Zeroconf();

    Zeroconf(const Zeroconf&) = delete;
    Zeroconf& operator=(const Zeroconf&) = delete;

    // Probes for the name of info, then announces it. Blocks for the probe and
    // announce windows. Throws NonUniqueNameError on a conflict unless
    // allow_name_change or cooperating_responders is set, BadTypeInNameError
    // for a malformed name and Error once closed.
    void RegisterService(const InfoPtr& info, std::optional<std::uint32_t> ttl = std::nullopt,
                         bool allow_name_change = false, bool cooperating_responders = false);
    void UnregisterService(const InfoPtr& info);
    void UnregisterAllServices();
    void UpdateService(const InfoPtr& info);

    // nullptr when the service could not be resolved within timeout
    InfoPtr GetServiceInfo(const std::string& type, const std::string& name,
                           std::chrono::milliseconds timeout = std::chrono::seconds(3));

    OutgoingMessage GenerateServiceBroadcast(const ServiceInfo& info, std::optional<std::uint32_t> ttl) const;
    OutgoingMessage GenerateServiceQuery(const ServiceInfo& info) const;

    // Returns true when every packet went out. Never throws for I/O errors.
    bool Send(const OutgoingMessage& out, const std::optional<Endpoint>& destination = std::nullopt);

    // Entry point of the receive loop, exposed for injecting datagrams
    void HandlePacket(const std::vector<std::uint8_t>& data, const Endpoint& from);
    void HandleResponse(const IncomingMessage& msg);
    void HandleQuery(const IncomingMessage& msg, const Endpoint& from);

    void AddNotifyListener(const std::shared_ptr<NotifyListener>& listener);
    void RemoveNotifyListener(const std::shared_ptr<NotifyListener>& listener);
    // Runs the notify listeners on the calling thread, then wakes Wait()ers
    void NotifyAll();
    void Wait(std::chrono::milliseconds timeout);

    // listener must stay alive until removed. Cached records answering
    // question are replayed to it right away.
    void AddListener(RecordUpdateListener* listener, const std::optional<Question>& question);
    void RemoveListener(RecordUpdateListener* listener);
    void UpdateRecord(TimePoint now, const Record& record);

    Cache& GetCache();
    ServiceRegistry& Registry();
    QueryHandler& GetQueryHandler();
    const ZeroconfSettings& Settings() const;

    void Close();
    [[nodiscard]] bool Closed() const;

private:
    class ZeroconfImpl;
    std::unique_ptr<ZeroconfImpl> m_impl;
};

}
