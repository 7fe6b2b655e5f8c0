#pragma once

#include "zeroconf_cpp/service_info.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace zeroconf_cpp
{

// Services published by this host, at most one per fully qualified name.
// Name, type and server lookups are case insensitive.
class ServiceRegistry
{
public:
    using InfoPtr = std::shared_ptr<ServiceInfo>;

    ServiceRegistry() = default;
    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    // Throws ServiceNameAlreadyRegisteredError when another instance holds the
    // name. Adding the instance that is already registered does nothing.
    void Add(const InfoPtr& info);
    // Removes whatever is registered under the name of info
    void Remove(const InfoPtr& info);
    void Update(const InfoPtr& info);

    std::vector<InfoPtr> GetServiceInfos() const;
    // nullptr when nothing is registered under name
    InfoPtr GetInfoName(const std::string& name) const;
    std::vector<std::string> GetTypes() const;
    std::vector<InfoPtr> GetInfosType(const std::string& type) const;
    std::vector<InfoPtr> GetInfosServer(const std::string& server) const;

private:
    // Registered copies of the index keys, info may be renamed afterwards
    struct Entry {
        InfoPtr info;
        std::string type;
        std::string server;
    };

    void AddLocked(const InfoPtr& info);
    void RemoveLocked(const std::string& key);
    std::vector<InfoPtr> Lookup(const std::map<std::string, std::vector<std::string>>& index,
                                const std::string& key) const;

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_services;
    std::map<std::string, std::vector<std::string>> m_types;
    std::map<std::string, std::vector<std::string>> m_servers;
};

}
