#include "zeroconf_cpp/service_registry.hpp"
#include "zeroconf_cpp/exceptions.hpp"
#include "string_utils.hpp"

#include <algorithm>

#include "log.hpp"
#include <fmt/format.h>

namespace zeroconf_cpp
{

namespace
{

void EraseKey(std::map<std::string, std::vector<std::string>>& index, const std::string& indexKey,
              const std::string& key)
{
    auto it = index.find(indexKey);
    if (it == index.end()) {
        return;
    }
    auto& keys = it->second;
    keys.erase(std::remove(keys.begin(), keys.end(), key), keys.end());
    if (keys.empty()) {
        index.erase(it);
    }
}

}

void ServiceRegistry::Add(const InfoPtr& info)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    AddLocked(info);
}

void ServiceRegistry::AddLocked(const InfoPtr& info)
{
    const auto key = info->Key();
    auto it = m_services.find(key);
    if (it != m_services.end()) {
        if (it->second.info == info) {
            return;
        }
        Log(LogLevel::Error, fmt::format("Service name already registered: {}", info->Name()));
        throw ServiceNameAlreadyRegisteredError(info->Name());
    }

    Entry entry{info, ToLower(info->Type()), info->ServerKey()};
    m_types[entry.type].push_back(key);
    m_servers[entry.server].push_back(key);
    m_services.emplace(key, std::move(entry));
}

void ServiceRegistry::Remove(const InfoPtr& info)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    RemoveLocked(info->Key());
}

void ServiceRegistry::RemoveLocked(const std::string& key)
{
    auto it = m_services.find(key);
    if (it == m_services.end()) {
        return;
    }
    EraseKey(m_types, it->second.type, key);
    EraseKey(m_servers, it->second.server, key);
    m_services.erase(it);
}

void ServiceRegistry::Update(const InfoPtr& info)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    RemoveLocked(info->Key());
    AddLocked(info);
}

std::vector<ServiceRegistry::InfoPtr> ServiceRegistry::GetServiceInfos() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<InfoPtr> infos;
    infos.reserve(m_services.size());
    for (const auto& [key, entry] : m_services) {
        infos.push_back(entry.info);
    }
    return infos;
}

ServiceRegistry::InfoPtr ServiceRegistry::GetInfoName(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_services.find(ToLower(name));
    if (it == m_services.end()) {
        return nullptr;
    }
    return it->second.info;
}

std::vector<std::string> ServiceRegistry::GetTypes() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> types;
    types.reserve(m_types.size());
    for (const auto& [type, keys] : m_types) {
        types.push_back(type);
    }
    return types;
}

std::vector<ServiceRegistry::InfoPtr> ServiceRegistry::GetInfosType(const std::string& type) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return Lookup(m_types, ToLower(type));
}

std::vector<ServiceRegistry::InfoPtr> ServiceRegistry::GetInfosServer(const std::string& server) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return Lookup(m_servers, ToLower(server));
}

std::vector<ServiceRegistry::InfoPtr> ServiceRegistry::Lookup(
    const std::map<std::string, std::vector<std::string>>& index, const std::string& key) const
{
    std::vector<InfoPtr> infos;
    auto it = index.find(key);
    if (it == index.end()) {
        return infos;
    }
    for (const auto& serviceKey : it->second) {
        infos.push_back(m_services.at(serviceKey).info);
    }
    return infos;
}

}
