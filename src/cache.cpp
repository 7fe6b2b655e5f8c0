#include "zeroconf_cpp/cache.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <iterator>

namespace zeroconf_cpp
{

namespace
{

// RFC 6762 section 10.2: records of one announcement burst must not flush each other
constexpr std::chrono::seconds kFlushGrace{1};

}

bool Cache::Add(const Record& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& header = GetHeader(record);
    if (header.ttl == 0) {
        RemoveLocked(record);
        return false;
    }
    if (header.unique) {
        FlushLocked(record);
    }

    auto& bucket = m_entries[ToLower(header.name)];
    auto it = std::find(bucket.begin(), bucket.end(), record);
    if (it != bucket.end()) {
        ResetTtl(GetHeader(*it), header);
        return false;
    }
    bucket.push_back(record);
    return true;
}

std::vector<Record> Cache::Flush(const Record& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return FlushLocked(record);
}

std::vector<Record> Cache::FlushLocked(const Record& record)
{
    std::vector<Record> flushed;
    const auto& header = GetHeader(record);
    if (!header.unique) {
        return flushed;
    }
    auto it = m_entries.find(ToLower(header.name));
    if (it == m_entries.end()) {
        return flushed;
    }

    auto& bucket = it->second;
    auto stale = std::stable_partition(bucket.begin(), bucket.end(), [&](const Record& entry) {
        const auto& entryHeader = GetHeader(entry);
        return !(SameEntry(entryHeader, header)
                 && !(entry == record)
                 && header.created - entryHeader.created > kFlushGrace);
    });
    flushed.assign(stale, bucket.end());
    bucket.erase(stale, bucket.end());
    if (bucket.empty()) {
        m_entries.erase(it);
    }
    return flushed;
}

bool Cache::Remove(const Record& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return RemoveLocked(record);
}

bool Cache::RemoveLocked(const Record& record)
{
    auto it = m_entries.find(ToLower(GetHeader(record).name));
    if (it == m_entries.end()) {
        return false;
    }
    auto& bucket = it->second;
    auto entry = std::find(bucket.begin(), bucket.end(), record);
    if (entry == bucket.end()) {
        return false;
    }
    bucket.erase(entry);
    if (bucket.empty()) {
        m_entries.erase(it);
    }
    return true;
}

std::vector<Record> Cache::Expire(TimePoint now)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Record> expired;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        auto& bucket = it->second;
        auto dead = std::stable_partition(bucket.begin(), bucket.end(), [now](const Record& entry) {
            return !IsExpired(GetHeader(entry), now);
        });
        std::move(dead, bucket.end(), std::back_inserter(expired));
        bucket.erase(dead, bucket.end());
        if (bucket.empty()) {
            it = m_entries.erase(it);
        }
        else {
            ++it;
        }
    }
    return expired;
}

std::optional<Record> Cache::Get(const Record& record) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(ToLower(GetHeader(record).name));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    auto entry = std::find(it->second.begin(), it->second.end(), record);
    if (entry == it->second.end()) {
        return std::nullopt;
    }
    return *entry;
}

std::optional<Record> Cache::GetByDetails(const std::string& name, std::uint16_t type, std::uint16_t rclass,
                                          TimePoint now) const
{
    auto all = GetAllByDetails(name, type, rclass, now);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::vector<Record> Cache::GetAllByDetails(const std::string& name, std::uint16_t type, std::uint16_t rclass,
                                           TimePoint now) const
{
    std::vector<Record> records;
    for (auto& record : EntriesWithName(name, now)) {
        const auto& header = GetHeader(record);
        if (header.type == type && header.rclass == rclass) {
            records.push_back(std::move(record));
        }
    }
    return records;
}

std::optional<Record> Cache::CurrentEntryWithNameAndAlias(const std::string& name, const std::string& alias,
                                                          TimePoint now) const
{
    for (auto& record : EntriesWithName(name, now)) {
        const auto* ptr = std::get_if<PointerRecord>(&record);
        if (ptr != nullptr && ptr->header.type == kTypePtr && EqualsIgnoreCase(ptr->alias, alias)) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<Record> Cache::EntriesWithName(const std::string& name, TimePoint now) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Record> records;
    auto it = m_entries.find(ToLower(name));
    if (it == m_entries.end()) {
        return records;
    }
    for (const auto& record : it->second) {
        if (!IsExpired(GetHeader(record), now)) {
            records.push_back(record);
        }
    }
    return records;
}

std::vector<Record> Cache::Entries() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Record> records;
    for (const auto& [name, bucket] : m_entries) {
        records.insert(records.end(), bucket.begin(), bucket.end());
    }
    return records;
}

std::vector<std::string> Cache::Names() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& [name, bucket] : m_entries) {
        names.push_back(name);
    }
    return names;
}

std::size_t Cache::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t size = 0;
    for (const auto& [name, bucket] : m_entries) {
        size += bucket.size();
    }
    return size;
}

void Cache::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

}
