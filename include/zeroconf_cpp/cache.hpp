#pragma once

#include "zeroconf_cpp/types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace zeroconf_cpp
{

// Records learned from the network, keyed by lower-cased name. Lookups by
// details only return records that are still alive at the time of the call.
class Cache
{
public:
    Cache() = default;
    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    // Inserts the record. A unique record first flushes the records of the same
    // name, type and class received more than a second before it. Adding a
    // record that is already held refreshes its TTL. A record with TTL 0 is a
    // goodbye and removes the equal entry instead. Returns true when a new
    // entry was created.
    bool Add(const Record& record);

    // Removes the records a unique record supersedes and returns them
    std::vector<Record> Flush(const Record& record);

    // Returns true when an equal entry was held
    bool Remove(const Record& record);

    // Removes and returns every record expired at now
    std::vector<Record> Expire(TimePoint now = Clock::now());

    // The held entry equal to record, expired or not
    std::optional<Record> Get(const Record& record) const;
    std::optional<Record> GetByDetails(const std::string& name, std::uint16_t type, std::uint16_t rclass,
                                       TimePoint now = Clock::now()) const;
    std::vector<Record> GetAllByDetails(const std::string& name, std::uint16_t type, std::uint16_t rclass,
                                        TimePoint now = Clock::now()) const;
    // Live PTR record mapping name to alias
    std::optional<Record> CurrentEntryWithNameAndAlias(const std::string& name, const std::string& alias,
                                                       TimePoint now = Clock::now()) const;
    std::vector<Record> EntriesWithName(const std::string& name, TimePoint now = Clock::now()) const;

    std::vector<Record> Entries() const;
    std::vector<std::string> Names() const;
    std::size_t Size() const;
    void Clear();

private:
    std::vector<Record> FlushLocked(const Record& record);
    bool RemoveLocked(const Record& record);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<Record>> m_entries;
};

}
