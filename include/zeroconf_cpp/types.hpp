#pragma once

#include "zeroconf_cpp/constants.hpp"

#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <vector>
#include <utility>
#include <variant>

namespace zeroconf_cpp
{

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Packed network-order address, 4 bytes for IPv4 and 16 for IPv6
using Address = std::vector<std::uint8_t>;

std::string ToString(RecordType type);
std::string TypeToString(std::uint16_t type);

struct Question {
    std::string name;
    std::uint16_t type{kTypePtr};
    std::uint16_t rclass{kClassIn};
    bool unicast_response{false}; // QU bit, the top bit of the class field
};
bool operator==(const Question& lhs, const Question& rhs);
std::ostream& operator<<(std::ostream& os, const Question& question);

struct RecordHeader {
    std::string name; // example: "_http._tcp.local."
    std::uint16_t type{0};
    std::uint16_t rclass{kClassIn}; // Without the cache-flush bit
    bool unique{false};
    std::uint32_t ttl{0}; // Seconds
    TimePoint created{Clock::now()};
};
std::ostream& operator<<(std::ostream& os, const RecordHeader& header);

// A and AAAA
struct AddressRecord {
    RecordHeader header;

    Address address;
};
bool operator==(const AddressRecord& lhs, const AddressRecord& rhs);
std::ostream& operator<<(std::ostream& os, const AddressRecord& record);

// PTR and CNAME
struct PointerRecord {
    RecordHeader header;

    std::string alias; // examples: "myhost._http._tcp.local."
};
bool operator==(const PointerRecord& lhs, const PointerRecord& rhs);
std::ostream& operator<<(std::ostream& os, const PointerRecord& record);

struct TextRecord {
    RecordHeader header;

    // Raw RDATA, a sequence of length prefixed strings
    std::string text;
};
bool operator==(const TextRecord& lhs, const TextRecord& rhs);
std::ostream& operator<<(std::ostream& os, const TextRecord& record);

struct ServiceRecord {
    RecordHeader header;

    std::uint16_t priority{0};
    std::uint16_t weight{0};
    std::uint16_t port{0};
    std::string server;
};
bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs);
std::ostream& operator<<(std::ostream& os, const ServiceRecord& record);

struct HostInfoRecord {
    RecordHeader header;

    std::string cpu;
    std::string os;
};
bool operator==(const HostInfoRecord& lhs, const HostInfoRecord& rhs);
std::ostream& operator<<(std::ostream& os, const HostInfoRecord& record);

using Record = std::variant<AddressRecord,
                            PointerRecord,
                            TextRecord,
                            ServiceRecord,
                            HostInfoRecord>;
std::ostream& operator<<(std::ostream& os, const Record& record);

const RecordHeader& GetHeader(const Record& record);
RecordHeader& GetHeader(Record& record);

// Name, type and class match; payload is not compared
bool SameEntry(const RecordHeader& lhs, const RecordHeader& rhs);

TimePoint ExpirationTime(const RecordHeader& header, unsigned percent);
bool IsExpired(const RecordHeader& header, TimePoint now);
bool IsStale(const RecordHeader& header, TimePoint now);
std::uint32_t RemainingTtl(const RecordHeader& header, TimePoint now);
// Takes over TTL and creation time of a fresher copy of the same record
void ResetTtl(RecordHeader& header, const RecordHeader& other);

bool AnsweredBy(const Question& question, const Record& record);

Record MakeAddressRecord(std::string name, std::uint32_t ttl, Address address, bool unique = true);
Record MakePointerRecord(std::string name, std::uint32_t ttl, std::string alias);
Record MakeTextRecord(std::string name, std::uint32_t ttl, std::string text, bool unique = true);
Record MakeServiceRecord(std::string name, std::uint32_t ttl, std::uint16_t priority,
                         std::uint16_t weight, std::uint16_t port, std::string server,
                         bool unique = true);

std::string AddressToString(const Address& address);
std::optional<Address> ParseAddress(std::string_view text);

}
