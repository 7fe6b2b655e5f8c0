#include "zeroconf_cpp/types.hpp"
#include "string_utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <array>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>


namespace zeroconf_cpp
{

std::string ToString(RecordType type)
{
    switch (type) {
        case RecordType::A: return "a";
        case RecordType::CNAME: return "cname";
        case RecordType::PTR: return "ptr";
        case RecordType::HINFO: return "hinfo";
        case RecordType::TXT: return "txt";
        case RecordType::AAAA: return "quada";
        case RecordType::SRV: return "srv";
        case RecordType::NSEC: return "nsec";
        case RecordType::ANY: return "any";
    }
    return "";
}

std::string TypeToString(std::uint16_t type)
{
    auto str = ToString(static_cast<RecordType>(type));
    if (str.empty()) {
        return fmt::format("?({})", type);
    }
    return str;
}

static std::string ClassToString(std::uint16_t rclass)
{
    switch (rclass) {
        case kClassIn: return "in";
        case kClassAny: return "any";
    }
    return fmt::format("?({})", rclass);
}

bool operator==(const Question& lhs, const Question& rhs)
{
    return EqualsIgnoreCase(lhs.name, rhs.name)
        && lhs.type == rhs.type
        && lhs.rclass == rhs.rclass;
}

std::ostream& operator<<(std::ostream& os, const Question& question)
{
    os << fmt::format("question[{},{}{},{}]", TypeToString(question.type), ClassToString(question.rclass),
                      question.unicast_response ? "-QU" : "", question.name);
    return os;
}

static bool HeaderEquals(const RecordHeader& lhs, const RecordHeader& rhs)
{
    return lhs.type == rhs.type
        && lhs.rclass == rhs.rclass
        && EqualsIgnoreCase(lhs.name, rhs.name);
}

std::ostream& operator<<(std::ostream& os, const RecordHeader& header)
{
    os << fmt::format("{},{}{},{}", TypeToString(header.type), ClassToString(header.rclass),
                      header.unique ? "-unique" : "", header.name);
    return os;
}

bool operator==(const AddressRecord& lhs, const AddressRecord& rhs)
{
    return HeaderEquals(lhs.header, rhs.header)
        && lhs.address == rhs.address;
}

std::ostream& operator<<(std::ostream& os, const AddressRecord& record)
{
    os << fmt::format("record[{}]={},{}", fmt::streamed(record.header), record.header.ttl,
                      AddressToString(record.address));
    return os;
}

bool operator==(const PointerRecord& lhs, const PointerRecord& rhs)
{
    return HeaderEquals(lhs.header, rhs.header)
        && EqualsIgnoreCase(lhs.alias, rhs.alias);
}

std::ostream& operator<<(std::ostream& os, const PointerRecord& record)
{
    os << fmt::format("record[{}]={},{}", fmt::streamed(record.header), record.header.ttl, record.alias);
    return os;
}

bool operator==(const TextRecord& lhs, const TextRecord& rhs)
{
    return HeaderEquals(lhs.header, rhs.header)
        && lhs.text == rhs.text;
}

std::ostream& operator<<(std::ostream& os, const TextRecord& record)
{
    // Only a prefix of the raw payload, it can be arbitrarily long
    constexpr std::size_t kPreview = 10;
    if (record.text.size() > kPreview) {
        os << fmt::format("record[{}]={},{}...", fmt::streamed(record.header), record.header.ttl,
                          record.text.substr(0, kPreview));
    }
    else {
        os << fmt::format("record[{}]={},{}", fmt::streamed(record.header), record.header.ttl, record.text);
    }
    return os;
}

bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs)
{
    return HeaderEquals(lhs.header, rhs.header)
        && lhs.priority == rhs.priority
        && lhs.weight == rhs.weight
        && lhs.port == rhs.port
        && EqualsIgnoreCase(lhs.server, rhs.server);
}

std::ostream& operator<<(std::ostream& os, const ServiceRecord& record)
{
    os << fmt::format("record[{}]={},{}:{} priority {} weight {}", fmt::streamed(record.header),
                      record.header.ttl, record.server, record.port, record.priority, record.weight);
    return os;
}

bool operator==(const HostInfoRecord& lhs, const HostInfoRecord& rhs)
{
    return HeaderEquals(lhs.header, rhs.header)
        && lhs.cpu == rhs.cpu
        && lhs.os == rhs.os;
}

std::ostream& operator<<(std::ostream& os, const HostInfoRecord& record)
{
    os << fmt::format("record[{}]={},{} {}", fmt::streamed(record.header), record.header.ttl, record.cpu, record.os);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Record& record)
{
    std::visit([&os](const auto& rec){
        os << rec;
    }, record);
    return os;
}

const RecordHeader& GetHeader(const Record& record)
{
    return std::visit([](const auto& rec) -> const RecordHeader& {
        return rec.header;
    }, record);
}

RecordHeader& GetHeader(Record& record)
{
    return std::visit([](auto& rec) -> RecordHeader& {
        return rec.header;
    }, record);
}

bool SameEntry(const RecordHeader& lhs, const RecordHeader& rhs)
{
    return HeaderEquals(lhs, rhs);
}

TimePoint ExpirationTime(const RecordHeader& header, unsigned percent)
{
    const auto lifetime = std::chrono::milliseconds(static_cast<std::int64_t>(header.ttl) * 10 * percent);
    return header.created + lifetime;
}

bool IsExpired(const RecordHeader& header, TimePoint now)
{
    return ExpirationTime(header, 100) <= now;
}

bool IsStale(const RecordHeader& header, TimePoint now)
{
    return ExpirationTime(header, 50) <= now;
}

std::uint32_t RemainingTtl(const RecordHeader& header, TimePoint now)
{
    const auto expires = ExpirationTime(header, 100);
    if (expires <= now) {
        return 0;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(expires - now).count();
    return static_cast<std::uint32_t>(std::max<std::int64_t>(0, remaining));
}

void ResetTtl(RecordHeader& header, const RecordHeader& other)
{
    header.created = other.created;
    header.ttl = other.ttl;
}

bool AnsweredBy(const Question& question, const Record& record)
{
    const auto& header = GetHeader(record);
    return (question.rclass == header.rclass || question.rclass == kClassAny)
        && (question.type == header.type || question.type == kTypeAny)
        && EqualsIgnoreCase(question.name, header.name);
}

static RecordHeader MakeHeader(std::string name, std::uint16_t type, std::uint32_t ttl, bool unique)
{
    RecordHeader header;
    header.name = std::move(name);
    header.type = type;
    header.rclass = kClassIn;
    header.unique = unique;
    header.ttl = ttl;
    header.created = Clock::now();
    return header;
}

Record MakeAddressRecord(std::string name, std::uint32_t ttl, Address address, bool unique)
{
    const std::uint16_t type = address.size() == 16 ? kTypeAaaa : kTypeA;
    return AddressRecord{MakeHeader(std::move(name), type, ttl, unique), std::move(address)};
}

Record MakePointerRecord(std::string name, std::uint32_t ttl, std::string alias)
{
    return PointerRecord{MakeHeader(std::move(name), kTypePtr, ttl, false), std::move(alias)};
}

Record MakeTextRecord(std::string name, std::uint32_t ttl, std::string text, bool unique)
{
    return TextRecord{MakeHeader(std::move(name), kTypeTxt, ttl, unique), std::move(text)};
}

Record MakeServiceRecord(std::string name, std::uint32_t ttl, std::uint16_t priority,
                         std::uint16_t weight, std::uint16_t port, std::string server,
                         bool unique)
{
    ServiceRecord record;
    record.header = MakeHeader(std::move(name), kTypeSrv, ttl, unique);
    record.priority = priority;
    record.weight = weight;
    record.port = port;
    record.server = std::move(server);
    return record;
}

std::string AddressToString(const Address& address)
{
    std::array<char, INET6_ADDRSTRLEN> buffer{};
    if (address.size() == 4) {
        if (inet_ntop(AF_INET, address.data(), buffer.data(), buffer.size()) != nullptr) {
            return std::string(buffer.data());
        }
    }
    else if (address.size() == 16) {
        if (inet_ntop(AF_INET6, address.data(), buffer.data(), buffer.size()) != nullptr) {
            return std::string(buffer.data());
        }
    }
    return fmt::format("<invalid address of {} bytes>", address.size());
}

std::optional<Address> ParseAddress(std::string_view text)
{
    const std::string str(text);
    Address address(16);
    if (inet_pton(AF_INET, str.c_str(), address.data()) == 1) {
        address.resize(4);
        return address;
    }
    if (inet_pton(AF_INET6, str.c_str(), address.data()) == 1) {
        return address;
    }
    return std::nullopt;
}

}
