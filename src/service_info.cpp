#include "zeroconf_cpp/service_info.hpp"
#include "zeroconf_cpp/exceptions.hpp"
#include "zeroconf_cpp/outgoing_message.hpp"
#include "zeroconf_cpp/zeroconf.hpp"
#include "string_utils.hpp"

#include <algorithm>

#include "log.hpp"
#include <fmt/format.h>

namespace zeroconf_cpp
{

namespace
{

constexpr std::string_view kTcpProtocolLocalTrailer = "._tcp.local.";
constexpr std::string_view kNonTcpProtocolLocalTrailer = "._udp.local.";
constexpr std::string_view kLocalTrailer = ".local.";
constexpr std::size_t kMaxServiceLabelLength = 15;
constexpr std::size_t kMaxTypeNameLength = 256;

bool IsAsciiLetter(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool IsAsciiDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool HasControlCharacter(std::string_view str)
{
    return std::any_of(str.begin(), str.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc <= 0x1F || uc == 0x7F;
    });
}

std::vector<std::string> SplitDots(std::string_view str)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto dot = str.find('.', start);
        if (dot == std::string_view::npos) {
            parts.emplace_back(str.substr(start));
            return parts;
        }
        parts.emplace_back(str.substr(start, dot - start));
        start = dot + 1;
    }
}

// Keeps a record listener registered for the lifetime of the scope
class ScopedListener
{
public:
    ScopedListener(Zeroconf& zc, RecordUpdateListener* listener, const Question& question)
    : m_zc(zc)
    , m_listener(listener)
    {
        m_zc.AddListener(m_listener, question);
    }

    ~ScopedListener()
    {
        m_zc.RemoveListener(m_listener);
    }

    ScopedListener(const ScopedListener&) = delete;
    ScopedListener& operator=(const ScopedListener&) = delete;

private:
    Zeroconf& m_zc;
    RecordUpdateListener* m_listener;
};

[[noreturn]] void BadType(const std::string& what)
{
    Log(LogLevel::Error, what);
    throw BadTypeInNameError(what);
}

}

std::string ServiceTypeName(const std::string& type_name, bool strict)
{
    if (type_name.size() > kMaxTypeNameLength) {
        BadType(fmt::format("Full name ({}) must be <= {} bytes", type_name, kMaxTypeNameLength));
    }

    std::vector<std::string> remaining;
    std::string trailer;
    bool hasProtocol = false;
    if (EndsWith(type_name, kTcpProtocolLocalTrailer) || EndsWith(type_name, kNonTcpProtocolLocalTrailer)) {
        const auto split = type_name.size() - kTcpProtocolLocalTrailer.size();
        remaining = SplitDots(std::string_view(type_name).substr(0, split));
        trailer = type_name.substr(split);
        hasProtocol = true;
    }
    else if (strict) {
        BadType(fmt::format("Type '{}' must end with '{}' or '{}'", type_name, kTcpProtocolLocalTrailer,
                            kNonTcpProtocolLocalTrailer));
    }
    else if (EndsWith(type_name, kLocalTrailer)) {
        const auto split = type_name.size() - kLocalTrailer.size();
        remaining = SplitDots(std::string_view(type_name).substr(0, split));
        trailer = type_name.substr(split + 1);
    }
    else {
        BadType(fmt::format("Type must end with '{}'", kLocalTrailer));
    }

    std::string serviceName;
    if (strict || hasProtocol) {
        serviceName = remaining.back();
        remaining.pop_back();
        if (serviceName.empty()) {
            BadType("No Service name found");
        }
        if (remaining.size() == 1 && remaining.front().empty()) {
            BadType(fmt::format("Type '{}' must not start with '.'", type_name));
        }
        if (serviceName.front() != '_') {
            BadType(fmt::format("Service name ({}) must start with '_'", serviceName));
        }

        if (serviceName.size() > kMaxLabelLength) {
            BadType(fmt::format("Service name ({}) must be <= {} bytes", serviceName, kMaxLabelLength));
        }
        const std::string_view label = std::string_view(serviceName).substr(1);
        if (strict && label.size() > kMaxServiceLabelLength) {
            BadType(fmt::format("Service name ({}) must be <= {} bytes", label, kMaxServiceLabelLength));
        }
        if (label.find("--") != std::string_view::npos) {
            BadType(fmt::format("Service name ({}) must not contain '--'", label));
        }
        if (std::none_of(label.begin(), label.end(), IsAsciiLetter)) {
            BadType(fmt::format("Service name ({}) must contain at least one letter (eg: 'A-Z')", label));
        }
        if (label.front() == '-' || label.back() == '-') {
            BadType(fmt::format("Service name ({}) may not start or end with '-'", label));
        }
        const bool allowed = std::all_of(label.begin(), label.end(), [strict](char c) {
            return IsAsciiLetter(c) || IsAsciiDigit(c) || c == '-' || (!strict && c == '_');
        });
        if (!allowed) {
            BadType(fmt::format("Service name ({}) must contain only these characters: "
                                "A-Z, a-z, 0-9, hyphen ('-'){}", label, strict ? "" : ", underscore ('_')"));
        }
    }

    if (!remaining.empty() && remaining.back() == "_sub") {
        remaining.pop_back();
        if (remaining.empty() || remaining.front().empty()) {
            BadType("_sub requires a subtype name");
        }
    }

    if (!remaining.empty()) {
        std::string instance = remaining.front();
        for (std::size_t i = 1; i < remaining.size(); ++i) {
            instance += "." + remaining[i];
        }
        if (instance.size() > kMaxLabelLength) {
            BadType(fmt::format("Too long: '{}'", instance));
        }
        if (HasControlCharacter(instance)) {
            BadType(fmt::format("Ascii control character 0x00-0x1F and 0x7F illegal in '{}'", instance));
        }
    }

    return serviceName + trailer;
}

std::string EncodeProperties(const Properties& properties)
{
    std::string text;
    for (const auto& [key, value] : properties) {
        std::string item = key;
        if (value) {
            item += "=" + *value;
        }
        if (item.size() > 0xFF) {
            throw Error(fmt::format("TXT entry for key '{}' longer than 255 bytes", key));
        }
        text.push_back(static_cast<char>(item.size()));
        text += item;
    }
    // RFC 6763 section 6.1: an empty TXT record holds a single zero byte
    if (text.empty()) {
        text.push_back('\0');
    }
    return text;
}

Properties DecodeProperties(const std::string& text)
{
    Properties properties;
    std::size_t index = 0;
    while (index < text.size()) {
        const std::size_t length = static_cast<unsigned char>(text[index++]);
        const auto item = text.substr(index, length);
        index += length;

        const auto equals = item.find('=');
        std::string key = equals == std::string::npos ? item : item.substr(0, equals);
        std::optional<std::string> value;
        if (equals != std::string::npos) {
            value = item.substr(equals + 1);
        }
        // The first occurrence of a key wins
        if (key.empty()) {
            continue;
        }
        auto it = properties.find(key);
        if (it == properties.end() || !it->second) {
            properties[key] = std::move(value);
        }
    }
    return properties;
}

ServiceInfo::ServiceInfo(ServiceInfoSettings settings)
: m_type(std::move(settings.type))
, m_name(std::move(settings.name))
, m_addresses(std::move(settings.addresses))
, m_port(settings.port)
, m_weight(settings.weight)
, m_priority(settings.priority)
, m_server(std::move(settings.server))
, m_hostTtl(settings.host_ttl)
, m_otherTtl(settings.other_ttl)
{
    if (!EndsWith(m_type, ServiceTypeName(m_name, false))) {
        BadType(fmt::format("Service name '{}' is not of type '{}'", m_name, m_type));
    }
    if (!settings.properties.empty()) {
        m_text = EncodeProperties(settings.properties);
    }
}

ServiceInfo::ServiceInfo(std::string type, std::string name)
: ServiceInfo(ServiceInfoSettings{std::move(type), std::move(name)})
{}

std::string ServiceInfo::Type() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_type;
}

std::string ServiceInfo::Name() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_name;
}

std::string ServiceInfo::Key() const
{
    return ToLower(Name());
}

std::string ServiceInfo::InstanceName() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_name.size() > m_type.size() && EndsWithIgnoreCase(m_name, m_type)) {
        return m_name.substr(0, m_name.size() - m_type.size() - 1);
    }
    return m_name;
}

std::string ServiceInfo::Server() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_server;
}

std::string ServiceInfo::ServerKey() const
{
    return ToLower(Server());
}

std::uint16_t ServiceInfo::Port() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_port;
}

std::uint16_t ServiceInfo::Weight() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_weight;
}

std::uint16_t ServiceInfo::Priority() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_priority;
}

std::uint32_t ServiceInfo::HostTtl() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hostTtl;
}

std::uint32_t ServiceInfo::OtherTtl() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_otherTtl;
}

std::vector<Address> ServiceInfo::Addresses() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_addresses;
}

std::vector<std::string> ServiceInfo::ParsedAddresses() const
{
    std::vector<std::string> parsed;
    for (const auto& address : Addresses()) {
        parsed.push_back(AddressToString(address));
    }
    return parsed;
}

bool ServiceInfo::HasIpv6Address() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_addresses.begin(), m_addresses.end(), [](const Address& address) {
        return address.size() == 16;
    });
}

Properties ServiceInfo::GetProperties() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_text) {
        return {};
    }
    return DecodeProperties(*m_text);
}

std::string ServiceInfo::Text() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_text ? *m_text : EncodeProperties({});
}

void ServiceInfo::SetName(std::string name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_name = std::move(name);
}

void ServiceInfo::SetServer(std::string server)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_server = std::move(server);
}

void ServiceInfo::SetPort(std::uint16_t port)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_port = port;
}

void ServiceInfo::SetAddresses(std::vector<Address> addresses)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_addresses = std::move(addresses);
}

void ServiceInfo::SetProperties(const Properties& properties)
{
    auto text = EncodeProperties(properties);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_text = std::move(text);
}

void ServiceInfo::SetText(std::string text)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_text = std::move(text);
}

void ServiceInfo::SetTtls(std::uint32_t host_ttl, std::uint32_t other_ttl)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hostTtl = host_ttl;
    m_otherTtl = other_ttl;
}

Record ServiceInfo::DnsPointer(std::optional<std::uint32_t> ttl) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return MakePointerRecord(m_type, ttl.value_or(m_otherTtl), m_name);
}

Record ServiceInfo::DnsService(std::optional<std::uint32_t> ttl) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return MakeServiceRecord(m_name, ttl.value_or(m_hostTtl), m_priority, m_weight, m_port, m_server);
}

Record ServiceInfo::DnsText(std::optional<std::uint32_t> ttl) const
{
    const auto text = Text();
    std::lock_guard<std::mutex> lock(m_mutex);
    return MakeTextRecord(m_name, ttl.value_or(m_otherTtl), text);
}

std::vector<Record> ServiceInfo::DnsAddresses(std::optional<std::uint32_t> ttl) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Record> records;
    for (const auto& address : m_addresses) {
        records.push_back(MakeAddressRecord(m_server, ttl.value_or(m_hostTtl), address));
    }
    return records;
}

bool ServiceInfo::Resolved() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return ResolvedLocked();
}

bool ServiceInfo::ResolvedLocked() const
{
    return !m_server.empty() && m_text.has_value() && !m_addresses.empty();
}

void ServiceInfo::UpdateRecord(Zeroconf& zc, TimePoint now, const Record& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ApplyRecordLocked(zc, now, record);
}

void ServiceInfo::ApplyRecordLocked(Zeroconf& zc, TimePoint now, const Record& record)
{
    const auto& header = GetHeader(record);
    if (IsExpired(header, now)) {
        return;
    }

    if (const auto* address = std::get_if<AddressRecord>(&record)) {
        if (EqualsIgnoreCase(header.name, m_server)
            && std::find(m_addresses.begin(), m_addresses.end(), address->address) == m_addresses.end()) {
            m_addresses.push_back(address->address);
        }
    }
    else if (const auto* service = std::get_if<ServiceRecord>(&record)) {
        if (!EqualsIgnoreCase(header.name, m_name)) {
            return;
        }
        m_server = service->server;
        m_port = service->port;
        m_weight = service->weight;
        m_priority = service->priority;
        for (const auto type : {kTypeA, kTypeAaaa}) {
            for (const auto& cached : zc.GetCache().GetAllByDetails(m_server, type, kClassIn, now)) {
                ApplyRecordLocked(zc, now, cached);
            }
        }
    }
    else if (const auto* text = std::get_if<TextRecord>(&record)) {
        if (EqualsIgnoreCase(header.name, m_name)) {
            m_text = text->text;
        }
    }
}

bool ServiceInfo::LoadFromCache(Zeroconf& zc)
{
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& cache = zc.GetCache();
    if (auto srv = cache.GetByDetails(m_name, kTypeSrv, kClassIn, now)) {
        ApplyRecordLocked(zc, now, *srv);
    }
    if (auto txt = cache.GetByDetails(m_name, kTypeTxt, kClassIn, now)) {
        ApplyRecordLocked(zc, now, *txt);
    }
    if (!m_server.empty()) {
        for (const auto type : {kTypeA, kTypeAaaa}) {
            for (const auto& cached : cache.GetAllByDetails(m_server, type, kClassIn, now)) {
                ApplyRecordLocked(zc, now, cached);
            }
        }
    }
    return ResolvedLocked();
}

bool ServiceInfo::Request(Zeroconf& zc, std::chrono::milliseconds timeout)
{
    if (LoadFromCache(zc)) {
        return true;
    }

    auto now = Clock::now();
    const auto last = now + timeout;
    auto delay = kListenerTime;
    auto next = now;

    const auto name = Name();
    const ScopedListener listening(zc, this, Question{name, kTypeAny, kClassIn, false});
    bool resolved = Resolved();
    while (!resolved && now < last && !zc.Closed()) {
        if (next <= now) {
            OutgoingMessage out(kFlagsQrQuery);
            auto& cache = zc.GetCache();
            out.AddQuestion(Question{name, kTypeSrv, kClassIn, false});
            if (auto srv = cache.GetByDetails(name, kTypeSrv, kClassIn, now)) {
                out.AddAnswerAtTime(*srv, now);
            }
            out.AddQuestion(Question{name, kTypeTxt, kClassIn, false});
            if (auto txt = cache.GetByDetails(name, kTypeTxt, kClassIn, now)) {
                out.AddAnswerAtTime(*txt, now);
            }
            const auto server = Server();
            if (!server.empty()) {
                for (const auto type : {kTypeA, kTypeAaaa}) {
                    out.AddQuestion(Question{server, type, kClassIn, false});
                    if (auto address = cache.GetByDetails(server, type, kClassIn, now)) {
                        out.AddAnswerAtTime(*address, now);
                    }
                }
            }
            zc.Send(out);
            next = now + delay;
            delay *= 2;
        }
        zc.Wait(std::chrono::duration_cast<std::chrono::milliseconds>(std::min(next, last) - now));
        now = Clock::now();
        resolved = Resolved();
    }
    return resolved;
}

}
