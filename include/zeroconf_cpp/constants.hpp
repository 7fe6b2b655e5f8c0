#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace zeroconf_cpp
{

// Network
constexpr const char* kMdnsAddress = "224.0.0.251";
constexpr const char* kMdnsAddress6 = "ff02::fb";
constexpr std::uint16_t kMdnsPort = 5353;
constexpr std::uint16_t kDnsPort = 53;

// Packet size ceilings. Typical fits an Ethernet frame, absolute is the
// largest datagram we are willing to put on the wire or accept from it.
constexpr std::size_t kMaxMsgTypical = 1460;
constexpr std::size_t kMaxMsgAbsolute = 8966;
constexpr std::size_t kDnsHeaderLength = 12;

constexpr std::size_t kMaxLabelLength = 63;
constexpr std::size_t kMaxNameLength = 255;

// TTLs in seconds (RFC 6762 section 10)
constexpr std::uint32_t kDnsHostTtl = 120;
constexpr std::uint32_t kDnsOtherTtl = 4500;

// Timings
constexpr std::chrono::milliseconds kCheckTime{175};
constexpr std::chrono::milliseconds kRegisterTime{225};
constexpr std::chrono::milliseconds kUnregisterTime{125};
constexpr std::chrono::milliseconds kBrowserTime{1000};
constexpr std::chrono::milliseconds kBrowserBackoffLimit{3600 * 1000};
constexpr std::chrono::milliseconds kListenerTime{200};
constexpr std::chrono::milliseconds kCacheCleanupInterval{10000};
constexpr int kProbeCount = 3;
constexpr int kAnnounceCount = 3;

// Header flags
constexpr std::uint16_t kFlagsQrMask = 0x8000;
constexpr std::uint16_t kFlagsQrQuery = 0x0000;
constexpr std::uint16_t kFlagsQrResponse = 0x8000;
constexpr std::uint16_t kFlagsAa = 0x0400; // Authoritative answer
constexpr std::uint16_t kFlagsTc = 0x0200; // Truncated
constexpr std::uint16_t kFlagsRd = 0x0100;
constexpr std::uint16_t kFlagsRa = 0x0080;

// Classes
constexpr std::uint16_t kClassIn = 1;
constexpr std::uint16_t kClassAny = 255;
constexpr std::uint16_t kClassMask = 0x7FFF;
constexpr std::uint16_t kClassUnique = 0x8000;

// Record types
enum class RecordType : std::uint16_t {
    A = 1,
    CNAME = 5,
    PTR = 12,
    HINFO = 13,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    NSEC = 47,
    ANY = 255
};

constexpr std::uint16_t kTypeA = static_cast<std::uint16_t>(RecordType::A);
constexpr std::uint16_t kTypeCname = static_cast<std::uint16_t>(RecordType::CNAME);
constexpr std::uint16_t kTypePtr = static_cast<std::uint16_t>(RecordType::PTR);
constexpr std::uint16_t kTypeHinfo = static_cast<std::uint16_t>(RecordType::HINFO);
constexpr std::uint16_t kTypeTxt = static_cast<std::uint16_t>(RecordType::TXT);
constexpr std::uint16_t kTypeAaaa = static_cast<std::uint16_t>(RecordType::AAAA);
constexpr std::uint16_t kTypeSrv = static_cast<std::uint16_t>(RecordType::SRV);
constexpr std::uint16_t kTypeAny = static_cast<std::uint16_t>(RecordType::ANY);

constexpr const char* kServiceTypeEnumerationName = "_services._dns-sd._udp.local.";

}
