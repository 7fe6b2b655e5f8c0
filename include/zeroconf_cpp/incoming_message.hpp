#pragma once

#include "zeroconf_cpp/constants.hpp"
#include "zeroconf_cpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zeroconf_cpp
{

// Parsed view of a received packet. Construction never throws: a malformed
// packet yields a message with Valid() == false and the reason in Error().
class IncomingMessage
{
public:
    explicit IncomingMessage(const std::vector<std::uint8_t>& data, TimePoint now = Clock::now());
    IncomingMessage(const std::uint8_t* data, std::size_t size, TimePoint now = Clock::now());

    bool Valid() const { return m_valid; }
    const std::string& Error() const { return m_error; }

    std::uint16_t Id() const { return m_id; }
    std::uint16_t Flags() const { return m_flags; }
    bool IsQuery() const { return (m_flags & kFlagsQrMask) == kFlagsQrQuery; }
    bool IsResponse() const { return (m_flags & kFlagsQrMask) == kFlagsQrResponse; }
    bool Truncated() const { return (m_flags & kFlagsTc) != 0; }

    const std::vector<Question>& Questions() const { return m_questions; }
    const std::vector<Record>& Answers() const { return m_answers; }
    const std::vector<Record>& Authorities() const { return m_authorities; }
    const std::vector<Record>& Additionals() const { return m_additionals; }

    // Answers, authorities and additionals in wire order
    std::vector<Record> AllRecords() const;

private:
    void Parse(const std::uint8_t* data, std::size_t size, TimePoint now);

    bool m_valid{false};
    std::string m_error;

    std::uint16_t m_id{0};
    std::uint16_t m_flags{0};

    std::vector<Question> m_questions;
    std::vector<Record> m_answers;
    std::vector<Record> m_authorities;
    std::vector<Record> m_additionals;
};

}
