#pragma once

#include "zeroconf_cpp/constants.hpp"
#include "zeroconf_cpp/types.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace zeroconf_cpp
{

class IncomingMessage;

using Packet = std::vector<std::uint8_t>;

// Builder for an outgoing DNS message. Nothing is serialized until Packets()
// is called, which may split the message into several standalone packets.
class OutgoingMessage
{
public:
    // An answer together with an optional TTL written in place of the record's own
    using Answer = std::pair<Record, std::optional<std::uint32_t>>;

    explicit OutgoingMessage(std::uint16_t flags, bool multicast = true, std::uint16_t id = 0);

    void AddQuestion(Question question);

    // Adds the answer unless the incoming query already lists it as a known
    // answer. Returns whether it was added.
    bool AddAnswer(const IncomingMessage& incoming, const Record& record);
    // Adds the answer with its remaining TTL at now, skipped when already expired
    void AddAnswerAtTime(const Record& record, TimePoint now);
    void AddAnswer(Record record, std::optional<std::uint32_t> ttl = std::nullopt);
    void AddAuthorityAnswer(Record record);
    void AddAdditionalAnswer(Record record);

    std::uint16_t Flags() const { return m_flags; }
    std::uint16_t Id() const { return m_id; }
    bool Multicast() const { return m_multicast; }
    bool IsQuery() const { return (m_flags & kFlagsQrMask) == kFlagsQrQuery; }
    bool IsResponse() const { return (m_flags & kFlagsQrMask) == kFlagsQrResponse; }

    const std::vector<Question>& Questions() const { return m_questions; }
    const std::vector<Answer>& Answers() const { return m_answers; }
    const std::vector<Record>& Authorities() const { return m_authorities; }
    const std::vector<Record>& Additionals() const { return m_additionals; }

    bool Empty() const;

    // Serializes the message. Throws NamePartTooLongError or BadNameError for
    // names that cannot be put on the wire.
    std::vector<Packet> Packets(std::size_t max_size = kMaxMsgTypical) const;

private:
    std::uint16_t m_flags;
    bool m_multicast;
    std::uint16_t m_id;

    std::vector<Question> m_questions;
    std::vector<Answer> m_answers;
    std::vector<Record> m_authorities;
    std::vector<Record> m_additionals;
};

// True when incoming lists record as a known answer with more than half of its TTL left
bool SuppressedBy(const Record& record, const IncomingMessage& incoming);

}
