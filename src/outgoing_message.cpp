#include "zeroconf_cpp/outgoing_message.hpp"
#include "zeroconf_cpp/exceptions.hpp"
#include "zeroconf_cpp/incoming_message.hpp"
#include "string_utils.hpp"

#include <string>
#include <type_traits>
#include <unordered_map>

#include <fmt/core.h>

namespace zeroconf_cpp
{

namespace
{

// Only offsets that fit the 14 bit pointer field can be referenced
constexpr std::size_t kMaxPointerOffset = 0x3FFF;

class PacketWriter
{
public:
    struct Mark {
        std::size_t size;
        std::size_t names;
    };

    explicit PacketWriter(bool multicast)
    : m_multicast(multicast)
    {
        m_data.resize(kDnsHeaderLength, 0);
    }

    std::size_t Size() const { return m_data.size(); }

    Mark Save() const { return Mark{m_data.size(), m_namesLog.size()}; }

    void Rollback(const Mark& mark)
    {
        m_data.resize(mark.size);
        while (m_namesLog.size() > mark.names) {
            m_names.erase(m_namesLog.back());
            m_namesLog.pop_back();
        }
    }

    void WriteByte(std::uint8_t value)
    {
        m_data.push_back(value);
    }

    void WriteShort(std::uint16_t value)
    {
        m_data.push_back(static_cast<std::uint8_t>(value >> 8));
        m_data.push_back(static_cast<std::uint8_t>(value & 0xFF));
    }

    void WriteInt(std::uint32_t value)
    {
        WriteShort(static_cast<std::uint16_t>(value >> 16));
        WriteShort(static_cast<std::uint16_t>(value & 0xFFFF));
    }

    void WriteBytes(std::string_view bytes)
    {
        m_data.insert(m_data.end(), bytes.begin(), bytes.end());
    }

    void WriteBytes(const Address& bytes)
    {
        m_data.insert(m_data.end(), bytes.begin(), bytes.end());
    }

    void WriteCharacterString(std::string_view str)
    {
        if (str.size() > 0xFF) {
            throw Error(fmt::format("Character string too long: {} bytes", str.size()));
        }
        WriteByte(static_cast<std::uint8_t>(str.size()));
        WriteBytes(str);
    }

    void WriteName(const std::string& name)
    {
        const auto labels = SplitLabels(name);
        for (const auto& label : labels) {
            if (label.empty()) {
                throw BadNameError(fmt::format("Empty label in name: {}", name));
            }
            if (label.size() > kMaxLabelLength) {
                throw NamePartTooLongError(name);
            }
        }

        // suffixes[i] is the name formed by labels[i..]
        std::vector<std::string> suffixes(labels.size());
        std::string suffix;
        for (std::size_t i = labels.size(); i-- > 0;) {
            suffix = std::string(labels[i]) + "." + suffix;
            suffixes[i] = suffix;
        }

        std::size_t count = 0;
        while (count < suffixes.size() && m_names.find(suffixes[count]) == m_names.end()) {
            ++count;
        }

        for (std::size_t i = 0; i < count; ++i) {
            const auto offset = m_data.size();
            if (offset <= kMaxPointerOffset) {
                m_names.emplace(suffixes[i], static_cast<std::uint16_t>(offset));
                m_namesLog.push_back(suffixes[i]);
            }
            WriteByte(static_cast<std::uint8_t>(labels[i].size()));
            WriteBytes(labels[i]);
        }

        if (count < suffixes.size()) {
            const auto index = m_names.at(suffixes[count]);
            WriteByte(static_cast<std::uint8_t>((index >> 8) | 0xC0));
            WriteByte(static_cast<std::uint8_t>(index & 0xFF));
        }
        else {
            WriteByte(0);
        }
    }

    void WriteQuestion(const Question& question)
    {
        WriteName(question.name);
        WriteShort(question.type);
        std::uint16_t rclass = question.rclass;
        if (question.unicast_response) {
            rclass |= kClassUnique;
        }
        WriteShort(rclass);
    }

    void WriteRecord(const Record& record, std::optional<std::uint32_t> ttl)
    {
        const auto& header = GetHeader(record);
        WriteName(header.name);
        WriteShort(header.type);
        std::uint16_t rclass = header.rclass;
        if (header.unique && m_multicast) {
            rclass |= kClassUnique;
        }
        WriteShort(rclass);
        WriteInt(ttl ? *ttl : header.ttl);

        const auto lengthOffset = m_data.size();
        WriteShort(0);
        const auto start = m_data.size();

        std::visit([this](const auto& rec) {
            using T = std::decay_t<decltype(rec)>;
            if constexpr (std::is_same_v<T, AddressRecord>) {
                WriteBytes(rec.address);
            }
            else if constexpr (std::is_same_v<T, PointerRecord>) {
                WriteName(rec.alias);
            }
            else if constexpr (std::is_same_v<T, TextRecord>) {
                WriteBytes(rec.text);
            }
            else if constexpr (std::is_same_v<T, ServiceRecord>) {
                WriteShort(rec.priority);
                WriteShort(rec.weight);
                WriteShort(rec.port);
                WriteName(rec.server);
            }
            else if constexpr (std::is_same_v<T, HostInfoRecord>) {
                WriteCharacterString(rec.cpu);
                WriteCharacterString(rec.os);
            }
        }, record);

        const auto length = m_data.size() - start;
        if (length > 0xFFFF) {
            throw Error(fmt::format("Record data too long for {}", header.name));
        }
        m_data[lengthOffset] = static_cast<std::uint8_t>(length >> 8);
        m_data[lengthOffset + 1] = static_cast<std::uint8_t>(length & 0xFF);
    }

    Packet Finish(std::uint16_t id, std::uint16_t flags, std::uint16_t questions,
                  std::uint16_t answers, std::uint16_t authorities, std::uint16_t additionals)
    {
        const std::uint16_t fields[] = {id, flags, questions, answers, authorities, additionals};
        std::size_t offset = 0;
        for (const auto field : fields) {
            m_data[offset++] = static_cast<std::uint8_t>(field >> 8);
            m_data[offset++] = static_cast<std::uint8_t>(field & 0xFF);
        }
        return std::move(m_data);
    }

private:
    bool m_multicast;
    Packet m_data;
    std::unordered_map<std::string, std::uint16_t> m_names;
    std::vector<std::string> m_namesLog;
};

}

OutgoingMessage::OutgoingMessage(std::uint16_t flags, bool multicast, std::uint16_t id)
: m_flags(flags)
, m_multicast(multicast)
, m_id(id)
{}

void OutgoingMessage::AddQuestion(Question question)
{
    m_questions.push_back(std::move(question));
}

bool OutgoingMessage::AddAnswer(const IncomingMessage& incoming, const Record& record)
{
    if (SuppressedBy(record, incoming)) {
        return false;
    }
    AddAnswer(record);
    return true;
}

void OutgoingMessage::AddAnswerAtTime(const Record& record, TimePoint now)
{
    const auto& header = GetHeader(record);
    if (!IsExpired(header, now)) {
        m_answers.emplace_back(record, RemainingTtl(header, now));
    }
}

void OutgoingMessage::AddAnswer(Record record, std::optional<std::uint32_t> ttl)
{
    m_answers.emplace_back(std::move(record), ttl);
}

void OutgoingMessage::AddAuthorityAnswer(Record record)
{
    m_authorities.push_back(std::move(record));
}

void OutgoingMessage::AddAdditionalAnswer(Record record)
{
    m_additionals.push_back(std::move(record));
}

bool OutgoingMessage::Empty() const
{
    return m_questions.empty() && m_answers.empty() && m_authorities.empty() && m_additionals.empty();
}

std::vector<Packet> OutgoingMessage::Packets(std::size_t max_size) const
{
    std::vector<Packet> packets;
    std::size_t answerOffset = 0;
    std::size_t authorityOffset = 0;
    std::size_t additionalOffset = 0;
    bool more = false;

    do {
        PacketWriter writer(m_multicast);
        for (const auto& question : m_questions) {
            writer.WriteQuestion(question);
        }

        // The first record of a packet is kept even when it alone overflows,
        // otherwise it could never be sent
        std::size_t records = 0;
        bool full = false;
        auto tryWrite = [&](const Record& record, std::optional<std::uint32_t> ttl) {
            const auto mark = writer.Save();
            writer.WriteRecord(record, ttl);
            if (writer.Size() > max_size && records > 0) {
                writer.Rollback(mark);
                full = true;
                return false;
            }
            ++records;
            return true;
        };

        std::uint16_t answers = 0;
        while (!full && answerOffset < m_answers.size()) {
            const auto& answer = m_answers[answerOffset];
            if (tryWrite(answer.first, answer.second)) {
                ++answerOffset;
                ++answers;
            }
        }
        std::uint16_t authorities = 0;
        while (!full && authorityOffset < m_authorities.size()) {
            if (tryWrite(m_authorities[authorityOffset], std::nullopt)) {
                ++authorityOffset;
                ++authorities;
            }
        }
        std::uint16_t additionals = 0;
        while (!full && additionalOffset < m_additionals.size()) {
            if (tryWrite(m_additionals[additionalOffset], std::nullopt)) {
                ++additionalOffset;
                ++additionals;
            }
        }

        more = answerOffset < m_answers.size()
            || authorityOffset < m_authorities.size()
            || additionalOffset < m_additionals.size();

        std::uint16_t flags = m_flags;
        if (more && IsQuery()) {
            flags |= kFlagsTc;
        }
        packets.push_back(writer.Finish(m_multicast ? 0 : m_id, flags,
                                        static_cast<std::uint16_t>(m_questions.size()),
                                        answers, authorities, additionals));
    } while (more);

    return packets;
}

bool SuppressedBy(const Record& record, const IncomingMessage& incoming)
{
    const auto ttl = GetHeader(record).ttl;
    for (const auto& known : incoming.Answers()) {
        if (known == record && GetHeader(known).ttl > ttl / 2) {
            return true;
        }
    }
    return false;
}

}
