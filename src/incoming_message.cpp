#include "zeroconf_cpp/incoming_message.hpp"
#include "zeroconf_cpp/exceptions.hpp"

#include <fmt/core.h>

namespace zeroconf_cpp
{

namespace
{

class PacketReader
{
public:
    PacketReader(const std::uint8_t* data, std::size_t size)
    : m_data(data)
    , m_size(size)
    {}

    std::size_t Offset() const { return m_offset; }
    void Seek(std::size_t offset) { m_offset = offset; }

    void Require(std::size_t count) const
    {
        if (m_offset + count > m_size) {
            throw DecodeError(fmt::format("Read of {} bytes at offset {} past end of {} byte packet",
                                          count, m_offset, m_size));
        }
    }

    std::uint8_t ReadByte()
    {
        Require(1);
        return m_data[m_offset++];
    }

    std::uint16_t ReadShort()
    {
        Require(2);
        const auto value = static_cast<std::uint16_t>((m_data[m_offset] << 8) | m_data[m_offset + 1]);
        m_offset += 2;
        return value;
    }

    std::uint32_t ReadInt()
    {
        const std::uint32_t high = ReadShort();
        const std::uint32_t low = ReadShort();
        return (high << 16) | low;
    }

    std::string ReadString(std::size_t length)
    {
        Require(length);
        std::string str(reinterpret_cast<const char*>(m_data + m_offset), length);
        m_offset += length;
        return str;
    }

    std::string ReadCharacterString()
    {
        const auto length = ReadByte();
        return ReadString(length);
    }

    // Follows compression pointers. A pointer must reference an offset before
    // the start of the run it terminates, which rules out loops.
    std::string ReadName()
    {
        std::string result;
        std::size_t offset = m_offset;
        std::size_t next = 0;
        bool jumped = false;
        std::size_t first = offset;
        std::size_t wireLength = 1;

        while (true) {
            if (offset >= m_size) {
                throw DecodeError(fmt::format("Name at offset {} runs past end of packet", m_offset));
            }
            const std::uint8_t length = m_data[offset];
            if (length == 0) {
                ++offset;
                break;
            }
            switch (length & 0xC0) {
                case 0x00: {
                    if (offset + 1 + length > m_size) {
                        throw DecodeError(fmt::format("Label at offset {} runs past end of packet", offset));
                    }
                    wireLength += length + 1u;
                    if (wireLength > kMaxNameLength) {
                        throw DecodeError(fmt::format("Name at offset {} longer than {} bytes", m_offset, kMaxNameLength));
                    }
                    result.append(reinterpret_cast<const char*>(m_data + offset + 1), length);
                    result.push_back('.');
                    offset += 1 + length;
                    break;
                }
                case 0xC0: {
                    if (offset + 1 >= m_size) {
                        throw DecodeError(fmt::format("Pointer at offset {} runs past end of packet", offset));
                    }
                    const std::size_t link = (static_cast<std::size_t>(length & 0x3F) << 8) | m_data[offset + 1];
                    if (!jumped) {
                        next = offset + 2;
                        jumped = true;
                    }
                    if (link >= first) {
                        throw DecodeError(fmt::format("Bad domain name at offset {}: forward or circular pointer to {}",
                                                      offset, link));
                    }
                    first = link;
                    offset = link;
                    break;
                }
                default:
                    throw DecodeError(fmt::format("Bad label type {:#x} at offset {}", length & 0xC0, offset));
            }
        }

        m_offset = jumped ? next : offset;
        return result;
    }

private:
    const std::uint8_t* m_data;
    std::size_t m_size;
    std::size_t m_offset{0};
};

Question ReadQuestion(PacketReader& reader)
{
    Question question;
    question.name = reader.ReadName();
    question.type = reader.ReadShort();
    const auto rclass = reader.ReadShort();
    question.rclass = rclass & kClassMask;
    question.unicast_response = (rclass & kClassUnique) != 0;
    return question;
}

// Returns false for record types that are skipped
bool ReadRecord(PacketReader& reader, TimePoint now, Record& out)
{
    RecordHeader header;
    header.name = reader.ReadName();
    header.type = reader.ReadShort();
    const auto rclass = reader.ReadShort();
    header.rclass = rclass & kClassMask;
    header.unique = (rclass & kClassUnique) != 0;
    header.ttl = reader.ReadInt();
    header.created = now;

    const std::size_t length = reader.ReadShort();
    reader.Require(length);
    const auto end = reader.Offset() + length;

    bool known = true;
    switch (static_cast<RecordType>(header.type)) {
        case RecordType::A:
        case RecordType::AAAA: {
            const std::size_t expected = header.type == kTypeA ? 4 : 16;
            if (length != expected) {
                throw DecodeError(fmt::format("Address record {} has {} bytes of data", header.name, length));
            }
            const auto bytes = reader.ReadString(length);
            out = AddressRecord{std::move(header), Address(bytes.begin(), bytes.end())};
            break;
        }
        case RecordType::PTR:
        case RecordType::CNAME: {
            auto alias = reader.ReadName();
            out = PointerRecord{std::move(header), std::move(alias)};
            break;
        }
        case RecordType::TXT: {
            auto text = reader.ReadString(length);
            out = TextRecord{std::move(header), std::move(text)};
            break;
        }
        case RecordType::SRV: {
            ServiceRecord record;
            record.priority = reader.ReadShort();
            record.weight = reader.ReadShort();
            record.port = reader.ReadShort();
            record.server = reader.ReadName();
            record.header = std::move(header);
            out = std::move(record);
            break;
        }
        case RecordType::HINFO: {
            HostInfoRecord record;
            record.cpu = reader.ReadCharacterString();
            record.os = reader.ReadCharacterString();
            record.header = std::move(header);
            out = std::move(record);
            break;
        }
        default:
            known = false;
            break;
    }

    reader.Seek(end);
    return known;
}

}

IncomingMessage::IncomingMessage(const std::vector<std::uint8_t>& data, TimePoint now)
{
    Parse(data.data(), data.size(), now);
}

IncomingMessage::IncomingMessage(const std::uint8_t* data, std::size_t size, TimePoint now)
{
    Parse(data, size, now);
}

void IncomingMessage::Parse(const std::uint8_t* data, std::size_t size, TimePoint now)
{
    PacketReader reader(data, size);
    try {
        m_id = reader.ReadShort();
        m_flags = reader.ReadShort();
        const auto questions = reader.ReadShort();
        const auto answers = reader.ReadShort();
        const auto authorities = reader.ReadShort();
        const auto additionals = reader.ReadShort();

        for (std::uint16_t i = 0; i < questions; ++i) {
            m_questions.push_back(ReadQuestion(reader));
        }

        auto readSection = [&](std::uint16_t count, std::vector<Record>& section) {
            for (std::uint16_t i = 0; i < count; ++i) {
                Record record;
                if (ReadRecord(reader, now, record)) {
                    section.push_back(std::move(record));
                }
            }
        };
        readSection(answers, m_answers);
        readSection(authorities, m_authorities);
        readSection(additionals, m_additionals);
        m_valid = true;
    }
    catch (const DecodeError& e) {
        m_valid = false;
        m_error = e.what();
    }
}

std::vector<Record> IncomingMessage::AllRecords() const
{
    std::vector<Record> records;
    records.reserve(m_answers.size() + m_authorities.size() + m_additionals.size());
    records.insert(records.end(), m_answers.begin(), m_answers.end());
    records.insert(records.end(), m_authorities.begin(), m_authorities.end());
    records.insert(records.end(), m_additionals.begin(), m_additionals.end());
    return records;
}

}
