#include "zeroconf_cpp/query_handler.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <set>

namespace zeroconf_cpp
{

namespace
{

bool AddressMatches(std::uint16_t questionType, const Address& address)
{
    switch (questionType) {
        case kTypeA: return address.size() == 4;
        case kTypeAaaa: return address.size() == 16;
        case kTypeAny: return true;
    }
    return false;
}

bool AlreadyAnswered(const OutgoingMessage& out, const Record& record)
{
    const auto& answers = out.Answers();
    return std::any_of(answers.begin(), answers.end(), [&record](const OutgoingMessage::Answer& answer) {
        return answer.first == record;
    });
}

}

QueryHandler::QueryHandler(ServiceRegistry& registry, Cache& cache)
: m_registry(registry)
, m_cache(cache)
{}

std::optional<OutgoingMessage> QueryHandler::Response(const IncomingMessage& msg, bool unicast) const
{
    OutgoingMessage out(kFlagsQrResponse | kFlagsAa, !unicast, msg.Id());
    if (unicast) {
        for (const auto& question : msg.Questions()) {
            out.AddQuestion(question);
        }
    }

    for (const auto& question : msg.Questions()) {
        if (question.type == kTypePtr) {
            AnswerPointer(msg, question, out);
        }
        else {
            AnswerName(msg, question, out);
        }
        if (question.type == kTypeAny) {
            AnswerFromCache(msg, question, out);
        }
    }

    if (out.Answers().empty()) {
        return std::nullopt;
    }
    AddProbeAuthorities(msg, out);
    return out;
}

void QueryHandler::AnswerPointer(const IncomingMessage& msg, const Question& question, OutgoingMessage& out) const
{
    if (EqualsIgnoreCase(question.name, kServiceTypeEnumerationName)) {
        for (const auto& type : m_registry.GetTypes()) {
            out.AddAnswer(msg, MakePointerRecord(kServiceTypeEnumerationName, kDnsOtherTtl, type));
        }
    }

    for (const auto& service : m_registry.GetInfosType(question.name)) {
        if (!out.AddAnswer(msg, service->DnsPointer())) {
            continue;
        }
        // RFC 6763 section 12.1: save the querier the follow-up lookups
        out.AddAdditionalAnswer(service->DnsService());
        out.AddAdditionalAnswer(service->DnsText());
        for (auto& address : service->DnsAddresses()) {
            out.AddAdditionalAnswer(std::move(address));
        }
    }
}

void QueryHandler::AnswerName(const IncomingMessage& msg, const Question& question, OutgoingMessage& out) const
{
    if (question.type == kTypeA || question.type == kTypeAaaa || question.type == kTypeAny) {
        for (const auto& service : m_registry.GetInfosServer(question.name)) {
            for (const auto& address : service->Addresses()) {
                if (AddressMatches(question.type, address)) {
                    out.AddAnswer(msg, MakeAddressRecord(question.name, service->HostTtl(), address));
                }
            }
        }
    }

    const auto service = m_registry.GetInfoName(question.name);
    if (!service) {
        return;
    }
    if (question.type == kTypeSrv || question.type == kTypeAny) {
        out.AddAnswer(msg, service->DnsService());
    }
    if (question.type == kTypeTxt || question.type == kTypeAny) {
        out.AddAnswer(msg, service->DnsText());
    }
    if (question.type == kTypeSrv) {
        for (auto& address : service->DnsAddresses()) {
            out.AddAdditionalAnswer(std::move(address));
        }
    }
}

void QueryHandler::AnswerFromCache(const IncomingMessage& msg, const Question& question, OutgoingMessage& out) const
{
    const auto now = Clock::now();
    for (const auto& record : m_cache.EntriesWithName(question.name, now)) {
        if (!AnsweredBy(question, record) || AlreadyAnswered(out, record) || SuppressedBy(record, msg)) {
            continue;
        }
        out.AddAnswerAtTime(record, now);
    }
}

void QueryHandler::AddProbeAuthorities(const IncomingMessage& msg, OutgoingMessage& out) const
{
    if (!msg.IsQuery() || msg.Authorities().empty()) {
        return;
    }
    std::set<std::string> added;
    for (const auto& proposed : msg.Authorities()) {
        const auto& name = GetHeader(proposed).name;
        const auto service = m_registry.GetInfoName(name);
        if (service && added.insert(service->Key()).second) {
            out.AddAuthorityAnswer(service->DnsService());
        }
    }
}

}
