#pragma once

#include "zeroconf_cpp/cache.hpp"
#include "zeroconf_cpp/incoming_message.hpp"
#include "zeroconf_cpp/outgoing_message.hpp"
#include "zeroconf_cpp/service_registry.hpp"

#include <optional>

namespace zeroconf_cpp
{

// Builds the answer to an incoming query from the registered services
class QueryHandler
{
public:
    QueryHandler(ServiceRegistry& registry, Cache& cache);

    // std::nullopt when nothing we know answers the query. Unicast responses
    // repeat the questions and carry the id of the query.
    std::optional<OutgoingMessage> Response(const IncomingMessage& msg, bool unicast) const;

private:
    void AnswerPointer(const IncomingMessage& msg, const Question& question, OutgoingMessage& out) const;
    void AnswerName(const IncomingMessage& msg, const Question& question, OutgoingMessage& out) const;
    void AnswerFromCache(const IncomingMessage& msg, const Question& question, OutgoingMessage& out) const;
    void AddProbeAuthorities(const IncomingMessage& msg, OutgoingMessage& out) const;

    ServiceRegistry& m_registry;
    Cache& m_cache;
};

}
