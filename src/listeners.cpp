#include "zeroconf_cpp/listeners.hpp"
#include "zeroconf_cpp/exceptions.hpp"

#include "log.hpp"
#include <fmt/format.h>

namespace zeroconf_cpp
{

void NotifyListener::NotifyAll()
{
    throw NotImplementedError("NotifyListener::NotifyAll must be overridden");
}

std::string ToString(ServiceStateChange change)
{
    switch (change) {
        case ServiceStateChange::Added: return "Added";
        case ServiceStateChange::Removed: return "Removed";
        case ServiceStateChange::Updated: return "Updated";
    }
    return "";
}

void ServiceListener::UpdateService(Zeroconf&, const std::string& type, const std::string& name)
{
    Log(LogLevel::Debug, fmt::format("Ignoring update of {} ({}), listener does not handle updates", name, type));
}

}
