#pragma once

#include "zeroconf_cpp/types.hpp"

#include <functional>
#include <string>

namespace zeroconf_cpp
{

class Zeroconf;

// Receives every record the engine adds to or removes from its cache
class RecordUpdateListener
{
public:
    virtual ~RecordUpdateListener() = default;

    virtual void UpdateRecord(Zeroconf& zc, TimePoint now, const Record& record) = 0;
};

// Woken whenever the engine calls NotifyAll(). The default implementation
// throws NotImplementedError.
class NotifyListener
{
public:
    virtual ~NotifyListener() = default;

    virtual void NotifyAll();
};

enum class ServiceStateChange
{
    Added,
    Removed,
    Updated
};

std::string ToString(ServiceStateChange change);

using ServiceStateChangeHandler = std::function<void(Zeroconf& zc,
                                                     const std::string& type,
                                                     const std::string& name,
                                                     ServiceStateChange change)>;

class ServiceListener
{
public:
    virtual ~ServiceListener() = default;

    virtual void AddService(Zeroconf& zc, const std::string& type, const std::string& name) = 0;
    virtual void RemoveService(Zeroconf& zc, const std::string& type, const std::string& name) = 0;
    virtual void UpdateService(Zeroconf& zc, const std::string& type, const std::string& name);
};

}
