#pragma once

#include "zeroconf_cpp/listeners.hpp"
#include "zeroconf_cpp/outgoing_message.hpp"
#include "zeroconf_cpp/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace zeroconf_cpp
{

class Zeroconf;

// Tracks the instances of one service type. Queries PTR for the type at
// doubling intervals and reports instances appearing, leaving and changing to
// its handlers from its own thread. zc must outlive the browser.
class ServiceBrowser : public RecordUpdateListener
{
public:
    // Throws BadTypeInNameError for a malformed type
    ServiceBrowser(Zeroconf& zc, std::string type, std::vector<ServiceStateChangeHandler> handlers);
    // listener must outlive the browser
    ServiceBrowser(Zeroconf& zc, std::string type, ServiceListener& listener);
    ~ServiceBrowser() override;

    ServiceBrowser(const ServiceBrowser&) = delete;
    ServiceBrowser& operator=(const ServiceBrowser&) = delete;

    // Stops the thread and detaches from the engine. Safe from a handler.
    void Cancel();
    [[nodiscard]] bool Done() const;
    const std::string& Type() const { return m_type; }

    void UpdateRecord(Zeroconf& zc, TimePoint now, const Record& record) override;

private:
    class Wakeup;

    void Run();
    void Wake();
    void EnqueueLocked(const std::string& name, ServiceStateChange change);
    OutgoingMessage BuildQueryLocked(TimePoint now) const;
    void Fire(const std::string& name, ServiceStateChange change);

    Zeroconf& m_zc;
    std::string m_type;
    std::vector<ServiceStateChangeHandler> m_handlers;
    std::shared_ptr<Wakeup> m_wakeup;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    // Known instances keyed by lower-cased instance name
    std::map<std::string, PointerRecord> m_services;
    // Pending state changes in arrival order, at most one per name
    std::vector<std::pair<std::string, ServiceStateChange>> m_pending;
    TimePoint m_nextTime;
    std::chrono::milliseconds m_delay;

    std::atomic<bool> m_done{false};
    std::thread m_thread;
};

}
