#include "zeroconf_cpp/service_browser.hpp"
#include "zeroconf_cpp/exceptions.hpp"
#include "zeroconf_cpp/service_info.hpp"
#include "zeroconf_cpp/zeroconf.hpp"
#include "random_utils.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <optional>

#include "log.hpp"
#include <fmt/format.h>

namespace zeroconf_cpp
{

namespace
{

constexpr int kFirstQueryMinDelayMs = 20;
constexpr int kFirstQueryMaxDelayMs = 120;
constexpr int kMaxJitterMs = 20;

std::vector<ServiceStateChangeHandler> ListenerHandlers(ServiceListener& listener)
{
	return {[&listener](Zeroconf& zc, const std::string& type, const std::string& name, ServiceStateChange change) {
		switch (change) {
		case ServiceStateChange::Added:
			listener.AddService(zc, type, name);
			break;
		case ServiceStateChange::Removed:
			listener.RemoveService(zc, type, name);
			break;
		case ServiceStateChange::Updated:
			listener.UpdateService(zc, type, name);
			break;
		}
	}};
}

}

// Wakes the browser thread on every engine notification, Close() included.
// Outlives the browser when a notification is in flight during Cancel().
class ServiceBrowser::Wakeup : public NotifyListener
{
public:
	explicit Wakeup(ServiceBrowser* browser) : m_browser(browser) {}

	void NotifyAll() override
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_browser) {
			m_browser->Wake();
		}
	}

	void Detach()
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_browser = nullptr;
	}

private:
	std::mutex m_mutex;
	ServiceBrowser* m_browser;
};

ServiceBrowser::ServiceBrowser(Zeroconf& zc, std::string type, std::vector<ServiceStateChangeHandler> handlers)
: m_zc(zc)
, m_type(std::move(type))
, m_handlers(std::move(handlers))
, m_wakeup(std::make_shared<Wakeup>(this))
, m_nextTime(Clock::now() + RandomMilliseconds(kFirstQueryMinDelayMs, kFirstQueryMaxDelayMs))
, m_delay(kBrowserTime)
{
	if (!EndsWith(m_type, ServiceTypeName(m_type, false))) {
		Log(LogLevel::Error, fmt::format("Invalid service type to browse: {}", m_type));
		throw BadTypeInNameError(fmt::format("Invalid service type to browse: {}", m_type));
	}

	m_zc.AddNotifyListener(m_wakeup);
	m_zc.AddListener(this, Question{m_type, kTypePtr, kClassIn, false});
	m_thread = std::thread([this](){
		Run();
	});
	Log(LogLevel::Debug, fmt::format("Browsing {}", m_type));
}

ServiceBrowser::ServiceBrowser(Zeroconf& zc, std::string type, ServiceListener& listener)
: ServiceBrowser(zc, std::move(type), ListenerHandlers(listener))
{
}

ServiceBrowser::~ServiceBrowser()
{
	Cancel();
}

void ServiceBrowser::Cancel()
{
	const bool wasDone = m_done.exchange(true, std::memory_order_acq_rel);
	if (!wasDone) {
		m_zc.RemoveListener(this);
		m_zc.RemoveNotifyListener(m_wakeup);
		m_wakeup->Detach();
		Wake();
	}
	// From a handler the thread winds down on its own once the handler returns
	if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
		m_thread.join();
	}
}

bool ServiceBrowser::Done() const
{
	return m_done.load(std::memory_order_acquire);
}

void ServiceBrowser::Wake()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
	}
	m_condition.notify_all();
}

void ServiceBrowser::UpdateRecord(Zeroconf&, TimePoint now, const Record& record)
{
	const auto& header = GetHeader(record);
	const bool expired = IsExpired(header, now);

	std::lock_guard<std::mutex> lock(m_mutex);
	if (header.type == kTypePtr && EqualsIgnoreCase(header.name, m_type)) {
		const auto& pointer = std::get<PointerRecord>(record);
		const auto key = ToLower(pointer.alias);
		auto it = m_services.find(key);
		if (it == m_services.end()) {
			if (expired) {
				return;
			}
			m_services.emplace(key, pointer);
			EnqueueLocked(pointer.alias, ServiceStateChange::Added);
		}
		else if (!expired) {
			ResetTtl(it->second.header, header);
		}
		else {
			m_services.erase(it);
			EnqueueLocked(pointer.alias, ServiceStateChange::Removed);
			return;
		}

		// Re-query before the instance record runs out
		const auto refresh = ExpirationTime(header, 75);
		if (refresh < m_nextTime) {
			m_nextTime = refresh;
			m_condition.notify_all();
		}
	}
	else if ((header.type == kTypeSrv || header.type == kTypeTxt) && !expired &&
	         EndsWithIgnoreCase(header.name, m_type)) {
		if (m_services.count(ToLower(header.name)) > 0) {
			EnqueueLocked(header.name, ServiceStateChange::Updated);
		}
	}
}

void ServiceBrowser::EnqueueLocked(const std::string& name, ServiceStateChange change)
{
	// Precedence is Added, then Removed, then Updated
	auto it = std::find_if(m_pending.begin(), m_pending.end(), [&name](const auto& entry) {
		return EqualsIgnoreCase(entry.first, name);
	});
	if (it == m_pending.end()) {
		m_pending.emplace_back(name, change);
	}
	else if (change == ServiceStateChange::Added ||
	         (change == ServiceStateChange::Removed && it->second != ServiceStateChange::Added)) {
		it->second = change;
	}
	m_condition.notify_all();
}

OutgoingMessage ServiceBrowser::BuildQueryLocked(TimePoint now) const
{
	OutgoingMessage out(kFlagsQrQuery);
	out.AddQuestion(Question{m_type, kTypePtr, kClassIn, false});
	auto& cache = m_zc.GetCache();
	for (const auto& [key, pointer] : m_services) {
		Record known = pointer;
		// Announcements refresh the cached copy only
		if (auto cached = cache.Get(known)) {
			ResetTtl(GetHeader(known), GetHeader(*cached));
		}
		if (!IsStale(GetHeader(known), now)) {
			out.AddAnswerAtTime(known, now);
		}
	}
	return out;
}

void ServiceBrowser::Fire(const std::string& name, ServiceStateChange change)
{
	Log(LogLevel::Debug, fmt::format("Service {} {}", name, ToString(change)));
	for (const auto& handler : m_handlers) {
		try {
			handler(m_zc, m_type, name, change);
		}
		catch (const std::exception& e) {
			Log(LogLevel::Error, fmt::format("Handler for {} failed: {}", name, e.what()));
		}
	}
}

void ServiceBrowser::Run()
{
	while (!Done() && !m_zc.Closed()) {
		std::optional<OutgoingMessage> query;
		std::vector<std::pair<std::string, ServiceStateChange>> changes;
		{
			std::unique_lock<std::mutex> lock(m_mutex);
			m_condition.wait_until(lock, m_nextTime, [this](){
				return !m_pending.empty() || Done() || m_zc.Closed() || Clock::now() >= m_nextTime;
			});

			const auto now = Clock::now();
			if (m_nextTime <= now) {
				query = BuildQueryLocked(now);
				m_nextTime = now + m_delay + RandomMilliseconds(0, kMaxJitterMs);
				m_delay = std::min(kBrowserBackoffLimit, m_delay * 2);
			}
			changes.swap(m_pending);
		}

		if (query && !Done()) {
			try {
				m_zc.Send(*query);
			}
			catch (const Error& e) {
				Log(LogLevel::Error, fmt::format("Query for {} failed: {}", m_type, e.what()));
			}
		}
		for (const auto& [name, change] : changes) {
			if (Done()) {
				break;
			}
			Fire(name, change);
		}
	}
	Log(LogLevel::Debug, fmt::format("Stopped browsing {}", m_type));
}

}
