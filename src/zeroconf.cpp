#include "zeroconf_cpp/zeroconf.hpp"
#include "zeroconf_cpp/exceptions.hpp"
#include "log_backoff.hpp"
#include "multicast_transport.hpp"
#include "scheduler.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "log.hpp"
#include <fmt/format.h>

namespace zeroconf_cpp
{

namespace
{

constexpr std::chrono::milliseconds kReceiveTimeout{100};

}

class Zeroconf::ZeroconfImpl
{
private:
	Zeroconf& m_owner;
	ZeroconfSettings m_settings;

	Cache m_cache;
	ServiceRegistry m_registry;
	QueryHandler m_queryHandler;
	std::shared_ptr<Transport> m_transport;
	LogBackoff m_backoff;
	Scheduler m_scheduler;

	std::mutex m_listenersMutex;
	std::vector<RecordUpdateListener*> m_listeners;
	std::mutex m_notifyMutex;
	std::vector<std::shared_ptr<NotifyListener>> m_notifyListeners;

	std::mutex m_conditionMutex;
	std::condition_variable m_condition;

	std::atomic<bool> m_closed{false};
	std::atomic<bool> m_running{false};
	std::thread m_listenThread;

public:
	ZeroconfImpl(Zeroconf& owner, ZeroconfSettings settings)
	: m_owner(owner)
	, m_settings(std::move(settings))
	, m_queryHandler(m_registry, m_cache)
	, m_backoff(m_settings.log_backoff_window)
	{
		m_transport = m_settings.transport;
		if (!m_transport) {
			m_transport = std::make_shared<MulticastTransport>(m_settings.interfaces, m_settings.ip_version);
		}
		m_scheduler.AddTask("cache cleanup", m_settings.cache_cleanup_interval, [this](){
			CleanupCache();
		});
		m_scheduler.AddTask("reannounce", m_settings.reannounce_interval, [this](){
			Reannounce();
		});
	}

	~ZeroconfImpl() {
		Close();
		// Close() skips the join when it ran on the listen thread itself
		if (m_listenThread.joinable()) {
			if (m_listenThread.get_id() != std::this_thread::get_id()) {
				m_listenThread.join();
			}
			else {
				m_listenThread.detach();
			}
		}
	}

	// Separate from construction so the threads never see a half built owner
	void Start()
	{
		if (m_running.exchange(true, std::memory_order_acq_rel) == true) {
			return;
		}
		m_listenThread = std::thread([this](){
			ListenLoop();
		});
		m_scheduler.Start();
		Log(LogLevel::Debug, "Zeroconf started.");
	}

	Cache& GetCache() { return m_cache; }
	ServiceRegistry& Registry() { return m_registry; }
	QueryHandler& GetQueryHandler() { return m_queryHandler; }
	const ZeroconfSettings& Settings() const { return m_settings; }
	bool Closed() const { return m_closed.load(std::memory_order_acquire); }

	void RegisterService(const InfoPtr& info, std::optional<std::uint32_t> ttl, bool allow_name_change,
	                     bool cooperating_responders)
	{
		if (Closed()) {
			Log(LogLevel::Error, fmt::format("Cannot register {}, zeroconf is closed.", info->Name()));
			throw Error("Zeroconf instance is closed");
		}
		if (ttl) {
			info->SetTtls(*ttl, *ttl);
		}
		if (info->Server().empty()) {
			info->SetServer(info->Name());
		}
		CheckServiceType(*info);

		// Registering again replaces our own earlier registration
		if (m_registry.GetInfoName(info->Name()) == info) {
			m_registry.Remove(info);
		}

		if (cooperating_responders) {
			if (HasConflict(*info)) {
				// RFC 6762 section 6.6: the peer already answers for these records
				m_registry.Add(info);
				Log(LogLevel::Info, fmt::format("Registered {} alongside a cooperating responder.", info->Name()));
				return;
			}
		}
		else {
			Probe(*info, allow_name_change);
		}

		m_registry.Add(info);
		Announce(*info);
		Log(LogLevel::Info, fmt::format("Registered {} on {}:{}", info->Name(), info->Server(), info->Port()));
	}

	void UnregisterService(const InfoPtr& info)
	{
		m_registry.Remove(info);
		const auto out = GenerateServiceBroadcast(*info, 0);
		for (int i = 0; i < kAnnounceCount; ++i) {
			if (i > 0) {
				Pause(m_settings.unregister_interval);
			}
			Send(out, std::nullopt);
		}
		Log(LogLevel::Info, fmt::format("Unregistered {}", info->Name()));
	}

	void UnregisterAllServices(bool closing)
	{
		const auto infos = m_registry.GetServiceInfos();
		if (infos.empty()) {
			return;
		}

		OutgoingMessage out(kFlagsQrResponse | kFlagsAa);
		for (const auto& info : infos) {
			m_registry.Remove(info);
			AddBroadcastAnswers(out, *info, 0);
		}
		for (int i = 0; i < kAnnounceCount; ++i) {
			if (i > 0) {
				Pause(m_settings.unregister_interval);
			}
			if (closing) {
				Transmit(out, std::nullopt);
			}
			else {
				Send(out, std::nullopt);
			}
		}
		Log(LogLevel::Info, fmt::format("Unregistered {} service{}", infos.size(), infos.size() > 1 ? "s" : ""));
	}

	void UpdateService(const InfoPtr& info)
	{
		m_registry.Update(info);
		Announce(*info);
	}

	OutgoingMessage GenerateServiceBroadcast(const ServiceInfo& info, std::optional<std::uint32_t> ttl) const
	{
		OutgoingMessage out(kFlagsQrResponse | kFlagsAa);
		AddBroadcastAnswers(out, info, ttl);
		// An explicit TTL asserts our claim, the SRV goes in the authority section too
		if (ttl && *ttl != 0) {
			out.AddAuthorityAnswer(info.DnsService(ttl));
		}
		return out;
	}

	OutgoingMessage GenerateServiceQuery(const ServiceInfo& info) const
	{
		OutgoingMessage out(kFlagsQrQuery | kFlagsAa);
		const auto name = info.Name();
		out.AddQuestion(Question{name, kTypeSrv, kClassIn, false});
		out.AddQuestion(Question{name, kTypeTxt, kClassIn, false});
		out.AddQuestion(Question{info.Server(), info.HasIpv6Address() ? kTypeAaaa : kTypeA, kClassIn, false});
		// RFC 6762 section 8.2: the proposed records break ties between simultaneous probes
		out.AddAuthorityAnswer(info.DnsService());
		return out;
	}

	bool Send(const OutgoingMessage& out, const std::optional<Endpoint>& destination)
	{
		if (Closed()) {
			m_backoff.Report("send-closed", "Dropping outgoing message, zeroconf is closed");
			return false;
		}
		return Transmit(out, destination);
	}

	void HandlePacket(const std::vector<std::uint8_t>& data, const Endpoint& from)
	{
		if (data.size() > kMaxMsgAbsolute) {
			m_backoff.Report("receive-oversize", fmt::format("Dropping {} byte packet from {}:{}, limit is {} bytes",
			                                                data.size(), from.address, from.port, kMaxMsgAbsolute));
			return;
		}

		IncomingMessage msg(data);
		if (!msg.Valid()) {
			m_backoff.Report("receive-invalid", fmt::format("Dropping invalid packet from {}:{}: {}",
			                                               from.address, from.port, msg.Error()));
			return;
		}

		if (msg.IsQuery()) {
			HandleQuery(msg, from);
		}
		else {
			HandleResponse(msg);
		}
	}

	void HandleResponse(const IncomingMessage& msg)
	{
		const auto now = Clock::now();
		bool changed = false;
		for (const auto& record : msg.AllRecords()) {
			const auto& header = GetHeader(record);
			if (header.ttl == 0 || IsExpired(header, now)) {
				if (m_cache.Remove(record)) {
					DispatchRecord(now, record);
					changed = true;
				}
				continue;
			}

			for (auto& flushed : m_cache.Flush(record)) {
				GetHeader(flushed).ttl = 0;
				DispatchRecord(now, flushed);
				changed = true;
			}
			if (m_cache.Add(record)) {
				DispatchRecord(now, record);
				changed = true;
			}
		}
		if (changed) {
			NotifyAll();
		}
	}

	void HandleQuery(const IncomingMessage& msg, const Endpoint& from)
	{
		const auto& questions = msg.Questions();
		const bool legacy = from.port != kMdnsPort;
		const bool unicast = legacy || std::any_of(questions.begin(), questions.end(), [](const Question& question) {
			return question.unicast_response;
		});

		const auto out = m_queryHandler.Response(msg, unicast);
		if (!out) {
			return;
		}
		if (unicast) {
			Send(*out, from);
		}
		else {
			Send(*out, std::nullopt);
		}
	}

	void AddNotifyListener(const std::shared_ptr<NotifyListener>& listener)
	{
		std::lock_guard<std::mutex> lock(m_notifyMutex);
		if (std::find(m_notifyListeners.begin(), m_notifyListeners.end(), listener) == m_notifyListeners.end()) {
			m_notifyListeners.push_back(listener);
		}
	}

	void RemoveNotifyListener(const std::shared_ptr<NotifyListener>& listener)
	{
		std::lock_guard<std::mutex> lock(m_notifyMutex);
		m_notifyListeners.erase(std::remove(m_notifyListeners.begin(), m_notifyListeners.end(), listener),
		                        m_notifyListeners.end());
	}

	void NotifyAll()
	{
		std::vector<std::shared_ptr<NotifyListener>> listeners;
		{
			std::lock_guard<std::mutex> lock(m_notifyMutex);
			listeners = m_notifyListeners;
		}
		for (const auto& listener : listeners) {
			listener->NotifyAll();
		}
		{
			std::lock_guard<std::mutex> lock(m_conditionMutex);
		}
		m_condition.notify_all();
	}

	void Wait(std::chrono::milliseconds timeout)
	{
		std::unique_lock<std::mutex> lock(m_conditionMutex);
		m_condition.wait_for(lock, timeout);
	}

	void AddListener(RecordUpdateListener* listener, const std::optional<Question>& question)
	{
		const auto now = Clock::now();
		{
			std::lock_guard<std::mutex> lock(m_listenersMutex);
			if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
				m_listeners.push_back(listener);
			}
			if (question) {
				for (const auto& record : m_cache.EntriesWithName(question->name, now)) {
					if (AnsweredBy(*question, record)) {
						listener->UpdateRecord(m_owner, now, record);
					}
				}
			}
		}
		NotifyAll();
	}

	void RemoveListener(RecordUpdateListener* listener)
	{
		{
			std::lock_guard<std::mutex> lock(m_listenersMutex);
			m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener), m_listeners.end());
		}
		NotifyAll();
	}

	void UpdateRecord(TimePoint now, const Record& record)
	{
		DispatchRecord(now, record);
		NotifyAll();
	}

	void Close()
	{
		if (m_closed.exchange(true, std::memory_order_acq_rel) == true) {
			return;
		}
		Log(LogLevel::Debug, "Zeroconf closing.");

		UnregisterAllServices(true);
		NotifyAll();

		m_running.store(false, std::memory_order_release);
		m_scheduler.Stop();
		if (m_listenThread.joinable() && m_listenThread.get_id() != std::this_thread::get_id()) {
			m_listenThread.join();
		}
		m_transport->Close();
		Log(LogLevel::Info, "Zeroconf closed.");
	}

private:
	bool Transmit(const OutgoingMessage& out, const std::optional<Endpoint>& destination)
	{
		bool sent = true;
		for (const auto& packet : out.Packets(m_settings.max_packet_size)) {
			if (packet.size() > kMaxMsgAbsolute) {
				m_backoff.Report("send-oversize", fmt::format("Dropping {} byte outgoing packet, limit is {} bytes",
				                                             packet.size(), kMaxMsgAbsolute));
				sent = false;
				continue;
			}
			try {
				m_transport->Send(packet, destination);
			}
			catch (const std::exception& e) {
				m_backoff.Report("send-error", fmt::format("Error sending packet: {}", e.what()));
				sent = false;
			}
		}
		return sent;
	}

	static void AddBroadcastAnswers(OutgoingMessage& out, const ServiceInfo& info, std::optional<std::uint32_t> ttl)
	{
		out.AddAnswer(info.DnsPointer(ttl));
		out.AddAnswer(info.DnsService(ttl));
		out.AddAnswer(info.DnsText(ttl));
		for (auto& address : info.DnsAddresses(ttl)) {
			out.AddAnswer(std::move(address));
		}
	}

	static void CheckServiceType(const ServiceInfo& info)
	{
		const auto name = info.Name();
		const auto type = ServiceTypeName(name);
		if (!EndsWith(info.Type(), type)) {
			Log(LogLevel::Error, fmt::format("Service name {} does not match type {}", name, info.Type()));
			throw BadTypeInNameError(fmt::format("Service name {} does not match type {}", name, info.Type()));
		}
	}

	// Someone else claims the name of info: another registered instance, or a
	// live PTR or SRV in the cache that does not describe the same service
	bool HasConflict(const ServiceInfo& info) const
	{
		const auto name = info.Name();
		const auto registered = m_registry.GetInfoName(name);
		if (registered && registered.get() != &info) {
			return true;
		}

		const auto now = Clock::now();
		const auto server = info.Server();
		const auto port = info.Port();
		const auto services = m_cache.GetAllByDetails(name, kTypeSrv, kClassIn, now);
		for (const auto& record : services) {
			const auto& service = std::get<ServiceRecord>(record);
			if (!EqualsIgnoreCase(service.server, server) || service.port != port) {
				return true;
			}
		}
		return services.empty() && m_cache.CurrentEntryWithNameAndAlias(info.Type(), name, now).has_value();
	}

	void Probe(ServiceInfo& info, bool allow_name_change)
	{
		const auto instance = info.InstanceName();
		const auto type = info.Type();
		int nextInstanceNumber = 2;
		int renames = 0;
		int probes = 0;
		auto next = Clock::now();

		while (true) {
			if (HasConflict(info)) {
				if (!allow_name_change || renames >= m_settings.max_name_changes) {
					Log(LogLevel::Error, fmt::format("Name is not unique: {}", info.Name()));
					throw NonUniqueNameError(info.Name());
				}
				info.SetName(fmt::format("{}-{}.{}", instance, nextInstanceNumber++, type));
				ServiceTypeName(info.Name());
				++renames;
				probes = 0;
				next = Clock::now();
				continue;
			}

			const auto now = Clock::now();
			if (now < next) {
				Wait(std::chrono::duration_cast<std::chrono::milliseconds>(next - now));
				continue;
			}
			// The window after the last probe passed without a conflict
			if (probes == kProbeCount) {
				break;
			}
			Send(GenerateServiceQuery(info), std::nullopt);
			++probes;
			next += m_settings.probe_interval;
		}

		if (renames > 0) {
			Log(LogLevel::Info, fmt::format("Renamed service to {} after {} conflict{}", info.Name(), renames,
			                                renames > 1 ? "s" : ""));
		}
	}

	void Announce(const ServiceInfo& info)
	{
		for (int i = 0; i < kAnnounceCount; ++i) {
			if (i > 0) {
				Pause(m_settings.announce_interval);
			}
			Send(GenerateServiceBroadcast(info, std::nullopt), std::nullopt);
		}
	}

	// Sleeps the full duration, notifications do not cut it short
	void Pause(std::chrono::milliseconds duration)
	{
		const auto deadline = Clock::now() + duration;
		std::unique_lock<std::mutex> lock(m_conditionMutex);
		while (Clock::now() < deadline) {
			m_condition.wait_until(lock, deadline);
		}
	}

	void DispatchRecord(TimePoint now, const Record& record)
	{
		std::lock_guard<std::mutex> lock(m_listenersMutex);
		for (auto* listener : m_listeners) {
			listener->UpdateRecord(m_owner, now, record);
		}
	}

	void CleanupCache()
	{
		const auto now = Clock::now();
		const auto expired = m_cache.Expire(now);
		for (const auto& record : expired) {
			DispatchRecord(now, record);
		}
		if (!expired.empty()) {
			Log(LogLevel::Debug, fmt::format("Expired {} cache entr{}", expired.size(), expired.size() == 1 ? "y" : "ies"));
			NotifyAll();
		}
	}

	void Reannounce()
	{
		for (const auto& info : m_registry.GetServiceInfos()) {
			Send(GenerateServiceBroadcast(*info, std::nullopt), std::nullopt);
		}
	}

	void ListenLoop()
	{
		Log(LogLevel::Debug, "Zeroconf listen loop started.");
		const DatagramHandler handler = [this](const std::vector<std::uint8_t>& data, const Endpoint& from){
			HandlePacket(data, from);
		};
		while (m_running.load(std::memory_order_acquire)) {
			try {
				if (!m_transport->Receive(kReceiveTimeout, handler)) {
					break;
				}
			}
			catch (const std::exception& e) {
				m_backoff.Report("receive-error", fmt::format("Error handling incoming packet: {}", e.what()));
			}
		}
		Log(LogLevel::Debug, "Zeroconf listen loop stopped.");
	}
};

Zeroconf::Zeroconf(ZeroconfSettings settings)
: m_impl(std::make_unique<ZeroconfImpl>(*this, std::move(settings)))
{
	m_impl->Start();
}

Zeroconf::~Zeroconf()
{
	// Threads may still call back into this object until Close() returns
	m_impl->Close();
}

void Zeroconf::RegisterService(const InfoPtr& info, std::optional<std::uint32_t> ttl, bool allow_name_change,
                               bool cooperating_responders)
{
	m_impl->RegisterService(info, ttl, allow_name_change, cooperating_responders);
}

void Zeroconf::UnregisterService(const InfoPtr& info)
{
	m_impl->UnregisterService(info);
}

void Zeroconf::UnregisterAllServices()
{
	m_impl->UnregisterAllServices(false);
}

void Zeroconf::UpdateService(const InfoPtr& info)
{
	m_impl->UpdateService(info);
}

Zeroconf::InfoPtr Zeroconf::GetServiceInfo(const std::string& type, const std::string& name,
                                           std::chrono::milliseconds timeout)
{
	auto info = std::make_shared<ServiceInfo>(type, name);
	if (info->Request(*this, timeout)) {
		return info;
	}
	return nullptr;
}

OutgoingMessage Zeroconf::GenerateServiceBroadcast(const ServiceInfo& info, std::optional<std::uint32_t> ttl) const
{
	return m_impl->GenerateServiceBroadcast(info, ttl);
}

OutgoingMessage Zeroconf::GenerateServiceQuery(const ServiceInfo& info) const
{
	return m_impl->GenerateServiceQuery(info);
}

bool Zeroconf::Send(const OutgoingMessage& out, const std::optional<Endpoint>& destination)
{
	return m_impl->Send(out, destination);
}

void Zeroconf::HandlePacket(const std::vector<std::uint8_t>& data, const Endpoint& from)
{
	m_impl->HandlePacket(data, from);
}

void Zeroconf::HandleResponse(const IncomingMessage& msg)
{
	m_impl->HandleResponse(msg);
}

void Zeroconf::HandleQuery(const IncomingMessage& msg, const Endpoint& from)
{
	m_impl->HandleQuery(msg, from);
}

void Zeroconf::AddNotifyListener(const std::shared_ptr<NotifyListener>& listener)
{
	m_impl->AddNotifyListener(listener);
}

void Zeroconf::RemoveNotifyListener(const std::shared_ptr<NotifyListener>& listener)
{
	m_impl->RemoveNotifyListener(listener);
}

void Zeroconf::NotifyAll()
{
	m_impl->NotifyAll();
}

void Zeroconf::Wait(std::chrono::milliseconds timeout)
{
	m_impl->Wait(timeout);
}

void Zeroconf::AddListener(RecordUpdateListener* listener, const std::optional<Question>& question)
{
	m_impl->AddListener(listener, question);
}

void Zeroconf::RemoveListener(RecordUpdateListener* listener)
{
	m_impl->RemoveListener(listener);
}

void Zeroconf::UpdateRecord(TimePoint now, const Record& record)
{
	m_impl->UpdateRecord(now, record);
}

Cache& Zeroconf::GetCache()
{
	return m_impl->GetCache();
}

ServiceRegistry& Zeroconf::Registry()
{
	return m_impl->Registry();
}

QueryHandler& Zeroconf::GetQueryHandler()
{
	return m_impl->GetQueryHandler();
}

const ZeroconfSettings& Zeroconf::Settings() const
{
	return m_impl->Settings();
}

void Zeroconf::Close()
{
	m_impl->Close();
}

bool Zeroconf::Closed() const
{
	return m_impl->Closed();
}

}
