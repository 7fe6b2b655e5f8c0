#include "scheduler.hpp"
#include "random_utils.hpp"

#include <algorithm>

#include "log.hpp"
#include <fmt/format.h>

namespace zeroconf_cpp
{

namespace
{

constexpr int kMaxJitterMs = 20;

}

Scheduler::~Scheduler()
{
	Stop();
}

void Scheduler::AddTask(std::string name, std::chrono::milliseconds interval, Task task)
{
	if (interval.count() <= 0) {
		Log(LogLevel::Debug, fmt::format("Scheduler task {} disabled.", name));
		return;
	}
	const auto first = Clock::now() + interval + RandomMilliseconds(0, kMaxJitterMs);
	m_tasks.push_back(Entry{std::move(name), interval, std::move(task), first});
}

void Scheduler::Start()
{
	if (m_running.exchange(true, std::memory_order_acq_rel) == true) {
		Log(LogLevel::Debug, "Scheduler already started.");
		return;
	}
	m_thread = std::thread([this](){
		Run();
	});
}

void Scheduler::Stop()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_running.store(false, std::memory_order_release);
	}
	m_condition.notify_all();
	if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
		m_thread.join();
	}
}

void Scheduler::Run()
{
	Log(LogLevel::Debug, fmt::format("Scheduler running {} task{}.", m_tasks.size(), m_tasks.size() == 1 ? "" : "s"));
	while (m_running.load(std::memory_order_acquire)) {
		auto wakeup = Clock::now() + std::chrono::hours(1);
		for (const auto& entry : m_tasks) {
			wakeup = std::min(wakeup, entry.next);
		}

		{
			std::unique_lock<std::mutex> lock(m_mutex);
			m_condition.wait_until(lock, wakeup, [this](){
				return !m_running.load(std::memory_order_acquire);
			});
		}
		if (!m_running.load(std::memory_order_acquire)) {
			break;
		}

		const auto now = Clock::now();
		for (auto& entry : m_tasks) {
			if (entry.next > now) {
				continue;
			}
			try {
				entry.task();
			}
			catch (const std::exception& e) {
				Log(LogLevel::Warn, fmt::format("Scheduler task {} failed: {}", entry.name, e.what()));
			}
			entry.next = Clock::now() + entry.interval + RandomMilliseconds(0, kMaxJitterMs);
		}
	}
	Log(LogLevel::Debug, "Scheduler stopped.");
}

}
