#pragma once

#include "zeroconf_cpp/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace zeroconf_cpp
{

// Runs periodic housekeeping tasks on one background thread. Each run is
// delayed by up to 20 ms of jitter so peers do not fire in lockstep.
class Scheduler
{
public:
	using Task = std::function<void()>;

	Scheduler() = default;
	~Scheduler();

	Scheduler(const Scheduler&) = delete;
	Scheduler& operator=(const Scheduler&) = delete;

	// Not thread safe, call this before Start(). A zero interval disables the task.
	void AddTask(std::string name, std::chrono::milliseconds interval, Task task);

	void Start();
	// Joins the thread, a no-op when called from a task
	void Stop();

private:
	struct Entry
	{
		std::string name;
		std::chrono::milliseconds interval;
		Task task;
		TimePoint next;
	};

	void Run();

	std::vector<Entry> m_tasks;
	std::atomic<bool> m_running{false};
	std::mutex m_mutex;
	std::condition_variable m_condition;
	std::thread m_thread;
};

}
