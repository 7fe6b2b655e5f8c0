#include "log_backoff.hpp"

namespace zeroconf_cpp
{

LogBackoff::LogBackoff(std::chrono::milliseconds window)
: m_window(window)
{}

void LogBackoff::Report(const std::string& key, std::string_view message)
{
    LogLevel level = LogLevel::Debug;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = Clock::now();
        auto it = m_lastWarned.find(key);
        if (it == m_lastWarned.end() || now - it->second >= m_window) {
            m_lastWarned[key] = now;
            level = LogLevel::Warn;
        }
    }
    Log(level, message);
}

}
