#pragma once

#include "log.hpp"
#include "zeroconf_cpp/types.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace zeroconf_cpp
{

// Rate limits repeated warnings. The first report of a key is logged at Warn,
// reports of the same key within the window after that are logged at Debug.
class LogBackoff
{
public:
    explicit LogBackoff(std::chrono::milliseconds window);

    void Report(const std::string& key, std::string_view message);

private:
    std::chrono::milliseconds m_window;
    std::mutex m_mutex;
    std::unordered_map<std::string, TimePoint> m_lastWarned;
};

}
