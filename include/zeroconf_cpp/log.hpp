#pragma once

#include <functional>
#include <string_view>

namespace zeroconf_cpp
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

using LogCallback = std::function<void(LogLevel, std::string_view)>;

// Routes all library log output to callback. An empty callback restores the
// default, which prints to stdout.
void SetLogCallback(LogCallback callback);

// Minimum level printed by the default stdout sink. A callback sees everything.
void SetLogLevel(LogLevel level);

}
