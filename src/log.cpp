#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace zeroconf_cpp
{

namespace
{

std::mutex& CallbackMutex()
{
    static std::mutex mutex;
    return mutex;
}

LogCallback& Callback()
{
    static LogCallback callback;
    return callback;
}

std::atomic<LogLevel> g_level{LogLevel::Info};

const char* LevelName(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "";
}

}

void SetLogCallback(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(CallbackMutex());
    Callback() = std::move(callback);
}

void SetLogLevel(LogLevel level)
{
    g_level.store(level);
}

void Log(LogLevel level, std::string_view string)
{
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(CallbackMutex());
        callback = Callback();
    }
    if (callback) {
        callback(level, string);
        return;
    }
    if (level < g_level.load()) {
        return;
    }
    std::cout << "[zeroconf " << LevelName(level) << "] " << string << "\n";
}

}
