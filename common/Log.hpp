#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace net_watch::common
{
    inline std::mutex &LogMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    inline std::atomic<bool> &VerboseLogging()
    {
        static std::atomic<bool> verbose{false};
        return verbose;
    }

    inline void LogInfo(const std::string &tag, const std::string &message)
    {
        std::lock_guard<std::mutex> lock(LogMutex());
        std::cout << "[" << tag << "] " << message << std::endl;
    }

    inline void LogError(const std::string &tag, const std::string &message)
    {
        std::lock_guard<std::mutex> lock(LogMutex());
        std::cerr << "[" << tag << "] " << message << std::endl;
    }

    inline void LogDebug(const std::string &tag, const std::string &message)
    {
        if (!VerboseLogging())
            return;
        LogInfo(tag, message);
    }
}
