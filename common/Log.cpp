#include "Log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace netsweep::common
{
    namespace
    {
        std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
        std::mutex g_output_mutex;
    }

    void SetLogLevel(LogLevel level)
    {
        g_level = static_cast<int>(level);
    }

    LogLevel GetLogLevel()
    {
        return static_cast<LogLevel>(g_level.load());
    }

    bool IsLogEnabled(LogLevel level)
    {
        return static_cast<int>(level) >= g_level.load();
    }

    bool ParseLogLevel(const std::string &text, LogLevel &out)
    {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug")
            out = LogLevel::Debug;
        else if (lower == "info")
            out = LogLevel::Info;
        else if (lower == "warn" || lower == "warning")
            out = LogLevel::Warn;
        else if (lower == "error")
            out = LogLevel::Error;
        else
            return false;
        return true;
    }

    void Log(LogLevel level, const std::string &tag, const std::string &message)
    {
        if (!IsLogEnabled(level))
            return;

        // Probes log from many threads at once; keep lines whole.
        std::lock_guard<std::mutex> lock(g_output_mutex);
        std::ostream &out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
        out << "[" << tag << "] " << message << "\n";
    }
}
