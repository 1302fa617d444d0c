#pragma once

#include <string>

namespace netsweep::common
{
    enum class LogLevel
    {
        Debug = 0,
        Info,
        Warn,
        Error
    };

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel();
    bool IsLogEnabled(LogLevel level);

    // Accepts "debug", "info", "warn"/"warning", "error" (any case).
    bool ParseLogLevel(const std::string &text, LogLevel &out);

    // Writes "[tag] message". Info and Debug go to stdout, Warn and Error to stderr.
    void Log(LogLevel level, const std::string &tag, const std::string &message);

    inline void LogDebug(const std::string &tag, const std::string &message) { Log(LogLevel::Debug, tag, message); }
    inline void LogInfo(const std::string &tag, const std::string &message) { Log(LogLevel::Info, tag, message); }
    inline void LogWarn(const std::string &tag, const std::string &message) { Log(LogLevel::Warn, tag, message); }
    inline void LogError(const std::string &tag, const std::string &message) { Log(LogLevel::Error, tag, message); }
}
