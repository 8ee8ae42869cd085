#pragma once

#include <cstdarg>
#include <optional>
#include <string_view>

namespace ue {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::ue::Logger::Instance().LogWithSource(::ue::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::ue::Logger::Instance().LogWithSource(::ue::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::ue::Logger::Instance().LogWithSource(::ue::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::ue::Logger::Instance().LogWithSource(::ue::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace ue
