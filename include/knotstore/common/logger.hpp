#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace knotstore {

    enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4, FATAL = 5, OFF = 6 };

    struct LogEntry {
        LogLevel level;
        std::string category;
        std::string message;
        std::int64_t timestamp;
    };

    /// Process-wide logger shared by every worker thread
    class Logger {
      public:
        /// Open (append) a log file; console output stays enabled
        static bool init(const std::string &path);
        static void shutdown();

        static void setLevel(LogLevel level);
        static LogLevel getLevel();
        static void enableConsole(bool enable);
        static void setMaxFileSize(std::uint64_t bytes);
        static void setMaxFiles(std::uint32_t count);

        static void log(LogLevel level, const std::string &category, const std::string &msg);

        /// Observe every emitted entry (called with the logger lock held)
        static void onLog(std::function<void(const LogEntry &)> callback);

        static std::uint64_t getLogCount();
        static std::uint64_t getErrorCount();

        static LogLevel parseLevel(const std::string &name, LogLevel fallback = LogLevel::INFO);
        static const char *levelName(LogLevel level);
    };

} // namespace knotstore

#define KNOTSTORE_LOG_TRACE(cat, msg) ::knotstore::Logger::log(::knotstore::LogLevel::TRACE, cat, msg)
#define KNOTSTORE_LOG_DEBUG(cat, msg)                                                                                   \
    do {                                                                                                               \
        if (::knotstore::Logger::getLevel() <= ::knotstore::LogLevel::DEBUG)                                           \
            ::knotstore::Logger::log(::knotstore::LogLevel::DEBUG, cat, msg);                                          \
    } while (0)
#define KNOTSTORE_LOG_INFO(cat, msg) ::knotstore::Logger::log(::knotstore::LogLevel::INFO, cat, msg)
#define KNOTSTORE_LOG_WARN(cat, msg) ::knotstore::Logger::log(::knotstore::LogLevel::WARN, cat, msg)
#define KNOTSTORE_LOG_ERROR(cat, msg) ::knotstore::Logger::log(::knotstore::LogLevel::ERROR, cat, msg)
