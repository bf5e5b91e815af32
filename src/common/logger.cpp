#include <knotstore/common/logger.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace knotstore {

    namespace {
        std::atomic<LogLevel> current_level{LogLevel::INFO};
        std::atomic<bool> console_enabled{true};
        std::ofstream log_file;
        std::string log_path;
        std::uint64_t max_file_size = 10 * 1024 * 1024;
        std::uint32_t max_files = 5;
        std::atomic<std::uint64_t> log_count{0};
        std::atomic<std::uint64_t> error_count{0};
        std::function<void(const LogEntry &)> log_callback;
        std::mutex log_mutex;

        // Shift app.log -> app.log.1 -> ... and reopen; caller holds log_mutex
        void rotateLocked() {
            if (log_path.empty())
                return;
            log_file.close();
            std::error_code ec;
            for (std::uint32_t i = max_files; i > 1; --i) {
                std::string from = log_path + "." + std::to_string(i - 1);
                std::string to = log_path + "." + std::to_string(i);
                if (std::filesystem::exists(from, ec))
                    std::filesystem::rename(from, to, ec);
            }
            if (max_files > 0)
                std::filesystem::rename(log_path, log_path + ".1", ec);
            log_file.open(log_path, std::ios::app);
        }
    } // namespace

    bool Logger::init(const std::string &path) {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::filesystem::path p(path);
        std::error_code ec;
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path(), ec);
        if (log_file.is_open())
            log_file.close();
        log_file.open(path, std::ios::app);
        log_path = path;
        return log_file.is_open();
    }

    void Logger::shutdown() {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (log_file.is_open()) {
            log_file.flush();
            log_file.close();
        }
        log_path.clear();
        log_callback = nullptr;
    }

    void Logger::setLevel(LogLevel level) { current_level = level; }

    LogLevel Logger::getLevel() { return current_level; }

    void Logger::enableConsole(bool enable) { console_enabled = enable; }

    void Logger::setMaxFileSize(std::uint64_t bytes) {
        std::lock_guard<std::mutex> lock(log_mutex);
        max_file_size = bytes;
    }

    void Logger::setMaxFiles(std::uint32_t count) {
        std::lock_guard<std::mutex> lock(log_mutex);
        max_files = count;
    }

    void Logger::onLog(std::function<void(const LogEntry &)> callback) {
        std::lock_guard<std::mutex> lock(log_mutex);
        log_callback = std::move(callback);
    }

    std::uint64_t Logger::getLogCount() { return log_count; }

    std::uint64_t Logger::getErrorCount() { return error_count; }

    const char *Logger::levelName(LogLevel level) {
        switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARN:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "?????";
        }
    }

    LogLevel Logger::parseLevel(const std::string &raw, LogLevel fallback) {
        std::string name = raw;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "trace")
            return LogLevel::TRACE;
        if (name == "debug")
            return LogLevel::DEBUG;
        if (name == "info")
            return LogLevel::INFO;
        if (name == "warn" || name == "warning")
            return LogLevel::WARN;
        if (name == "error")
            return LogLevel::ERROR;
        if (name == "fatal")
            return LogLevel::FATAL;
        if (name == "off")
            return LogLevel::OFF;
        return fallback;
    }

    void Logger::log(LogLevel level, const std::string &category, const std::string &msg) {
        if (level < current_level || level == LogLevel::OFF)
            return;

        auto now = std::chrono::system_clock::now();
        std::time_t now_t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&now_t, &tm_buf);
        char time_buf[32];
        std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

        std::ostringstream oss;
        oss << time_buf << " [" << levelName(level) << "]";
        if (!category.empty())
            oss << " [" << category << "]";
        oss << " " << msg << "\n";
        std::string line = oss.str();

        std::lock_guard<std::mutex> lock(log_mutex);
        if (console_enabled) {
            if (level >= LogLevel::ERROR)
                std::cerr << line;
            else
                std::cout << line;
        }

        if (log_file.is_open()) {
            log_file << line;
            log_file.flush();
            if (log_file.tellp() > static_cast<std::streampos>(max_file_size))
                rotateLocked();
        }

        log_count++;
        if (level >= LogLevel::ERROR)
            error_count++;

        if (log_callback)
            log_callback(LogEntry{level, category, msg, static_cast<std::int64_t>(now_t)});
    }

} // namespace knotstore
