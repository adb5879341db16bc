#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <functional>

namespace peerlink::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* toString(LogLevel level);

class Logger {
public:
    // Sink menerima level dan pesan yang sudah diformat
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Replace the console sink, e.g. to capture output in tests.
    static void setSink(Sink sink);
    static void resetSink();

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static std::string formatMessage(const std::string& format, Args&&... args) {
        return formatString(format, std::forward<Args>(args)...);
    }

private:
    static LogLevel current_level_;
    static Sink sink_;
    static std::mutex mutex_;

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        Sink sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < current_level_) return;
            sink = sink_;
        }

        std::string message = formatString(format, std::forward<Args>(args)...);
        if (sink) {
            sink(level, message);
            return;
        }

        write(level, message);
    }

    static void write(LogLevel level, const std::string& message);

    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string head = format.substr(0, pos) + oss.str();
            return head + formatString(format.substr(pos + 2), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }
};

} // namespace peerlink::core
