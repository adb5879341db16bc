#include "peerlink/core/logger.hpp"

#include <ctime>

namespace peerlink::core {

LogLevel Logger::current_level_ = LogLevel::INFO;
Logger::Sink Logger::sink_;
std::mutex Logger::mutex_;

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::resetSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
}

void Logger::write(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[" << oss.str() << "] [" << toString(level) << "] " << message << std::endl;
}

} // namespace peerlink::core
