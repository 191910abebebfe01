#include <lotbook/utils/logger.hpp>
#include <iostream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace lotbook::utils {

std::mutex Logger::sink_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::sink_ = nullptr;

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::instance_for(LogLevel level) {
    static thread_local Logger debug_logger(LogLevel::DEBUG);
    static thread_local Logger info_logger(LogLevel::INFO);
    static thread_local Logger warn_logger(LogLevel::WARN);
    static thread_local Logger error_logger(LogLevel::LOG_ERROR);

    Logger* logger = &info_logger;
    switch (level) {
        case LogLevel::DEBUG:
            logger = &debug_logger;
            break;
        case LogLevel::INFO:
            logger = &info_logger;
            break;
        case LogLevel::WARN:
            logger = &warn_logger;
            break;
        case LogLevel::LOG_ERROR:
            logger = &error_logger;
            break;
    }
    logger->stream_.str("");
    logger->stream_.clear();
    return *logger;
}

Logger& Logger::debug() {
    return instance_for(LogLevel::DEBUG);
}

Logger& Logger::info() {
    return instance_for(LogLevel::INFO);
}

Logger& Logger::warn() {
    return instance_for(LogLevel::WARN);
}

Logger& Logger::error() {
    return instance_for(LogLevel::LOG_ERROR);
}

Logger& Logger::operator<<(const EndlType&) {
    if (level_ >= current_level_) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count() % 1000;

        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::stringstream line;
        line << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
             << '.' << std::setfill('0') << std::setw(3) << ms << "] ";

        switch (level_) {
            case LogLevel::DEBUG:
                line << "[DEBUG] ";
                break;
            case LogLevel::INFO:
                line << "[INFO] ";
                break;
            case LogLevel::WARN:
                line << "[WARN] ";
                break;
            case LogLevel::LOG_ERROR:
                line << "[ERROR] ";
                break;
        }
        line << stream_.str();

        std::lock_guard<std::mutex> lock(sink_mutex_);
        std::ostream& out = sink_ ? *sink_ : std::cout;
        out << line.str() << std::endl;
    }

    stream_.str("");
    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::LOG_ERROR;
    return LogLevel::INFO;
}

void Logger::set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = sink;
}

} // namespace lotbook::utils
