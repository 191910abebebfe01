#pragma once
#include <string>
#include <sstream>
#include <mutex>
#include <ostream>

namespace lotbook::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};


class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Unknown names fall back to INFO
    static LogLevel parse_level(const std::string& name);

    // nullptr restores std::cout
    static void set_sink(std::ostream* sink);

private:
    explicit Logger(LogLevel level);
    static Logger& instance_for(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex sink_mutex_;
    static LogLevel current_level_;
    static std::ostream* sink_;
};

} // namespace lotbook::utils
