#pragma once
#include <string>
#include <sstream>
#include <ostream>
#include <mutex>

namespace strata::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

// Stream-style logger. A message is buffered until Logger::endl and then
// written as one line: "[timestamp] [LEVEL] message".
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

    // Accepts "debug", "info", "warn" or "error" (any case). Unknown names map to INFO.
    static LogLevel parse_level(const std::string& name);

    // Redirects output; nullptr restores std::cout.
    static void set_output(std::ostream* out);

private:
    explicit Logger(LogLevel level);

    static Logger& instance_for(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
    static std::ostream* output_;
};

} // namespace strata::utils
