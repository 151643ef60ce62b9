#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace pixoogate {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static Level level();

private:
    static Level threshold_;
    static std::mutex mutex_;
};

// Config parsing helpers ("debug", "info", "warn", "error"; unknown -> INFO)
Level string_to_level(const std::string& level_str);
std::string level_to_string(Level level);

} // namespace logging
} // namespace pixoogate

// Stream-style macros: LOG_INFO("[Registry] " << count << " devices")
#define LOG_INTERNAL(lvl, msg) \
    do { \
        if ((lvl) >= pixoogate::logging::Logger::level()) { \
            std::stringstream ss; \
            ss << msg; \
            pixoogate::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(pixoogate::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(pixoogate::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(pixoogate::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(pixoogate::logging::Level::LVL_ERROR, msg)
