#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace csync::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

enum class Category : int {
    App = 0,
    Net,
    Data,
    Cache,
    Db,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, Category category, const std::string& message);
const char* levelToString(Level level) noexcept;
const char* categoryToString(Category category) noexcept;
Level levelFromString(std::string_view text);

}  // namespace csync::log

#define CSYNC_LOG_IMPL(level, category, expr)                                              \
    do {                                                                                   \
        if (::csync::log::shouldLog(level)) {                                              \
            std::ostringstream csync_log_stream__;                                         \
            csync_log_stream__ << expr;                                                    \
            ::csync::log::log(level, (category), csync_log_stream__.str());                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(cat, expr) CSYNC_LOG_IMPL(::csync::log::Level::Debug, cat, expr)
#define LOG_INFO(cat, expr) CSYNC_LOG_IMPL(::csync::log::Level::Info, cat, expr)
#define LOG_WARN(cat, expr) CSYNC_LOG_IMPL(::csync::log::Level::Warn, cat, expr)
#define LOG_ERR(cat, expr) CSYNC_LOG_IMPL(::csync::log::Level::Error, cat, expr)
