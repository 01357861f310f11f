#pragma once

// Compile-time floor of the logging macros. CMake forwards the
// TEMPUS_LOG_LEVEL option here; statements below the floor compile away.
#define TEMPUS_LOG_LEVEL_TRACE 0
#define TEMPUS_LOG_LEVEL_DEBUG 1
#define TEMPUS_LOG_LEVEL_INFO 2
#define TEMPUS_LOG_LEVEL_WARN 3
#define TEMPUS_LOG_LEVEL_ERROR 4
#define TEMPUS_LOG_LEVEL_OFF 6

#ifndef TEMPUS_LOG_LEVEL
#  define TEMPUS_LOG_LEVEL TEMPUS_LOG_LEVEL_DEBUG
#endif

#ifndef SPDLOG_ACTIVE_LEVEL
#  if TEMPUS_LOG_LEVEL == TEMPUS_LOG_LEVEL_TRACE
#    define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#  elif TEMPUS_LOG_LEVEL == TEMPUS_LOG_LEVEL_DEBUG
#    define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#  elif TEMPUS_LOG_LEVEL == TEMPUS_LOG_LEVEL_INFO
#    define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#  elif TEMPUS_LOG_LEVEL == TEMPUS_LOG_LEVEL_WARN
#    define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#  elif TEMPUS_LOG_LEVEL == TEMPUS_LOG_LEVEL_ERROR
#    define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#  else
#    define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#  endif
#endif

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

#include <cstdlib>

namespace tempus {

namespace detail {

/**
 * Runtime level named by the TEMPUS_LOG_LEVEL environment variable
 * (trace, debug, info, warn, error, off); warn when unset or unknown.
 */
inline spdlog::level::level_enum level_from_environment() noexcept {
    const char* value = std::getenv("TEMPUS_LOG_LEVEL");
    if (value == nullptr) {
        return spdlog::level::warn;
    }
    const std::string_view name{value};
    if (name == "trace") {
        return spdlog::level::trace;
    }
    if (name == "debug") {
        return spdlog::level::debug;
    }
    if (name == "info") {
        return spdlog::level::info;
    }
    if (name == "warn" || name == "warning") {
        return spdlog::level::warn;
    }
    if (name == "error") {
        return spdlog::level::err;
    }
    if (name == "off" || name == "quiet") {
        return spdlog::level::off;
    }
    return spdlog::level::warn;
}

/**
 * The library logger, named "tempus".
 *
 * An application that registered its own "tempus" logger with spdlog gets
 * that one; otherwise a colored stderr logger is created on first use.
 */
inline std::shared_ptr<spdlog::logger>& logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("tempus")) {
            return existing;
        }
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto created = std::make_shared<spdlog::logger>("tempus", std::move(sink));
        created->set_level(level_from_environment());
        return created;
    }();
    return instance;
}

} // namespace detail

/// Adjusts the runtime level of the library logger
inline void set_log_level(spdlog::level::level_enum level) {
    detail::logger()->set_level(level);
}

} // namespace tempus

#define TEMPUS_TRACE(...) SPDLOG_LOGGER_TRACE(::tempus::detail::logger(), __VA_ARGS__)
#define TEMPUS_DEBUG(...) SPDLOG_LOGGER_DEBUG(::tempus::detail::logger(), __VA_ARGS__)
#define TEMPUS_INFO(...) SPDLOG_LOGGER_INFO(::tempus::detail::logger(), __VA_ARGS__)
#define TEMPUS_WARN(...) SPDLOG_LOGGER_WARN(::tempus::detail::logger(), __VA_ARGS__)
#define TEMPUS_ERROR(...) SPDLOG_LOGGER_ERROR(::tempus::detail::logger(), __VA_ARGS__)
