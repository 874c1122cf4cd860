#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace gamcoach::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/// Receives one serialized JSON line per event.
using LogSink = std::function<void(const std::string& line)>;

// Initialize logging for the current process. Call early in main().
void initLogging(const std::string& process_name, LogLevel min_level = LogLevel::Info);

void setMinLevel(LogLevel level);
LogLevel minLevel();

/// Replace the output sink. Passing an empty sink restores stderr.
void setSink(LogSink sink);

std::string levelToString(LogLevel level);
std::optional<LogLevel> parseLevel(const std::string& value);

// Structured log event. Events below the configured level are dropped.
void logEvent(LogLevel level,
              const std::string& component,
              const std::string& where,
              const std::string& what,
              const nlohmann::json& context = nlohmann::json::object());

std::string processName();

} // namespace gamcoach::logging

#define GCLOG_DEBUG(component, where, what, ctxJson) \
    ::gamcoach::logging::logEvent(::gamcoach::logging::LogLevel::Debug, \
                                  (component), (where), (what), (ctxJson))

#define GCLOG_INFO(component, where, what, ctxJson) \
    ::gamcoach::logging::logEvent(::gamcoach::logging::LogLevel::Info, \
                                  (component), (where), (what), (ctxJson))

#define GCLOG_WARN(component, where, what, ctxJson) \
    ::gamcoach::logging::logEvent(::gamcoach::logging::LogLevel::Warn, \
                                  (component), (where), (what), (ctxJson))

#define GCLOG_ERROR(component, where, what, ctxJson) \
    ::gamcoach::logging::logEvent(::gamcoach::logging::LogLevel::Error, \
                                  (component), (where), (what), (ctxJson))
