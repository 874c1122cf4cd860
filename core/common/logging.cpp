#include "common/logging.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace gamcoach::logging {

namespace {

std::mutex g_logMutex;
LogLevel g_minLevel = LogLevel::Info;
std::string g_processName;
LogSink g_sink;

std::string timestampUtc() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

void writeLine(const std::string& line) {
    if (g_sink) {
        g_sink(line);
        return;
    }
    std::fprintf(stderr, "%s\n", line.c_str());
}

} // namespace

void initLogging(const std::string& process_name, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = process_name;
    g_minLevel = min_level;
}

void setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_minLevel = level;
}

LogLevel minLevel() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_minLevel;
}

void setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sink = std::move(sink);
}

std::string levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parseLevel(const std::string& value) {
    if (value == "debug" || value == "DEBUG") return LogLevel::Debug;
    if (value == "info" || value == "INFO") return LogLevel::Info;
    if (value == "warn" || value == "WARN") return LogLevel::Warn;
    if (value == "error" || value == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

std::string processName() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_processName.empty() ? std::string("gamcoach") : g_processName;
}

void logEvent(LogLevel level,
              const std::string& component,
              const std::string& where,
              const std::string& what,
              const nlohmann::json& context) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (static_cast<int>(level) < static_cast<int>(g_minLevel)) {
        return;
    }

    nlohmann::json payload = {
        {"ts", timestampUtc()},
        {"level", levelToString(level)},
        {"process", g_processName.empty() ? std::string("gamcoach") : g_processName},
        {"component", component},
        {"where", where},
        {"what", what},
        {"context", context}
    };
    writeLine(payload.dump());
}

} // namespace gamcoach::logging
