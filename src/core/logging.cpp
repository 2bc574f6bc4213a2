// Copyright (c) 2025 VAM Desktop Live Whisper
// Console logging shared by all subsystems

#include "core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {

namespace {

LogLevel initial_level() {
    if (std::getenv("WHISPER_DEBUG") != nullptr) return LogLevel::Debug;
    LogLevel lvl = LogLevel::Info;
    if (const char* env = std::getenv("LOCALSCRIBE_LOG_LEVEL")) {
        if (!parse_log_level(env, lvl)) lvl = LogLevel::Info;
    }
    return lvl;
}

std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

std::atomic<int>& level_storage() {
    static std::atomic<int> level{static_cast<int>(initial_level())};
    return level;
}

LogSink& sink_storage() {
    static LogSink sink;
    return sink;
}

void emit(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < level_storage().load()) return;

    std::string line = "[";
    line += log_level_name(level);
    line += "] ";
    line += msg;

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(output_mutex());
        if (level >= LogLevel::Warning) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
        sink = sink_storage();
    }
    // Sink runs outside the output lock so it may log itself.
    if (sink) {
        try {
            sink(level, line);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(output_mutex());
            std::cerr << "[ERROR] log sink failed: " << e.what() << std::endl;
        }
    }
}

} // namespace

void log_debug(const std::string& msg) { emit(LogLevel::Debug, msg); }
void log_info(const std::string& msg) { emit(LogLevel::Info, msg); }
void log_warn(const std::string& msg) { emit(LogLevel::Warning, msg); }
void log_error(const std::string& msg) { emit(LogLevel::Error, msg); }

void set_log_level(LogLevel level) {
    level_storage().store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_storage().load());
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(output_mutex());
    sink_storage() = std::move(sink);
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info") { out = LogLevel::Info; return true; }
    if (s == "warning" || s == "warn") { out = LogLevel::Warning; return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    return false;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool is_verbose() {
    return std::getenv("WHISPER_DEBUG") != nullptr;
}

} // namespace core
