// Copyright (c) 2025 VAM Desktop Live Whisper
// Console logging shared by all subsystems

#pragma once

#include <functional>
#include <string>

namespace core {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Receives every emitted line ("[INFO] message") after it was written to the console.
using LogSink = std::function<void(LogLevel, const std::string&)>;

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

void set_log_level(LogLevel level);
LogLevel log_level();

// Install an additional sink; pass an empty function to remove it.
void set_log_sink(LogSink sink);

// Parses "debug", "info", "warning"/"warn", "error". Returns false for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);
const char* log_level_name(LogLevel level);

// True when WHISPER_DEBUG is set in the environment.
bool is_verbose();

} // namespace core
