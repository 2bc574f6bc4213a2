// Copyright (c) 2025 VAM Desktop Live Whisper
// Process configuration: defaults, key=value file, environment overrides

#pragma once

#include <string>
#include <vector>

namespace core {

struct Config {
    // Logging
    std::string log_level = "info";

    // Transcription (whisper.cpp)
    std::string whisper_model = "small"; // or "base"
    int whisper_threads = 0;             // 0 = hardware concurrency
    bool use_gpu = true;
    std::string transcription_language = "de";

    // Correction worker
    std::vector<std::string> correction_command; // argv; empty = not configured
    std::string correction_model_path;
    int context_length = 2048;
    double temperature = 0.3;
    std::string correction_level = "standard";
    std::string language = "de";
    bool dialect_normalization = false;
    bool neighbor_context = false;       // neighbouring chunks as prompt context
    int overlap_sentences = 1;
    int max_parallel_chunks = 1; // 1 = sequential
    bool fallback_on_error = true;
    int response_timeout_ms = 120000;
    std::string token_strategy = "chars"; // chars | words | whisper

    // Resource manager
    double memory_warning_threshold = 0.80;
    double memory_critical_threshold = 0.90;
    int swap_settle_ms = 2500;
    int unload_grace_ms = 5000;
    int monitor_interval_ms = 10000;
    bool monitoring_enabled = false;
};

// Applies one key/value pair. Returns false for unknown keys or unparsable values.
bool apply_config_value(Config& cfg, const std::string& key, const std::string& value);

// Reads "key = value" lines into cfg. Unknown keys are logged and skipped.
// Returns false when the file cannot be opened.
bool load_config(const std::string& path, Config& cfg);

// Applies LOCALSCRIBE_<UPPER_KEY> environment variables on top of cfg.
void apply_env_overrides(Config& cfg);

// Splits a command line on whitespace, honouring double quotes.
std::vector<std::string> split_command_line(const std::string& s);

// Process configuration: defaults, then the file named by LOCALSCRIBE_CONFIG, then environment.
const Config& get_config();

} // namespace core
