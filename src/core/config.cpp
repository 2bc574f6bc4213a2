// Copyright (c) 2025 VAM Desktop Live Whisper
// Process configuration: defaults, key=value file, environment overrides

#include "core/config.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace core {

namespace {

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool parse_bool(const std::string& v, bool& out) {
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

bool parse_int(const std::string& v, int& out) {
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.size()) return false;
        out = n;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const std::string& v, double& out) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) return false;
        out = d;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

const char* const kKeys[] = {
    "log_level", "whisper_model", "whisper_threads", "use_gpu", "transcription_language",
    "correction_command", "correction_model_path", "context_length", "temperature",
    "correction_level", "language", "dialect_normalization", "neighbor_context", "overlap_sentences",
    "max_parallel_chunks", "fallback_on_error", "response_timeout_ms", "token_strategy",
    "memory_warning_threshold", "memory_critical_threshold", "swap_settle_ms",
    "unload_grace_ms", "monitor_interval_ms", "monitoring_enabled",
};

} // namespace

std::vector<std::string> split_command_line(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    bool have_token = false;
    for (char c : s) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_token = true;
        } else if (!in_quotes && std::isspace(static_cast<unsigned char>(c))) {
            if (have_token) {
                out.push_back(cur);
                cur.clear();
                have_token = false;
            }
        } else {
            cur.push_back(c);
            have_token = true;
        }
    }
    if (have_token) out.push_back(cur);
    return out;
}

bool apply_config_value(Config& cfg, const std::string& key, const std::string& value) {
    if (key == "log_level") {
        LogLevel lvl;
        if (!parse_log_level(value, lvl)) return false;
        cfg.log_level = value;
        return true;
    }
    if (key == "whisper_model") { cfg.whisper_model = value; return true; }
    if (key == "whisper_threads") return parse_int(value, cfg.whisper_threads);
    if (key == "use_gpu") return parse_bool(value, cfg.use_gpu);
    if (key == "transcription_language") { cfg.transcription_language = value; return true; }
    if (key == "correction_command") { cfg.correction_command = split_command_line(value); return true; }
    if (key == "correction_model_path") { cfg.correction_model_path = value; return true; }
    if (key == "context_length") return parse_int(value, cfg.context_length) && cfg.context_length > 0;
    if (key == "temperature") return parse_double(value, cfg.temperature);
    if (key == "correction_level") { cfg.correction_level = value; return true; }
    if (key == "language") { cfg.language = value; return true; }
    if (key == "dialect_normalization") return parse_bool(value, cfg.dialect_normalization);
    if (key == "neighbor_context") return parse_bool(value, cfg.neighbor_context);
    if (key == "overlap_sentences") return parse_int(value, cfg.overlap_sentences) && cfg.overlap_sentences >= 0;
    if (key == "max_parallel_chunks") return parse_int(value, cfg.max_parallel_chunks) && cfg.max_parallel_chunks >= 1;
    if (key == "fallback_on_error") return parse_bool(value, cfg.fallback_on_error);
    if (key == "response_timeout_ms") return parse_int(value, cfg.response_timeout_ms);
    if (key == "token_strategy") {
        if (value != "chars" && value != "words" && value != "whisper") return false;
        cfg.token_strategy = value;
        return true;
    }
    if (key == "memory_warning_threshold") return parse_double(value, cfg.memory_warning_threshold);
    if (key == "memory_critical_threshold") return parse_double(value, cfg.memory_critical_threshold);
    if (key == "swap_settle_ms") return parse_int(value, cfg.swap_settle_ms);
    if (key == "unload_grace_ms") return parse_int(value, cfg.unload_grace_ms);
    if (key == "monitor_interval_ms") return parse_int(value, cfg.monitor_interval_ms);
    if (key == "monitoring_enabled") return parse_bool(value, cfg.monitoring_enabled);
    return false;
}

bool load_config(const std::string& path, Config& cfg) {
    std::ifstream f(path);
    if (!f) {
        log_error("[config] cannot open " + path);
        return false;
    }
    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        size_t eq = t.find('=');
        if (eq == std::string::npos) {
            log_warn("[config] " + path + ":" + std::to_string(line_no) + ": expected key = value");
            continue;
        }
        std::string key = trim(t.substr(0, eq));
        std::string value = trim(t.substr(eq + 1));
        if (!apply_config_value(cfg, key, value)) {
            log_warn("[config] " + path + ":" + std::to_string(line_no) + ": ignoring '" + key + "'");
        }
    }
    return true;
}

void apply_env_overrides(Config& cfg) {
    for (const char* key : kKeys) {
        std::string env_name = "LOCALSCRIBE_";
        for (const char* p = key; *p; ++p) {
            env_name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
        }
        const char* v = std::getenv(env_name.c_str());
        if (!v) continue;
        if (!apply_config_value(cfg, key, trim(v))) {
            log_warn("[config] ignoring " + env_name + "=" + v);
        }
    }
}

const Config& get_config() {
    static const Config cfg = [] {
        Config c;
        if (const char* path = std::getenv("LOCALSCRIBE_CONFIG")) {
            if (!load_config(path, c)) log_warn("[config] falling back to defaults");
        }
        apply_env_overrides(c);
        LogLevel lvl;
        if (parse_log_level(c.log_level, lvl) && std::getenv("WHISPER_DEBUG") == nullptr) {
            set_log_level(lvl);
        }
        return c;
    }();
    return cfg;
}

} // namespace core
