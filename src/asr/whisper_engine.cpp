// Copyright (c) 2025 VAM Desktop Live Whisper
// whisper.cpp engine loaded as the transcription resource

#include "asr/whisper_engine.hpp"
#include "core/logging.hpp"

#include "whisper.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>

namespace asr {

namespace {

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (core::is_verbose()) std::fputs(text, stderr);
        break;
    }
}

void trim(std::string& x) {
    size_t a = x.find_first_not_of(" \t\r\n");
    size_t b = x.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { x.clear(); return; }
    x = x.substr(a, b - a + 1);
}

bool is_non_speech(const std::string& s) {
    if (s == "[BLANK_AUDIO]" || s == "[ Silence ]" || s == "[silence]" || s == "[ Silence]") return true;
    // A single bracketed or parenthesised token, e.g. "[Musik]" or "(lacht)"
    if (s.size() > 2 && ((s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')'))) return true;
    return false;
}

} // anonymous namespace

WhisperEngine::WhisperEngine(WhisperEngineOptions options)
    : options_(std::move(options)) {}

WhisperEngine::~WhisperEngine() {
    shutdown();
}

std::string WhisperEngine::resolve_model_path(const std::string& model_name) {
    auto exists = [](const std::string& p) {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::u8path(p), ec);
    };
    const bool has_ext = (model_name.find(".gguf") != std::string::npos) ||
                         (model_name.find(".bin") != std::string::npos);
    if (has_ext) return model_name;

    const std::string candidates[] = {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
    for (const auto& c : candidates) {
        if (exists(c)) return c;
    }
    return candidates[0]; // fallback, may fail
}

bool WhisperEngine::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx_) return true;
    model_path_ = resolve_model_path(options_.model);

    // Set logging verbosity before creating context to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options_.use_gpu;
    core::log_info("[whisper] init from: " + model_path_);
    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
    if (!ctx_) {
        core::log_error("[whisper] init FAILED for path: " + model_path_);
        return false;
    }
    if (core::is_verbose()) {
        core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    }
    // persistent state for repeated calls
    state_ = whisper_init_state(ctx_);
    if (!state_) {
        core::log_error("[whisper] state allocation failed");
        whisper_free(ctx_);
        ctx_ = nullptr;
        return false;
    }
    core::log_info("[whisper] init OK: " + model_path_);
    return true;
}

std::vector<TranscriptSegment> WhisperEngine::transcribe(const std::vector<float>& pcm_16k) {
    std::vector<TranscriptSegment> out;
    if (pcm_16k.empty()) return out;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ctx_ || !state_) {
        throw std::runtime_error("whisper engine not loaded");
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    const bool verbose = core::is_verbose();
    wparams.print_realtime   = false;
    wparams.print_progress   = verbose;
    wparams.print_timestamps = verbose;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = options_.language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = options_.threads > 0
                                   ? options_.threads
                                   : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    wparams.token_timestamps = false;
    wparams.greedy.best_of   = 1;
    if (verbose) {
        wparams.progress_callback = [](whisper_context*, whisper_state*, int progress, void*) {
            core::log_debug("[whisper] progress: " + std::to_string(progress) + "%");
        };
    }

    core::log_debug("[whisper] running on samples=" + std::to_string(pcm_16k.size()) +
                    ", threads=" + std::to_string(wparams.n_threads));
    const int ret = whisper_full_with_state(ctx_, state_, wparams, pcm_16k.data(),
                                            static_cast<int>(pcm_16k.size()));
    if (ret != 0) {
        throw std::runtime_error("whisper_full failed, ret=" + std::to_string(ret));
    }

    const int n = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state_, i);
        if (!txt) continue;
        std::string s(txt);
        trim(s);
        if (s.empty() || is_non_speech(s)) continue;
        // whisper timestamps are in 10 ms units
        out.push_back({s,
                       whisper_full_get_segment_t0_from_state(state_, i) * 10,
                       whisper_full_get_segment_t1_from_state(state_, i) * 10});
    }
    if (verbose) whisper_print_timings(ctx_);
    return out;
}

int WhisperEngine::count_tokens(const std::string& text) const {
    if (text.empty()) return 0;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ctx_) return -1;
    std::vector<whisper_token> tokens(text.size() + 8);
    int n = whisper_tokenize(ctx_, text.c_str(), tokens.data(), static_cast<int>(tokens.size()));
    if (n < 0) {
        // Negative result is the required buffer size
        tokens.resize(static_cast<size_t>(-n));
        n = whisper_tokenize(ctx_, text.c_str(), tokens.data(), static_cast<int>(tokens.size()));
    }
    return n < 0 ? -1 : n;
}

std::string WhisperEngine::name() const {
    return "whisper:" + options_.model;
}

void WhisperEngine::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_) {
        whisper_free_state(state_);
        state_ = nullptr;
    }
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
        core::log_info("[whisper] context freed: " + model_path_);
    }
}

std::string join_segments(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        if (!out.empty()) out.push_back(' ');
        out += s.text;
    }
    return out;
}

resource::Loader make_whisper_loader(WhisperEngineOptions defaults) {
    return [defaults](resource::ResourceClass, const resource::LoadConfig& cfg) {
        WhisperEngineOptions opts = defaults;
        if (!cfg.model.empty()) opts.model = cfg.model;
        if (cfg.threads > 0) opts.threads = cfg.threads;
        opts.use_gpu = opts.use_gpu && cfg.use_gpu;
        auto it = cfg.extra.find("language");
        if (it != cfg.extra.end()) opts.language = it->second;

        auto engine = std::make_unique<WhisperEngine>(opts);
        if (!engine->load()) {
            throw std::runtime_error("failed to load whisper model " + opts.model);
        }
        return resource::ResourceHandle::in_process(std::move(engine));
    };
}

} // namespace asr
