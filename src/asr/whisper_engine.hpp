// Copyright (c) 2025 VAM Desktop Live Whisper
// whisper.cpp engine loaded as the transcription resource

#pragma once

#include "resource/resource_manager.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;

namespace asr {

struct TranscriptSegment {
    std::string text;
    int64_t t0_ms;  // start time in milliseconds
    int64_t t1_ms;  // end time in milliseconds
};

struct WhisperEngineOptions {
    std::string model = "small";  // name under models/ or a path to .gguf/.bin
    int threads = 0;              // 0 = hardware concurrency
    bool use_gpu = true;
    std::string language = "de";
};

class WhisperEngine : public resource::InProcessEngine {
public:
    explicit WhisperEngine(WhisperEngineOptions options);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    bool load();
    bool is_loaded() const { return ctx_ != nullptr; }

    // 16 kHz mono float PCM in [-1, 1]. Non-speech markers are dropped.
    std::vector<TranscriptSegment> transcribe(const std::vector<float>& pcm_16k);

    // Exact BPE token count, -1 if not loaded or tokenization failed.
    int count_tokens(const std::string& text) const;

    std::string name() const override;
    void shutdown() override;

    // models/<name>.gguf, models/ggml-<name>-q5_1.gguf, ... ; the name itself if it has an extension.
    static std::string resolve_model_path(const std::string& model_name);

private:
    WhisperEngineOptions options_;
    std::string model_path_;
    whisper_context* ctx_ = nullptr;
    whisper_state* state_ = nullptr;
    mutable std::mutex mutex_;
};

std::string join_segments(const std::vector<TranscriptSegment>& segments);

// Loader for the transcription class. LoadConfig::model/threads/use_gpu override the defaults.
resource::Loader make_whisper_loader(WhisperEngineOptions defaults);

} // namespace asr
