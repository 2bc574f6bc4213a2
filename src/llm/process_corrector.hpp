// Copyright (c) 2025 VAM Desktop Live Whisper
// Client for the correction worker process
//
// Protocol: the worker prints "READY" once its model is loaded, then answers
// every request line with exactly one response line. Lines carry text with
// '\' escaped as "\\", newline as "\n" and carriage return as "\r".

#pragma once

#include "core/native_process.hpp"
#include "resource/resource_manager.hpp"
#include "text/correction_prompts.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace llm {

constexpr const char* kReadyLine = "READY";

std::string escape_line(const std::string& s);
std::string unescape_line(const std::string& s);

/// Trims, removes wrapping quotes, folds newlines and repeated whitespace.
std::string clean_model_output(const std::string& s);

struct CorrectorOptions {
    int context_length = 2048;
    std::chrono::milliseconds response_timeout{120000};
};

class ProcessCorrector {
public:
    explicit ProcessCorrector(CorrectorOptions options = {});

    /// Sends one prompt and waits for the answer. Throws std::runtime_error when the
    /// worker is gone, times out or answers with nothing; the worker is terminated
    /// on timeout because its next answer could no longer be matched to a request.
    std::string correct(core::NativeProcess& worker, const text::PromptRequest& request) const;

    /// Chunk budget: 60% of the context window, the rest is prompt and answer.
    int max_chunk_tokens() const;

    const CorrectorOptions& options() const { return options_; }

private:
    CorrectorOptions options_;
};

/// Loader for the correction class: spawns the worker (LoadConfig::command, or
/// default_command when empty) and waits for the READY line. A model path is passed
/// as "--model <path>", every extra as "--<key> <value>", except
/// extra["ready_timeout_ms"] which overrides the 120 s wait.
resource::Loader make_worker_loader(std::vector<std::string> default_command);

} // namespace llm
