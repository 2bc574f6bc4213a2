// Copyright (c) 2025 VAM Desktop Live Whisper
// Composition root: resource manager, correction worker and pipeline built from Config

#include "app/runtime.hpp"
#include "core/logging.hpp"

#include <stdexcept>

namespace app {

resource::ResourceManagerOptions resource_options_from_config(const core::Config& cfg) {
    resource::ResourceManagerOptions o;
    o.warning_threshold = cfg.memory_warning_threshold;
    o.critical_threshold = cfg.memory_critical_threshold;
    o.swap_settle = std::chrono::milliseconds(cfg.swap_settle_ms);
    o.unload_grace = std::chrono::milliseconds(cfg.unload_grace_ms);
    o.monitor_interval = std::chrono::milliseconds(cfg.monitor_interval_ms);
    return o;
}

CorrectionOptions correction_options_from_config(const core::Config& cfg) {
    CorrectionOptions o;
    o.level = text::parse_correction_level(cfg.correction_level);
    o.language = cfg.language;
    o.dialect_normalization = cfg.dialect_normalization;
    o.neighbor_context = cfg.neighbor_context;
    o.overlap_sentences = cfg.overlap_sentences;
    o.max_parallel_chunks = cfg.max_parallel_chunks;
    o.fallback_on_error = cfg.fallback_on_error;
    o.load_config.command = cfg.correction_command;
    o.load_config.model = cfg.correction_model_path;
    o.load_config.extra["temperature"] = std::to_string(cfg.temperature);
    o.load_config.extra["context_length"] = std::to_string(cfg.context_length);
    return o;
}

CorrectionCallback make_worker_callback(std::shared_ptr<const llm::ProcessCorrector> corrector) {
    return [corrector](resource::ResourceHandle& handle, const CorrectionRequest& req) {
        core::NativeProcess* worker = handle.process();
        if (!worker) {
            throw std::runtime_error("correction resource is not a worker process");
        }
        text::PromptRequest prompt;
        prompt.level = req.level;
        prompt.text = req.text;
        prompt.language = req.language;
        prompt.dialect_normalization = req.dialect_normalization;
        if (!req.prev_context.empty()) prompt.prev_context = req.prev_context;
        if (!req.next_context.empty()) prompt.next_context = req.next_context;
        return corrector->correct(*worker, prompt);
    };
}

Runtime::Runtime(const core::Config& cfg, std::shared_ptr<core::MemoryProbe> probe)
    : cfg_(cfg)
{
    resources_ = std::make_unique<resource::ResourceManager>(std::move(probe), resource_options_from_config(cfg_));
    resources_->register_loader(resource::ResourceClass::Correction,
                                llm::make_worker_loader(cfg_.correction_command));

    llm::CorrectorOptions co;
    co.context_length = cfg_.context_length;
    co.response_timeout = std::chrono::milliseconds(cfg_.response_timeout_ms);
    corrector_ = std::make_shared<const llm::ProcessCorrector>(co);

    std::shared_ptr<const text::TokenEstimator> estimator;
    if (cfg_.token_strategy == "whisper") {
        // Exact counts need a loaded whisper model; callers that have one pass prepared chunks.
        core::log_info("[runtime] whisper token counts apply to transcribe-and-correct only, using chars here");
        estimator = text::make_heuristic_estimator("chars");
    } else {
        estimator = text::make_heuristic_estimator(cfg_.token_strategy);
    }
    pipeline_ = std::make_unique<CorrectionPipeline>(*resources_, make_worker_callback(corrector_),
                                                     corrector_->max_chunk_tokens(), estimator);

    if (cfg_.monitoring_enabled) {
        resources_->enable_monitoring();
    }
}

AvailabilityReport Runtime::availability() const {
    return check_correction_availability(*resources_, worker_configured());
}

} // namespace app
