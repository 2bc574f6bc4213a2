// Copyright (c) 2025 VAM Desktop Live Whisper
// Application API - Correction Pipeline Implementation

#include "app/correction_pipeline.hpp"
#include "core/logging.hpp"
#include "text/rule_based_corrector.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace app {

namespace {

using resource::ResourceClass;

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string trimmed(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

// Releases the correction resource on scope exit unless the caller keeps it.
class ReleaseGuard {
public:
    ReleaseGuard(resource::ResourceManager& rm, bool active) : rm_(rm), active_(active) {}
    ~ReleaseGuard() {
        if (active_) rm_.release(ResourceClass::Correction);
    }
    ReleaseGuard(const ReleaseGuard&) = delete;
    ReleaseGuard& operator=(const ReleaseGuard&) = delete;

private:
    resource::ResourceManager& rm_;
    bool active_;
};

} // namespace

const char* to_string(CorrectionMethod method) {
    switch (method) {
    case CorrectionMethod::None: return "none";
    case CorrectionMethod::Llm: return "llm";
    case CorrectionMethod::RuleBased: return "rule_based";
    }
    return "none";
}

AvailabilityReport check_correction_availability(const resource::ResourceManager& resources,
                                                 bool worker_configured) {
    AvailabilityReport r;
    const resource::StatusSnapshot st = resources.status();
    const resource::MetricsSnapshot m = resources.metrics();
    r.worker_configured = worker_configured;
    r.memory_safe = st.memory.safe;
    r.memory_message = st.memory.message;
    r.available_ram_gb = m.available_memory_gb;
    r.available = worker_configured && r.memory_safe && r.available_ram_gb >= r.min_required_ram_gb;
    r.status = r.available ? "ready" : "limited";
    return r;
}

CorrectionPipeline::CorrectionPipeline(resource::ResourceManager& resources,
                                       CorrectionCallback callback,
                                       int max_chunk_tokens,
                                       std::shared_ptr<const text::TokenEstimator> estimator)
    : resources_(resources)
    , callback_(std::move(callback))
    , max_chunk_tokens_(max_chunk_tokens)
    , estimator_(std::move(estimator))
{
    if (!callback_) {
        throw std::invalid_argument("CorrectionPipeline requires a correction callback");
    }
    if (max_chunk_tokens_ < 1) {
        throw std::invalid_argument("max_chunk_tokens must be >= 1");
    }
    if (!estimator_) estimator_ = std::make_shared<text::CharacterRatioEstimator>();
}

text::BatchProcessor CorrectionPipeline::make_processor(const CorrectionOptions& options) const {
    text::BatchOptions bo;
    bo.max_tokens = max_chunk_tokens_;
    bo.overlap_sentences = options.overlap_sentences;
    bo.max_workers = static_cast<size_t>(std::max(1, options.max_parallel_chunks));
    return text::BatchProcessor(bo, estimator_, text::make_sentence_splitter(options.language));
}

CorrectionOutcome CorrectionPipeline::correct(const std::string& text,
                                              const CorrectionOptions& options,
                                              const text::ProgressFunction& progress) {
    return run(text, nullptr, options, progress);
}

CorrectionOutcome CorrectionPipeline::correct_prepared(const std::string& text,
                                                       const std::vector<text::TextChunk>& chunks,
                                                       const CorrectionOptions& options,
                                                       const text::ProgressFunction& progress) {
    return run(text, &chunks, options, progress);
}

CorrectionOutcome CorrectionPipeline::rule_based(const std::string& text, const CorrectionOptions& options) const {
    const auto t0 = std::chrono::steady_clock::now();
    text::RuleBasedResult rb = text::rule_based_correct(text, options.dialect_normalization);
    CorrectionOutcome out;
    out.success = true;
    out.corrected_text = rb.corrected_text;
    out.method = CorrectionMethod::RuleBased;
    out.rule_corrections = rb.corrections;
    out.improvement_score = rb.improvement_score;
    out.error = "correction model unavailable, applied rule-based correction";
    out.processing_time_s = seconds_since(t0);
    core::log_warn("[pipeline] " + out.error + " (" + std::to_string(rb.corrections.size()) + " changes)");
    return out;
}

CorrectionOutcome CorrectionPipeline::run(const std::string& text,
                                          const std::vector<text::TextChunk>* prepared,
                                          const CorrectionOptions& options,
                                          const text::ProgressFunction& progress) {
    const auto t0 = std::chrono::steady_clock::now();
    CorrectionOutcome out;
    if (is_blank(text)) {
        out.success = true;
        out.corrected_text = text;
        return out;
    }
    // Configuration errors surface before any resource is touched
    text::BatchProcessor processor = make_processor(options);

    if (!resources_.acquire(ResourceClass::Correction, options.load_config)) {
        if (options.fallback_on_error) {
            return rule_based(text, options);
        }
        out.corrected_text = text;
        out.error = "correction resource could not be loaded";
        out.processing_time_s = seconds_since(t0);
        core::log_error("[pipeline] " + out.error);
        return out;
    }
    ReleaseGuard guard(resources_, !options.keep_loaded);

    const std::vector<text::TextChunk> chunks = prepared ? *prepared : processor.chunk(text);
    core::log_info("[pipeline] correcting " + std::to_string(chunks.size()) + " chunk(s), level " +
                   text::to_string(options.level));

    const text::ChunkFunction fn = [this, &options, &chunks](const text::TextChunk& chunk) {
        CorrectionRequest req;
        req.text = trimmed(chunk.text);
        req.level = options.level;
        req.language = options.language;
        req.dialect_normalization = options.dialect_normalization;
        if (options.neighbor_context) {
            const size_t i = static_cast<size_t>(chunk.index);
            if (i > 0 && i - 1 < chunks.size()) req.prev_context = trimmed(chunks[i - 1].text);
            if (i + 1 < chunks.size()) req.next_context = trimmed(chunks[i + 1].text);
        }
        std::string corrected;
        const bool ran = resources_.with_resource(ResourceClass::Correction,
                                                  [&](resource::ResourceHandle& handle) {
                                                      corrected = callback_(handle, req);
                                                  });
        if (!ran) {
            throw std::runtime_error("correction resource is not loaded");
        }
        return corrected;
    };

    const bool concurrent = options.max_parallel_chunks > 1 && chunks.size() > 1;
    text::BatchOutcome batch = concurrent
        ? processor.process_concurrent(chunks, fn, progress)
        : processor.process_sequential(chunks, fn, progress);

    out.corrected_text = batch.merged_text;
    out.failed_chunks = batch.failed_indices();
    out.chunks_processed = static_cast<int>(batch.results.size());
    out.method = CorrectionMethod::Llm;
    out.success = batch.failed_count < out.chunks_processed;
    if (!out.failed_chunks.empty()) {
        out.error = std::to_string(batch.failed_count) + " of " + std::to_string(out.chunks_processed) +
                    " chunk(s) kept their original text";
        core::log_warn("[pipeline] " + out.error);
    }
    out.processing_time_s = seconds_since(t0);
    return out;
}

} // namespace app
