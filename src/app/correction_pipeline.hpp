// Copyright (c) 2025 VAM Desktop Live Whisper
// Application API - Correction Pipeline
//
// Acquires the correction resource, chunks the transcript, corrects every
// chunk through the loaded worker, merges the results and releases the
// resource again. Falls back to rule-based correction when no worker can be
// loaded.

#pragma once

#include "resource/resource_manager.hpp"
#include "text/batch_processor.hpp"
#include "text/correction_prompts.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace app {

//==============================================================================
// Configuration Structures
//==============================================================================

struct CorrectionOptions {
    text::CorrectionLevel level = text::CorrectionLevel::Standard;
    std::string language = "de";
    bool dialect_normalization = false;
    int overlap_sentences = 1;
    int max_parallel_chunks = 1;     ///< 1 = sequential
    bool fallback_on_error = true;   ///< rule-based pass when the worker cannot load
    bool keep_loaded = false;        ///< skip the release after correcting
    bool neighbor_context = false;   ///< send the neighbouring chunks as prompt context
    resource::LoadConfig load_config;
};

/// One chunk as handed to the correction engine. Text and context are trimmed.
struct CorrectionRequest {
    std::string text;
    text::CorrectionLevel level = text::CorrectionLevel::Standard;
    std::string language;
    bool dialect_normalization = false;
    std::string prev_context;  ///< empty unless neighbor_context is set
    std::string next_context;
};

/// Runs one request against the loaded correction instance. May throw.
using CorrectionCallback = std::function<std::string(resource::ResourceHandle&, const CorrectionRequest&)>;

//==============================================================================
// Results
//==============================================================================

enum class CorrectionMethod {
    None,
    Llm,
    RuleBased
};

const char* to_string(CorrectionMethod method);

struct CorrectionOutcome {
    bool success = false;
    std::string corrected_text;
    std::vector<int> failed_chunks;       ///< chunk indices that kept their original text
    int chunks_processed = 0;
    double processing_time_s = 0.0;
    CorrectionMethod method = CorrectionMethod::None;
    std::string error;
    std::vector<std::string> rule_corrections;  ///< rule-based method only
    double improvement_score = 0.0;             ///< rule-based method only

    bool partial() const { return !failed_chunks.empty(); }
};

struct AvailabilityReport {
    bool available = false;           ///< model-based correction can run now
    bool fallback_available = true;   ///< rule-based correction always can
    bool worker_configured = false;
    bool memory_safe = false;
    double available_ram_gb = 0.0;
    double min_required_ram_gb = 4.0;
    double recommended_ram_gb = 8.0;
    std::string memory_message;
    std::string status;               ///< "ready" or "limited"
};

AvailabilityReport check_correction_availability(const resource::ResourceManager& resources,
                                                 bool worker_configured);

//==============================================================================
// Pipeline
//==============================================================================

class CorrectionPipeline {
public:
    /// max_chunk_tokens sizes the chunks; estimator defaults to the character ratio.
    CorrectionPipeline(resource::ResourceManager& resources,
                       CorrectionCallback callback,
                       int max_chunk_tokens,
                       std::shared_ptr<const text::TokenEstimator> estimator = nullptr);

    /// Blank text succeeds unchanged with method None.
    CorrectionOutcome correct(const std::string& text,
                              const CorrectionOptions& options,
                              const text::ProgressFunction& progress = {});

    /// Same as correct() with chunks prepared by the caller from text.
    CorrectionOutcome correct_prepared(const std::string& text,
                                       const std::vector<text::TextChunk>& chunks,
                                       const CorrectionOptions& options,
                                       const text::ProgressFunction& progress = {});

    int max_chunk_tokens() const { return max_chunk_tokens_; }

    /// Processor with this pipeline's budget, estimator and the language's sentence rules.
    text::BatchProcessor make_processor(const CorrectionOptions& options) const;

private:
    CorrectionOutcome run(const std::string& text,
                          const std::vector<text::TextChunk>* prepared,
                          const CorrectionOptions& options,
                          const text::ProgressFunction& progress);
    CorrectionOutcome rule_based(const std::string& text, const CorrectionOptions& options) const;

    resource::ResourceManager& resources_;
    CorrectionCallback callback_;
    int max_chunk_tokens_;
    std::shared_ptr<const text::TokenEstimator> estimator_;
};

} // namespace app
