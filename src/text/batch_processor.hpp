// Copyright (c) 2025 VAM Desktop Live Whisper
// Chunker - splits long text into overlapping sentence-aligned chunks,
// runs a per-chunk function over them and merges the results back.

#pragma once

#include "text/sentence_splitter.hpp"
#include "text/text_chunk.hpp"
#include "text/token_estimator.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace text {

struct BatchOptions {
    int max_tokens = 2048;       ///< target token budget per chunk
    int overlap_sentences = 1;   ///< sentences repeated at the start of the next chunk
    size_t merge_slack = 50;     ///< bytes searched past the overlap when trimming
    size_t max_workers = 4;      ///< upper bound for concurrent processing
};

/// Processes one chunk and returns the replacement text. May throw.
using ChunkFunction = std::function<std::string(const TextChunk&)>;

/// (completed, total, status)
using ProgressFunction = std::function<void(int, int, const std::string&)>;

struct BatchOutcome {
    std::string merged_text;
    std::vector<ChunkProcessingResult> results;  ///< sorted by chunk index
    int failed_count = 0;

    std::vector<int> failed_indices() const;
};

class BatchProcessor {
public:
    /// Throws std::invalid_argument for max_tokens < 1 or overlap_sentences < 0.
    /// Defaults: character-ratio estimator, German sentence rules.
    explicit BatchProcessor(BatchOptions options = {},
                            std::shared_ptr<const TokenEstimator> estimator = nullptr,
                            std::shared_ptr<const SentenceSplitter> splitter = nullptr);

    /// Throws std::invalid_argument for empty or whitespace-only text.
    std::vector<TextChunk> chunk(const std::string& text) const;

    /// Joins corrected chunks, dropping the text each chunk repeats from its predecessor.
    std::string merge(std::vector<ChunkProcessingResult> results) const;

    /// One chunk at a time in index order; progress after every chunk.
    BatchOutcome process_sequential(const std::vector<TextChunk>& chunks,
                                    const ChunkFunction& fn,
                                    const ProgressFunction& progress = {}) const;

    /// Bounded worker pool; progress on the calling thread in completion order.
    /// max_workers = 0 uses the configured limit.
    BatchOutcome process_concurrent(const std::vector<TextChunk>& chunks,
                                    const ChunkFunction& fn,
                                    const ProgressFunction& progress = {},
                                    size_t max_workers = 0) const;

    /// Seconds, at least 1 for non-blank text, 0 for blank text.
    int estimate_processing_time(const std::string& text, double chars_per_second = 100.0) const;

    const BatchOptions& options() const { return options_; }
    const TokenEstimator& estimator() const { return *estimator_; }
    const SentenceSplitter& splitter() const { return *splitter_; }

private:
    ChunkProcessingResult process_one(const TextChunk& chunk, const ChunkFunction& fn) const;
    void report(const ProgressFunction& progress, int done, int total, const std::string& status) const;
    size_t find_merge_cut(const std::string& s, size_t overlap) const;

    BatchOptions options_;
    std::shared_ptr<const TokenEstimator> estimator_;
    std::shared_ptr<const SentenceSplitter> splitter_;
};

/// Longest suffix of a that is also a prefix of b, capped at limit bytes.
size_t suffix_prefix_overlap(const std::string& a, const std::string& b, size_t limit);

/// Replaces whitespace runs with one space and trims both ends.
std::string collapse_whitespace(const std::string& s);

} // namespace text
