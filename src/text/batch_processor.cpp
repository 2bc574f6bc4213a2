// Copyright (c) 2025 VAM Desktop Live Whisper
// Chunker - Implementation

#include "text/batch_processor.hpp"
#include "core/blocking_queue.hpp"
#include "core/logging.hpp"
#include "core/worker_pool.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace text {

namespace {

bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_ascii_closer(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']';
}

} // namespace

//==============================================================================
// Helpers
//==============================================================================

size_t suffix_prefix_overlap(const std::string& a, const std::string& b, size_t limit) {
    const size_t len = std::min({limit, a.size(), b.size()});
    if (len == 0) return 0;

    // Prefix function of b[0, len)
    std::vector<size_t> pi(len, 0);
    for (size_t i = 1; i < len; ++i) {
        size_t k = pi[i - 1];
        while (k > 0 && b[i] != b[k]) k = pi[k - 1];
        if (b[i] == b[k]) ++k;
        pi[i] = k;
    }

    // Match b's prefix against the tail of a; q ends as the longest prefix that is a suffix
    size_t q = 0;
    for (size_t i = a.size() - len; i < a.size(); ++i) {
        while (q > 0 && (q == len || a[i] != b[q])) q = pi[q - 1];
        if (a[i] == b[q]) ++q;
    }
    return q;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<int> BatchOutcome::failed_indices() const {
    std::vector<int> out;
    for (const auto& r : results) {
        if (!r.success()) out.push_back(r.chunk.index);
    }
    return out;
}

//==============================================================================
// Chunking
//==============================================================================

BatchProcessor::BatchProcessor(BatchOptions options,
                               std::shared_ptr<const TokenEstimator> estimator,
                               std::shared_ptr<const SentenceSplitter> splitter)
    : options_(options)
    , estimator_(std::move(estimator))
    , splitter_(std::move(splitter))
{
    if (options_.max_tokens < 1) {
        throw std::invalid_argument("max_tokens must be >= 1");
    }
    if (options_.overlap_sentences < 0) {
        throw std::invalid_argument("overlap_sentences must be >= 0");
    }
    if (!estimator_) estimator_ = std::make_shared<CharacterRatioEstimator>();
    if (!splitter_) splitter_ = make_sentence_splitter("de");
    if (options_.max_workers == 0) options_.max_workers = 1;
}

std::vector<TextChunk> BatchProcessor::chunk(const std::string& text) const {
    const std::vector<SentenceSpan> sentences = splitter_->split(text);
    if (sentences.empty()) {
        throw std::invalid_argument("cannot chunk empty or whitespace-only text");
    }
    const int n = static_cast<int>(sentences.size());
    const int max_tokens = options_.max_tokens;

    std::vector<int> tokens(n);
    for (int i = 0; i < n; ++i) {
        tokens[i] = estimator_->estimate(text.substr(sentences[i].begin, sentences[i].end - sentences[i].begin));
    }

    // Greedy accumulation into inclusive sentence ranges
    std::vector<std::pair<int, int>> ranges;
    int first = 0;
    int running = tokens[0];
    for (int i = 1; i < n; ++i) {
        if (running + tokens[i] <= max_tokens) {
            running += tokens[i];
            continue;
        }
        ranges.emplace_back(first, i - 1);

        // Seed the next chunk with the tail of the closed one, dropping seed
        // sentences that would push the first new sentence over budget.
        const int seed = std::min(options_.overlap_sentences, i - first);
        int seed_first = i - seed;
        int seed_tokens = 0;
        for (int k = seed_first; k < i; ++k) seed_tokens += tokens[k];
        while (seed_first < i && seed_tokens + tokens[i] > max_tokens) {
            seed_tokens -= tokens[seed_first];
            ++seed_first;
        }
        first = seed_first;
        running = seed_tokens + tokens[i];
    }
    ranges.emplace_back(first, n - 1);

    // Spans run up to the next sentence so the whitespace between sentences
    // belongs to a chunk; the first starts at 0 and the last ends at text.size().
    std::vector<TextChunk> chunks;
    chunks.reserve(ranges.size());
    for (size_t c = 0; c < ranges.size(); ++c) {
        TextChunk ch;
        ch.index = static_cast<int>(c);
        ch.sentence_start = ranges[c].first;
        ch.sentence_end = ranges[c].second;
        ch.start_pos = c == 0 ? 0 : sentences[ch.sentence_start].begin;
        ch.end_pos = ch.sentence_end + 1 < n ? sentences[ch.sentence_end + 1].begin : text.size();
        ch.text = text.substr(ch.start_pos, ch.end_pos - ch.start_pos);
        const size_t content_begin = sentences[ch.sentence_start].begin;
        ch.token_count = estimator_->estimate(
            text.substr(content_begin, sentences[ch.sentence_end].end - content_begin));
        if (!chunks.empty()) {
            TextChunk& prev = chunks.back();
            // Only text both spans cover can count as overlap
            const size_t shared = prev.end_pos > ch.start_pos ? prev.end_pos - ch.start_pos : 0;
            const size_t ov = suffix_prefix_overlap(prev.text, ch.text, shared);
            prev.overlap_end = ov;
            ch.overlap_start = ov;
        }
        chunks.push_back(std::move(ch));
    }

    core::log_debug("[chunker] " + std::to_string(n) + " sentences -> " +
                    std::to_string(chunks.size()) + " chunks (max_tokens=" +
                    std::to_string(max_tokens) + ", overlap=" +
                    std::to_string(options_.overlap_sentences) + ")");
    return chunks;
}

//==============================================================================
// Merging
//==============================================================================

namespace {

bool has_content_after(const std::string& s, size_t pos) {
    for (size_t i = pos; i < s.size(); ++i) {
        if (!is_space(s[i])) return true;
    }
    return false;
}

} // namespace

size_t BatchProcessor::find_merge_cut(const std::string& s, size_t overlap) const {
    // A piece no longer than the overlap was rewritten; keep all of it
    if (s.size() <= overlap) return 0;
    const size_t window = std::min(s.size(), overlap + options_.merge_slack);
    size_t best = std::string::npos;
    size_t best_dist = std::string::npos;
    size_t p = 0;
    while (p < window) {
        if (!is_terminal(s[p])) {
            ++p;
            continue;
        }
        size_t q = p;
        while (q < s.size() && is_terminal(s[q])) ++q;
        while (q < s.size() && is_ascii_closer(s[q])) ++q;
        // A cut must leave some of the piece's own text behind
        if (q < s.size() && is_space(s[q]) && has_content_after(s, q)) {
            const size_t dist = q > overlap ? q - overlap : overlap - q;
            if (dist < best_dist) {
                best = q;
                best_dist = dist;
            }
        }
        p = q;
    }
    if (best != std::string::npos) return best;
    // No sentence end near the boundary: hard cut, never inside a code point
    const size_t hard = utf8_boundary(s, overlap);
    return has_content_after(s, hard) ? hard : 0;
}

std::string BatchProcessor::merge(std::vector<ChunkProcessingResult> results) const {
    if (results.empty()) return {};
    std::sort(results.begin(), results.end(),
              [](const ChunkProcessingResult& a, const ChunkProcessingResult& b) {
                  return a.chunk.index < b.chunk.index;
              });

    std::string merged = results[0].corrected_text;
    for (size_t i = 1; i < results.size(); ++i) {
        const std::string& piece = results[i].corrected_text;
        const size_t ov = results[i].chunk.overlap_start;
        merged.push_back(' ');
        if (ov > 0) {
            merged.append(piece, find_merge_cut(piece, ov), std::string::npos);
        } else {
            merged.append(piece);
        }
    }
    return collapse_whitespace(merged);
}

//==============================================================================
// Processing
//==============================================================================

ChunkProcessingResult BatchProcessor::process_one(const TextChunk& chunk, const ChunkFunction& fn) const {
    ChunkProcessingResult r;
    r.chunk = chunk;
    const auto t0 = std::chrono::steady_clock::now();
    try {
        r.corrected_text = fn(chunk);
        if (collapse_whitespace(r.corrected_text).empty()) {
            r.error = "empty result";
        }
    } catch (const std::exception& e) {
        r.error = e.what();
    } catch (...) {
        r.error = "unknown exception";
    }
    if (r.error) {
        core::log_warn("[chunker] chunk " + std::to_string(chunk.index) + " failed, keeping original text: " + *r.error);
        r.corrected_text = chunk.text;
    }
    r.processing_time_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    return r;
}

void BatchProcessor::report(const ProgressFunction& progress, int done, int total, const std::string& status) const {
    if (!progress) return;
    try {
        progress(done, total, status);
    } catch (const std::exception& e) {
        core::log_error(std::string("[chunker] progress callback failed: ") + e.what());
    }
}

BatchOutcome BatchProcessor::process_sequential(const std::vector<TextChunk>& chunks,
                                                const ChunkFunction& fn,
                                                const ProgressFunction& progress) const {
    BatchOutcome out;
    const int total = static_cast<int>(chunks.size());
    out.results.reserve(chunks.size());
    for (const auto& c : chunks) {
        ChunkProcessingResult r = process_one(c, fn);
        const int done = static_cast<int>(out.results.size()) + 1;
        std::string status = "chunk " + std::to_string(c.index + 1) + "/" + std::to_string(total);
        if (r.success()) {
            status += " done";
        } else {
            ++out.failed_count;
            status += " failed: " + *r.error;
        }
        out.results.push_back(std::move(r));
        report(progress, done, total, status);
    }
    out.merged_text = merge(out.results);
    return out;
}

BatchOutcome BatchProcessor::process_concurrent(const std::vector<TextChunk>& chunks,
                                                const ChunkFunction& fn,
                                                const ProgressFunction& progress,
                                                size_t max_workers) const {
    BatchOutcome out;
    if (chunks.empty()) return out;
    const int total = static_cast<int>(chunks.size());
    size_t workers = max_workers ? max_workers : options_.max_workers;
    workers = std::max<size_t>(1, std::min(workers, chunks.size()));

    core::BlockingQueue<ChunkProcessingResult> completed;
    {
        core::WorkerPool pool(workers);
        for (const auto& c : chunks) {
            const bool queued = pool.submit([this, &c, &fn, &completed] {
                completed.push(process_one(c, fn));
            });
            if (!queued) {
                throw std::runtime_error("worker pool rejected chunk " + std::to_string(c.index));
            }
        }

        // Progress runs here, in completion order
        for (int done = 1; done <= total; ++done) {
            ChunkProcessingResult r;
            if (!completed.pop(r)) break;
            std::string status = "chunk " + std::to_string(r.chunk.index + 1) + "/" + std::to_string(total);
            if (r.success()) {
                status += " done";
            } else {
                ++out.failed_count;
                status += " failed: " + *r.error;
            }
            out.results.push_back(std::move(r));
            report(progress, done, total, status);
        }
        pool.shutdown();
    }

    std::sort(out.results.begin(), out.results.end(),
              [](const ChunkProcessingResult& a, const ChunkProcessingResult& b) {
                  return a.chunk.index < b.chunk.index;
              });
    out.merged_text = merge(out.results);
    return out;
}

int BatchProcessor::estimate_processing_time(const std::string& text, double chars_per_second) const {
    if (chars_per_second <= 0.0) {
        throw std::invalid_argument("chars_per_second must be positive");
    }
    if (collapse_whitespace(text).empty()) return 0;
    const double len = static_cast<double>(utf8_length(text));
    const double chunks = std::ceil(len / (options_.max_tokens * 4.0));
    const double seconds = len / chars_per_second + len / 10000.0 + chunks * 0.5;
    return std::max(1, static_cast<int>(seconds));
}

} // namespace text
