// Copyright (c) 2025 VAM Desktop Live Whisper
// Chunk model: unit of correction work and its outcome

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace text {

/// Contiguous, sentence-aligned slice of the source text.
/// Positions are byte offsets into the original UTF-8 string.
struct TextChunk {
    std::string text;
    int index = 0;
    size_t start_pos = 0;
    size_t end_pos = 0;
    size_t overlap_start = 0;  ///< bytes shared with the previous chunk
    size_t overlap_end = 0;    ///< bytes shared with the next chunk
    int sentence_start = 0;    ///< first sentence index (inclusive)
    int sentence_end = 0;      ///< last sentence index (inclusive)
    int token_count = 0;
};

struct ChunkProcessingResult {
    TextChunk chunk;
    std::string corrected_text;  ///< original chunk text when processing failed
    double processing_time_s = 0.0;
    std::optional<std::string> error;

    bool success() const { return !error.has_value(); }
};

} // namespace text
