#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "text/batch_processor.hpp"

using namespace text;

static std::string identity(const TextChunk& c) { return c.text; }

static std::string numbered_text(int count) {
    std::string s;
    for (int i = 0; i < count; ++i) {
        if (i) s += ' ';
        s += "Das ist der Satz Nummer " + std::to_string(i + 1) + " im Transkript.";
    }
    return s;
}

static void test_example_two_chunks() {
    const std::string text = "Satz eins ist kurz. Satz zwei ist länger. Satz drei schließt ab.";
    BatchOptions opt;
    opt.max_tokens = 12;
    opt.overlap_sentences = 1;
    BatchProcessor bp(opt);

    auto chunks = bp.chunk(text);
    assert(chunks.size() == 2);
    // A span runs up to the next sentence, so chunk 0 keeps the space before "Satz drei"
    assert(chunks[0].text == "Satz eins ist kurz. Satz zwei ist länger. ");
    assert(chunks[1].text == "Satz zwei ist länger. Satz drei schließt ab.");
    assert(chunks[0].sentence_start == 0 && chunks[0].sentence_end == 1);
    assert(chunks[1].sentence_start == 1 && chunks[1].sentence_end == 2);
    assert(chunks[0].start_pos == 0);
    assert(chunks[1].end_pos == text.size());
    // Shared sentence plus its trailing space is 23 bytes ("ä" takes two)
    assert(chunks[0].overlap_end == 23);
    assert(chunks[1].overlap_start == 23);
    assert(chunks[0].overlap_start == 0);
    assert(chunks[1].overlap_end == 0);
    for (size_t i = 0; i < chunks.size(); ++i) {
        assert(chunks[i].index == static_cast<int>(i));
        assert(text.substr(chunks[i].start_pos, chunks[i].end_pos - chunks[i].start_pos) == chunks[i].text);
    }

    auto outcome = bp.process_sequential(chunks, identity);
    assert(outcome.failed_count == 0);
    assert(outcome.merged_text == text);
}

static void test_single_chunk_and_errors() {
    BatchProcessor bp;
    auto one = bp.chunk("Nur ein kurzer Satz.");
    assert(one.size() == 1);
    assert(one[0].overlap_start == 0 && one[0].overlap_end == 0);
    assert(one[0].token_count == 5);

    bool threw = false;
    try { bp.chunk("   \n "); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    threw = false;
    BatchOptions bad;
    bad.max_tokens = 0;
    try { BatchProcessor p(bad); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    threw = false;
    bad.max_tokens = 10;
    bad.overlap_sentences = -1;
    try { BatchProcessor p(bad); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
}

static void test_coverage_and_budget() {
    const std::string text = numbered_text(40);
    for (int overlap : {0, 1, 2}) {
        BatchOptions opt;
        opt.max_tokens = 60;
        opt.overlap_sentences = overlap;
        BatchProcessor bp(opt);
        auto chunks = bp.chunk(text);
        assert(chunks.size() > 1);

        // Every sentence is covered; chunks start no later than the previous end
        assert(chunks.front().sentence_start == 0);
        assert(chunks.back().sentence_end == 39);
        for (size_t i = 1; i < chunks.size(); ++i) {
            assert(chunks[i].sentence_start <= chunks[i - 1].sentence_end + 1);
            assert(chunks[i].sentence_start > chunks[i - 1].sentence_start);
            if (overlap == 0) {
                assert(chunks[i].overlap_start == 0);
            } else {
                assert(chunks[i].overlap_start > 0);
            }
            if (chunks[i].overlap_start > 0) {
                // Overlap never exceeds the text both spans cover
                assert(chunks[i].start_pos < chunks[i - 1].end_pos);
                assert(chunks[i].overlap_start <= chunks[i - 1].end_pos - chunks[i].start_pos);
            }
        }
        for (const auto& c : chunks) {
            // Sentence estimates fit the budget; joining spaces add at most one token per sentence
            const int sentences = c.sentence_end - c.sentence_start + 1;
            assert(c.token_count <= opt.max_tokens + sentences);
        }

        auto outcome = bp.process_sequential(chunks, identity);
        assert(outcome.merged_text == text);
    }
}

// Concatenating every span minus its leading overlap gives back the input byte for byte
static std::string concat_spans(const std::string& text, const std::vector<TextChunk>& chunks) {
    std::string cat;
    for (const auto& c : chunks) {
        const size_t from = c.start_pos + c.overlap_start;
        assert(from <= c.end_pos);
        cat += text.substr(from, c.end_pos - from);
    }
    return cat;
}

static void test_exact_span_coverage() {
    const std::string text = "  Erster Satz hier.\n\nZweiter Satz dort.  Dritter Satz am Ende.\n";
    for (int overlap : {0, 1}) {
        BatchOptions opt;
        opt.max_tokens = 6;
        opt.overlap_sentences = overlap;
        BatchProcessor bp(opt);
        auto chunks = bp.chunk(text);
        assert(chunks.size() == 3);
        assert(chunks.front().start_pos == 0);
        assert(chunks.back().end_pos == text.size());
        assert(concat_spans(text, chunks) == text);
        for (size_t i = 1; i < chunks.size(); ++i) {
            // Each chunk picks up exactly where the previous one stopped
            assert(chunks[i].start_pos + chunks[i].overlap_start == chunks[i - 1].end_pos);
        }
        assert(bp.process_sequential(chunks, identity).merged_text ==
               "Erster Satz hier. Zweiter Satz dort. Dritter Satz am Ende.");
    }

    const std::string numbered = numbered_text(25);
    for (int overlap : {0, 1, 3}) {
        BatchOptions opt;
        opt.max_tokens = 45;
        opt.overlap_sentences = overlap;
        BatchProcessor bp(opt);
        assert(concat_spans(numbered, bp.chunk(numbered)) == numbered);
    }
}

static void test_oversized_sentence() {
    std::string longest(400, 'x');
    const std::string text = "Kurz. " + longest + ". Ende.";
    BatchOptions opt;
    opt.max_tokens = 20;
    BatchProcessor bp(opt);
    auto chunks = bp.chunk(text);
    bool found = false;
    for (const auto& c : chunks) {
        if (c.text.find(longest) != std::string::npos) {
            found = true;
            assert(c.token_count > opt.max_tokens);
        }
    }
    assert(found);
    assert(bp.process_sequential(chunks, identity).merged_text == text);
}

static void test_merge_with_changed_text() {
    const std::string text = "Satz eins ist kurz. Satz zwei ist länger. Satz drei schließt ab.";
    BatchOptions opt;
    opt.max_tokens = 12;
    BatchProcessor bp(opt);
    auto chunks = bp.chunk(text);

    // Corrections that uppercase each chunk keep the overlap length
    auto upper = [](const TextChunk& c) {
        std::string s = c.text;
        for (auto& ch : s) if (ch >= 'a' && ch <= 'z') ch = static_cast<char>(ch - 'a' + 'A');
        return s;
    };
    auto outcome = bp.process_sequential(chunks, upper);
    assert(outcome.merged_text == "SATZ EINS IST KURZ. SATZ ZWEI IST LäNGER. SATZ DREI SCHLIEßT AB.");

    // A correction that rewords the shared sentence keeps the chunk's own text
    auto reword = [](const TextChunk& c) -> std::string {
        if (c.index == 0) return c.text;
        return "Zwei ist lang. Drei endet.";
    };
    assert(bp.process_sequential(chunks, reword).merged_text ==
           "Satz eins ist kurz. Satz zwei ist länger. Drei endet.");

    // A piece shorter than the overlap is kept whole
    auto shorten = [](const TextChunk& c) -> std::string {
        if (c.index == 0) return c.text;
        return "Zwei. Drei ist Ende.";
    };
    assert(bp.process_sequential(chunks, shorten).merged_text ==
           "Satz eins ist kurz. Satz zwei ist länger. Zwei. Drei ist Ende.");

    // The only sentence end near the overlap is the piece's own end: hard cut, nothing lost
    auto run_on = [](const TextChunk& c) -> std::string {
        if (c.index == 0) return c.text;
        return "Satz zwei ist laenger und Satz drei schliesst ab.";
    };
    const std::string run_on_merged = bp.process_sequential(chunks, run_on).merged_text;
    assert(run_on_merged.find("schliesst ab.") != std::string::npos);

    // Results given out of order are merged by index
    std::vector<ChunkProcessingResult> results = outcome.results;
    std::swap(results[0], results[1]);
    assert(bp.merge(results) == outcome.merged_text);
    assert(bp.merge({}).empty());
}

static void test_helpers() {
    assert(suffix_prefix_overlap("abc def", "def ghi", 10) == 3);
    assert(suffix_prefix_overlap("abc def", "def ghi", 2) == 0);
    assert(suffix_prefix_overlap("aaaa", "aaab", 10) == 3);
    assert(suffix_prefix_overlap("", "abc", 5) == 0);
    assert(suffix_prefix_overlap("xyz", "abc", 5) == 0);

    assert(collapse_whitespace("  a \n\t b  ") == "a b");
    assert(collapse_whitespace("   ").empty());

    BatchProcessor bp;
    assert(bp.estimate_processing_time("") == 0);
    assert(bp.estimate_processing_time("Kurz.") == 1);
    assert(bp.estimate_processing_time(std::string(5000, 'a')) >= 50);
}

int main() {
    test_example_two_chunks();
    test_single_chunk_and_errors();
    test_coverage_and_budget();
    test_exact_span_coverage();
    test_oversized_sentence();
    test_merge_with_changed_text();
    test_helpers();
    return 0;
}
