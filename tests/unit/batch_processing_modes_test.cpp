#include <atomic>
#include <cassert>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "text/batch_processor.hpp"

using namespace text;

static std::string build_text() {
    std::string s;
    for (int i = 0; i < 30; ++i) {
        if (i) s += ' ';
        s += "Heute sprechen wir über Punkt " + std::to_string(i + 1) + " der Tagesordnung.";
    }
    return s;
}

static std::string corrected(const TextChunk& c) {
    // Vary completion order across workers
    std::this_thread::sleep_for(std::chrono::milliseconds((c.index % 3) * 5));
    std::string s = c.text;
    for (auto& ch : s) if (ch == 'u') ch = 'U';
    return s;
}

int main() {
    const std::string text = build_text();
    BatchOptions opt;
    opt.max_tokens = 50;
    BatchProcessor bp(opt);
    auto chunks = bp.chunk(text);
    const int total = static_cast<int>(chunks.size());
    assert(total > 3);

    // Concurrent and sequential produce the same text
    auto seq = bp.process_sequential(chunks, corrected);
    auto con = bp.process_concurrent(chunks, corrected, {}, 4);
    assert(seq.failed_count == 0 && con.failed_count == 0);
    assert(seq.merged_text == con.merged_text);
    assert(con.results.size() == chunks.size());
    for (size_t i = 0; i < con.results.size(); ++i) {
        assert(con.results[i].chunk.index == static_cast<int>(i));
    }

    // Progress: one call per chunk, completed count rises to total
    std::vector<int> seen;
    std::thread::id caller = std::this_thread::get_id();
    bool on_caller = true;
    bp.process_concurrent(chunks, corrected, [&](int done, int t, const std::string&) {
        assert(t == total);
        seen.push_back(done);
        on_caller = on_caller && std::this_thread::get_id() == caller;
    });
    assert(static_cast<int>(seen.size()) == total);
    for (int i = 0; i < total; ++i) assert(seen[i] == i + 1);
    assert(on_caller);

    int seq_calls = 0;
    bp.process_sequential(chunks, corrected, [&](int done, int, const std::string& status) {
        ++seq_calls;
        assert(done == seq_calls);
        assert(status.find("done") != std::string::npos);
    });
    assert(seq_calls == total);

    // A failing chunk keeps its original text; the rest are still corrected
    auto failing = [](const TextChunk& c) -> std::string {
        if (c.index == 1) throw std::runtime_error("worker crashed");
        if (c.index == 2) return "   ";
        return corrected(c);
    };
    for (bool concurrent : {false, true}) {
        std::atomic<int> failures{0};
        auto progress = [&](int, int, const std::string& status) {
            if (status.find("failed") != std::string::npos) ++failures;
        };
        BatchOutcome out = concurrent ? bp.process_concurrent(chunks, failing, progress, 3)
                                      : bp.process_sequential(chunks, failing, progress);
        assert(out.failed_count == 2);
        assert(failures == 2);
        auto failed = out.failed_indices();
        assert(failed.size() == 2 && failed[0] == 1 && failed[1] == 2);
        assert(out.results[1].corrected_text == chunks[1].text);
        assert(out.results[1].error && *out.results[1].error == "worker crashed");
        assert(out.results[2].corrected_text == chunks[2].text);
        assert(out.results[0].success());
        assert(!out.merged_text.empty());
    }

    // Throwing progress callbacks do not abort processing
    auto bad_progress = [](int, int, const std::string&) { throw std::runtime_error("ui gone"); };
    auto out = bp.process_concurrent(chunks, corrected, bad_progress, 2);
    assert(out.merged_text == seq.merged_text);

    assert(bp.process_concurrent({}, corrected).results.empty());
    return 0;
}
