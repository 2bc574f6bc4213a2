// Drives the full runtime against the fake worker: load, correct, timeout, crash, release.
#include <atomic>
#include <cassert>
#include <memory>
#include <string>
#include "app/runtime.hpp"

namespace {

class RoomyProbe : public core::MemoryProbe {
public:
    core::MemoryInfo query() override {
        core::MemoryInfo mi;
        mi.total_bytes = 32ull * 1073741824ull;
        mi.available_bytes = 24ull * 1073741824ull;
        mi.used_bytes = mi.total_bytes - mi.available_bytes;
        return mi;
    }
};

std::string transcript(int sentences, const std::string& marker = "") {
    std::string s;
    for (int i = 0; i < sentences; ++i) {
        if (i) s += ' ';
        s += "Wir haben punkt " + std::to_string(i + 1) + " besprochen.";
        if (i == 0 && !marker.empty()) s += " " + marker + " kommt hier.";
    }
    return s;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) return 1;
    core::Config cfg;
    cfg.correction_command = {argv[1]};
    cfg.swap_settle_ms = 0;
    cfg.unload_grace_ms = 1000;
    cfg.response_timeout_ms = 500;
    cfg.context_length = 64;  // small chunks: 38 tokens each

    app::Runtime rt(cfg, std::make_shared<RoomyProbe>());
    assert(rt.worker_configured());
    assert(rt.availability().available);
    auto& rm = rt.resources();
    const auto cls = resource::ResourceClass::Correction;

    // Happy path across several chunks
    app::CorrectionOptions opt = rt.correction_options();
    app::CorrectionOutcome out = rt.pipeline().correct(transcript(12), opt);
    assert(out.success);
    assert(out.method == app::CorrectionMethod::Llm);
    assert(out.chunks_processed > 1);
    assert(!out.partial());
    assert(out.corrected_text.find("punkt") == std::string::npos);
    assert(out.corrected_text.find("Wir haben Punkt 12 besprochen.") != std::string::npos);
    assert(!rm.is_loaded(cls));

    // Worker kept loaded between runs
    opt.keep_loaded = true;
    assert(rt.pipeline().correct(transcript(2), opt).success);
    assert(rm.is_loaded(cls));
    auto st = rm.status();
    assert(st.loaded.size() == 1 && st.loaded[0].native_process_id.has_value());

    // Hanging worker (the one kept loaded above): the chunk times out, the worker is stopped, the text survives
    opt.keep_loaded = false;
    const std::string hang = transcript(3, "SCHLAF");
    app::CorrectionOutcome slow = rt.pipeline().correct(hang, opt);
    assert(slow.partial());
    assert(slow.corrected_text.find("Wir haben punkt 1 besprochen.") != std::string::npos);
    assert(!rm.is_loaded(cls));

    // Crashing worker
    app::CorrectionOutcome crash = rt.pipeline().correct(transcript(1, "ABSTURZ"), opt);
    assert(!crash.success);
    assert(crash.partial());
    assert(!rm.is_loaded(cls));

    // Worker that never becomes ready: rule-based fallback
    opt.load_config.extra["silent"] = "1";
    opt.load_config.extra["ready_timeout_ms"] = "300";
    app::CorrectionOutcome fallback = rt.pipeline().correct("das ist äh ein test. noch einer", opt);
    assert(fallback.method == app::CorrectionMethod::RuleBased);
    assert(fallback.corrected_text == "Das ist ein test. Noch einer.");

    auto m = rm.metrics();
    assert(m.counters.loads == 3);
    assert(m.counters.unloads == 3);
    rm.release_all();
    return 0;
}
