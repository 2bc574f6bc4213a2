// Copyright (c) 2025 VAM Desktop Live Whisper
// Human-readable reports for console tools and the UI log

#include "app/summary.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>

namespace app {

std::string format_metrics(const resource::MetricsSnapshot& m) {
    const auto& c = m.counters;
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "loads=" << c.loads << " unloads=" << c.unloads << " swaps=" << c.swaps
       << " cleanups=" << c.cleanups
       << " avg_load=" << c.avg_load_time_s() << "s avg_unload=" << c.avg_unload_time_s() << "s"
       << " memory=" << std::setprecision(1) << m.memory_percent << "%"
       << std::setprecision(2) << " available=" << m.available_memory_gb << "/" << m.total_memory_gb << "GB"
       << " peak=" << c.peak_memory_gb << "GB"
       << " gpu=" << resource::to_string(m.gpu) << " active=[";
    for (size_t i = 0; i < m.active.size(); ++i) {
        if (i) os << ",";
        os << resource::to_string(m.active[i]);
    }
    os << "]";
    return os.str();
}

std::string format_status(const resource::StatusSnapshot& s) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << (s.memory.safe ? "memory safe" : "memory NOT safe") << " (" << s.memory.message << ")";
    os << ", monitor " << (s.monitoring ? "on" : "off");
    for (const auto& r : s.loaded) {
        os << "\n  " << resource::to_string(r.cls) << " [" << resource::to_string(r.kind) << "]";
        if (r.native_process_id) os << " pid=" << *r.native_process_id;
        os << " footprint=" << r.memory_footprint_gb << "GB load=" << r.load_duration_s
           << "s idle=" << r.seconds_since_last_use << "s";
    }
    return os.str();
}

std::string format_outcome(const CorrectionOutcome& o) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << (o.success ? "success" : "FAILED") << ", method=" << to_string(o.method)
       << ", chunks=" << o.chunks_processed << ", time=" << o.processing_time_s << "s";
    if (!o.failed_chunks.empty()) {
        os << ", fallback chunks=[";
        for (size_t i = 0; i < o.failed_chunks.size(); ++i) {
            if (i) os << ",";
            os << o.failed_chunks[i];
        }
        os << "]";
    }
    if (o.method == CorrectionMethod::RuleBased) {
        os << ", rule changes=" << o.rule_corrections.size() << ", score=" << o.improvement_score;
    }
    if (!o.error.empty()) os << " (" << o.error << ")";
    return os.str();
}

std::string format_availability(const AvailabilityReport& r) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "correction " << r.status << ": worker " << (r.worker_configured ? "configured" : "not configured")
       << ", " << r.available_ram_gb << "GB available (min " << r.min_required_ram_gb
       << ", recommended " << r.recommended_ram_gb << "), " << r.memory_message
       << ", rule-based fallback " << (r.fallback_available ? "available" : "unavailable");
    return os.str();
}

std::string corrected_output_path(const std::string& input_path) {
    const std::filesystem::path p(input_path);
    std::filesystem::path out = p.parent_path() / (p.stem().string() + "_corrected" + p.extension().string());
    return out.string();
}

} // namespace app
