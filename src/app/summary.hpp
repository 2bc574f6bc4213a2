// Copyright (c) 2025 VAM Desktop Live Whisper
// Human-readable reports for console tools and the UI log

#pragma once

#include "app/correction_pipeline.hpp"
#include "resource/resource_manager.hpp"

#include <string>

namespace app {

std::string format_metrics(const resource::MetricsSnapshot& m);
std::string format_status(const resource::StatusSnapshot& s);
std::string format_outcome(const CorrectionOutcome& o);
std::string format_availability(const AvailabilityReport& r);

/// "<stem>_corrected<ext>" next to the input
std::string corrected_output_path(const std::string& input_path);

} // namespace app
