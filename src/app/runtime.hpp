// Copyright (c) 2025 VAM Desktop Live Whisper
// Composition root: resource manager, correction worker and pipeline built from Config

#pragma once

#include "app/correction_pipeline.hpp"
#include "core/config.hpp"
#include "llm/process_corrector.hpp"
#include "resource/resource_manager.hpp"

#include <memory>

namespace app {

resource::ResourceManagerOptions resource_options_from_config(const core::Config& cfg);

/// Options for one correction run. Throws std::invalid_argument for an unknown level.
CorrectionOptions correction_options_from_config(const core::Config& cfg);

/// Correction callback that drives a worker process through the line protocol.
CorrectionCallback make_worker_callback(std::shared_ptr<const llm::ProcessCorrector> corrector);

class Runtime {
public:
    explicit Runtime(const core::Config& cfg,
                     std::shared_ptr<core::MemoryProbe> probe = std::make_shared<core::SystemMemoryProbe>());

    resource::ResourceManager& resources() { return *resources_; }
    CorrectionPipeline& pipeline() { return *pipeline_; }
    const core::Config& config() const { return cfg_; }
    const llm::ProcessCorrector& corrector() const { return *corrector_; }

    CorrectionOptions correction_options() const { return correction_options_from_config(cfg_); }
    bool worker_configured() const { return !cfg_.correction_command.empty(); }
    AvailabilityReport availability() const;

private:
    core::Config cfg_;
    std::unique_ptr<resource::ResourceManager> resources_;
    std::shared_ptr<const llm::ProcessCorrector> corrector_;
    std::unique_ptr<CorrectionPipeline> pipeline_;
};

} // namespace app
