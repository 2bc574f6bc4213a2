// Copyright (c) 2025 VAM Desktop Live Whisper
// Resource classes, per-class constraints and the owned instance handle

#pragma once

#include "core/native_process.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resource {

//==============================================================================
// Classes and Policy
//==============================================================================

/// Mutually exclusive slots for heavyweight engines
enum class ResourceClass {
    Transcription,
    Correction
};

/// How a loaded instance is owned and torn down
enum class HandleKind {
    NativeProcess,  ///< child process; SIGTERM, grace wait, SIGKILL
    InProcess       ///< engine object in this process; shutdown() then destroy
};

enum class GpuAcceleration {
    Cpu,
    Cuda,
    Metal
};

struct ResourceConstraints {
    double min_memory_gb = 0.0;
    double preferred_memory_gb = 0.0;
    bool gpu_required = false;
    int max_concurrent = 1;  ///< always 1; more is not implemented
    HandleKind handle_kind = HandleKind::InProcess;
};

using ConstraintsTable = std::map<ResourceClass, ResourceConstraints>;

/// Transcription: in-process whisper.cpp, 2.0/4.0 GB. Correction: worker process, 6.0/8.0 GB.
const ConstraintsTable& default_constraints();

const char* to_string(ResourceClass cls);
const char* to_string(HandleKind kind);
const char* to_string(GpuAcceleration gpu);

/// Throws std::invalid_argument for unknown names ("transcription", "correction").
ResourceClass parse_resource_class(const std::string& name);

/// Metal on macOS, CUDA when an NVIDIA driver is present, CPU otherwise.
GpuAcceleration detect_gpu_acceleration();

//==============================================================================
// Instance Handle
//==============================================================================

/// Engine living in this process (e.g. a whisper.cpp context)
class InProcessEngine {
public:
    virtual ~InProcessEngine() = default;
    virtual std::string name() const = 0;
    /// Releases native memory. Called once before destruction.
    virtual void shutdown() = 0;
};

/// Exclusively owned by ResourceManager while loaded. Callers only borrow it
/// inside ResourceManager::with_resource().
class ResourceHandle {
public:
    ResourceHandle() = default;
    ResourceHandle(ResourceHandle&&) = default;
    ResourceHandle& operator=(ResourceHandle&&) = default;
    ResourceHandle(const ResourceHandle&) = delete;
    ResourceHandle& operator=(const ResourceHandle&) = delete;

    static ResourceHandle native_process(std::unique_ptr<core::NativeProcess> process);
    static ResourceHandle in_process(std::unique_ptr<InProcessEngine> engine);

    HandleKind kind() const { return kind_; }
    bool empty() const { return !process_ && !engine_; }

    core::NativeProcess* process() const { return process_.get(); }
    InProcessEngine* engine() const { return engine_.get(); }
    std::optional<int> process_id() const;

    template <typename T>
    T* engine_as() const { return dynamic_cast<T*>(engine_.get()); }

private:
    HandleKind kind_ = HandleKind::InProcess;
    std::unique_ptr<core::NativeProcess> process_;
    std::unique_ptr<InProcessEngine> engine_;
};

/// Opaque settings handed to a loader
struct LoadConfig {
    std::string model;                  ///< model name or path
    std::vector<std::string> command;   ///< argv for process-backed classes
    int threads = 0;
    bool use_gpu = true;
    std::map<std::string, std::string> extra;
};

} // namespace resource
