// Copyright (c) 2025 VAM Desktop Live Whisper
// Resource Manager - owns at most one loaded engine per resource class
//
// Loads run behind a memory guard, swaps release the current class before
// loading the next one, and every transition is counted in the metrics.
// All public methods are safe to call from any thread.

#pragma once

#include "core/system_memory.hpp"
#include "resource/resource_types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resource {

class ResourceManagerImpl;

//==============================================================================
// Callbacks
//==============================================================================

/// Builds an instance for a class. Throws on failure; must not leave global state behind.
using Loader = std::function<ResourceHandle(ResourceClass, const LoadConfig&)>;

/// Custom teardown. When absent, teardown follows the class's HandleKind.
using Unloader = std::function<void(ResourceHandle&)>;

//==============================================================================
// Configuration
//==============================================================================

struct ResourceManagerOptions {
    double warning_threshold = 0.80;   ///< used fraction that counts as high
    double critical_threshold = 0.90;  ///< used fraction that triggers cleanup
    std::chrono::milliseconds swap_settle{2500};
    std::chrono::milliseconds unload_grace{5000};
    std::chrono::milliseconds monitor_interval{10000};
    ConstraintsTable constraints = default_constraints();
    std::optional<GpuAcceleration> gpu_override;  ///< skip detection (tests)
};

//==============================================================================
// Snapshots
//==============================================================================

struct PerformanceMetrics {
    int loads = 0;
    int unloads = 0;
    int swaps = 0;
    int cleanups = 0;
    double total_load_time_s = 0.0;
    double total_unload_time_s = 0.0;
    double peak_memory_gb = 0.0;
    double current_memory_gb = 0.0;

    double avg_load_time_s() const { return total_load_time_s / (loads > 0 ? loads : 1); }
    double avg_unload_time_s() const { return total_unload_time_s / (unloads > 0 ? unloads : 1); }
};

struct MetricsSnapshot {
    PerformanceMetrics counters;
    double memory_percent = 0.0;
    double available_memory_gb = 0.0;
    double total_memory_gb = 0.0;
    GpuAcceleration gpu = GpuAcceleration::Cpu;
    std::vector<ResourceClass> active;
};

struct LoadedResourceInfo {
    ResourceClass cls = ResourceClass::Transcription;
    HandleKind kind = HandleKind::InProcess;
    std::optional<int> native_process_id;
    double memory_footprint_gb = 0.0;
    double load_duration_s = 0.0;
    double seconds_since_last_use = 0.0;
};

struct MemoryCheck {
    bool safe = true;
    std::string message;
};

struct StatusSnapshot {
    std::vector<LoadedResourceInfo> loaded;
    MemoryCheck memory;
    double warning_threshold = 0.0;
    double critical_threshold = 0.0;
    bool monitoring = false;
};

//==============================================================================
// Resource Manager
//==============================================================================

class ResourceManager {
public:
    explicit ResourceManager(std::shared_ptr<core::MemoryProbe> probe =
                                 std::make_shared<core::SystemMemoryProbe>(),
                             ResourceManagerOptions options = {});
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    /// Registers how a class is loaded (and optionally torn down). Replaces earlier registrations.
    void register_loader(ResourceClass cls, Loader loader, Unloader unloader = {});

    /// Loads cls unless already loaded. False when memory is short, no loader is
    /// registered, or the loader throws; the class is then left unloaded.
    bool acquire(ResourceClass cls, const LoadConfig& config = {});

    /// Tears down cls if loaded. Never throws.
    void release(ResourceClass cls);

    /// Releases from, waits for memory to settle, then acquires to.
    /// On failure both classes are unloaded. from == to fails without side effects.
    bool swap(ResourceClass from, ResourceClass to, const LoadConfig& config = {});

    /// Runs fn against the loaded instance under the class lock.
    /// Returns false when cls is not loaded. Exceptions from fn propagate.
    bool with_resource(ResourceClass cls, const std::function<void(ResourceHandle&)>& fn);

    bool is_loaded(ResourceClass cls) const;

    /// Returns freed heap to the OS and counts a cleanup.
    void force_cleanup();

    /// Releases everything, stops the monitor, cleans up.
    void release_all();

    MemoryCheck check_memory_threshold() const;
    StatusSnapshot status() const;
    MetricsSnapshot metrics() const;
    GpuAcceleration gpu_acceleration() const;

    /// Background sampling of memory usage; cleans up above the critical threshold.
    void enable_monitoring();
    void disable_monitoring();
    bool monitoring_enabled() const;

private:
    std::unique_ptr<ResourceManagerImpl> impl_;
};

} // namespace resource
