// Copyright (c) 2025 VAM Desktop Live Whisper
// Resource Manager - Implementation

#include "resource/resource_manager.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace resource {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point t0) {
    return std::chrono::duration<double>(Clock::now() - t0).count();
}

std::string fmt_gb(double gb) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fGB", gb);
    return buf;
}

std::string fmt_percent(double fraction) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", fraction * 100.0);
    return buf;
}

std::string tag(ResourceClass cls) {
    return std::string("[resource] ") + to_string(cls) + ": ";
}

} // namespace

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class ResourceManagerImpl {
public:
    ResourceManagerImpl(std::shared_ptr<core::MemoryProbe> probe, ResourceManagerOptions options);
    ~ResourceManagerImpl();

    void register_loader(ResourceClass cls, Loader loader, Unloader unloader);
    bool acquire(ResourceClass cls, const LoadConfig& config);
    void release(ResourceClass cls);
    bool swap(ResourceClass from, ResourceClass to, const LoadConfig& config);
    bool with_resource(ResourceClass cls, const std::function<void(ResourceHandle&)>& fn);
    bool is_loaded(ResourceClass cls) const;
    void force_cleanup();
    void release_all();

    MemoryCheck check_memory_threshold() const;
    StatusSnapshot status() const;
    MetricsSnapshot metrics() const;
    GpuAcceleration gpu() const { return gpu_; }

    void enable_monitoring();
    void disable_monitoring();
    bool monitoring_enabled() const { return monitor_running_.load(); }

private:
    // Per-class slot. The handle is only touched with slot.lock held.
    struct ClassSlot {
        std::mutex lock;
        std::unique_ptr<ResourceHandle> handle;
        Loader loader;
        Unloader unloader;
    };

    // Bookkeeping record, guarded by state_mutex_.
    struct ActiveRecord {
        LoadedResourceInfo info;
        Clock::time_point last_used;
        bool unloading = false;
    };

    ClassSlot* slot_for(ResourceClass cls);
    const ResourceConstraints* constraints_for(ResourceClass cls) const;
    void teardown(ResourceClass cls, ClassSlot& slot, ResourceHandle& handle);
    void reclaim_memory();
    void sample_memory();
    void monitor_loop(std::shared_ptr<bool> stop);

    std::shared_ptr<core::MemoryProbe> probe_;
    ResourceManagerOptions options_;
    GpuAcceleration gpu_;

    std::map<ResourceClass, std::unique_ptr<ClassSlot>> slots_;

    mutable std::mutex state_mutex_;
    std::map<ResourceClass, ActiveRecord> active_;
    PerformanceMetrics metrics_;

    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    std::shared_ptr<bool> monitor_stop_;  ///< owned by the current thread; guarded by monitor_mutex_
    std::atomic<bool> monitor_running_{false};
    std::unique_ptr<std::thread> monitor_thread_;
};

ResourceManagerImpl::ResourceManagerImpl(std::shared_ptr<core::MemoryProbe> probe,
                                         ResourceManagerOptions options)
    : probe_(std::move(probe))
    , options_(std::move(options))
    , gpu_(options_.gpu_override ? *options_.gpu_override : detect_gpu_acceleration())
{
    if (!probe_) {
        throw std::invalid_argument("ResourceManager requires a memory probe");
    }
    if (options_.warning_threshold <= 0.0 || options_.critical_threshold > 1.0 ||
        options_.warning_threshold > options_.critical_threshold) {
        throw std::invalid_argument("memory thresholds must satisfy 0 < warning <= critical <= 1");
    }
    for (const auto& kv : options_.constraints) {
        slots_[kv.first] = std::make_unique<ClassSlot>();
    }
    core::log_info(std::string("[resource] manager ready, acceleration: ") + to_string(gpu_));
}

ResourceManagerImpl::~ResourceManagerImpl() {
    release_all();
}

ResourceManagerImpl::ClassSlot* ResourceManagerImpl::slot_for(ResourceClass cls) {
    auto it = slots_.find(cls);
    return it == slots_.end() ? nullptr : it->second.get();
}

const ResourceConstraints* ResourceManagerImpl::constraints_for(ResourceClass cls) const {
    auto it = options_.constraints.find(cls);
    return it == options_.constraints.end() ? nullptr : &it->second;
}

void ResourceManagerImpl::register_loader(ResourceClass cls, Loader loader, Unloader unloader) {
    ClassSlot* slot = slot_for(cls);
    if (!slot) {
        throw std::invalid_argument(std::string("no constraints for resource class ") + to_string(cls));
    }
    std::lock_guard<std::mutex> lock(slot->lock);
    slot->loader = std::move(loader);
    slot->unloader = std::move(unloader);
}

//==============================================================================
// Acquire / Release / Swap
//==============================================================================

bool ResourceManagerImpl::acquire(ResourceClass cls, const LoadConfig& config) {
    // Fast path: already loaded
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = active_.find(cls);
        if (it != active_.end() && !it->second.unloading) {
            it->second.last_used = Clock::now();
            return true;
        }
    }

    ClassSlot* slot = slot_for(cls);
    const ResourceConstraints* rc = constraints_for(cls);
    if (!slot || !rc) {
        core::log_error(tag(cls) + "no constraints registered");
        return false;
    }

    std::lock_guard<std::mutex> class_lock(slot->lock);

    // Re-check: a racing caller may have finished loading while we waited.
    // Releases hold the class lock, so an unloading record here is stale.
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = active_.find(cls);
        if (it != active_.end()) {
            if (!it->second.unloading && slot->handle) {
                it->second.last_used = Clock::now();
                return true;
            }
            core::log_warn(tag(cls) + "dropping stale record of an interrupted unload");
            active_.erase(it);
            slot->handle.reset();
        }
    }

    if (!slot->loader) {
        core::log_error(tag(cls) + "no loader registered");
        return false;
    }
    if (rc->gpu_required && gpu_ == GpuAcceleration::Cpu) {
        core::log_error(tag(cls) + "requires GPU acceleration, none available");
        return false;
    }

    // Memory guard
    core::MemoryInfo before = probe_->query();
    if (before.available_gb() < rc->min_memory_gb) {
        core::log_warn(tag(cls) + "only " + fmt_gb(before.available_gb()) + " available, need " +
                       fmt_gb(rc->min_memory_gb) + "; cleaning up");
        force_cleanup();
        before = probe_->query();
        if (before.available_gb() < rc->min_memory_gb) {
            core::log_error(tag(cls) + "insufficient memory: " + fmt_gb(before.available_gb()) +
                            " available, " + fmt_gb(rc->min_memory_gb) + " required");
            return false;
        }
    }
    if (before.available_gb() < rc->preferred_memory_gb) {
        core::log_warn(tag(cls) + "below preferred memory (" + fmt_gb(before.available_gb()) +
                       " < " + fmt_gb(rc->preferred_memory_gb) + ")");
    }

    core::log_info(tag(cls) + "loading");
    const auto t0 = Clock::now();
    ResourceHandle handle;
    try {
        handle = slot->loader(cls, config);
    } catch (const std::exception& e) {
        core::log_error(tag(cls) + "loader failed: " + e.what());
        return false;
    } catch (...) {
        core::log_error(tag(cls) + "loader failed with a non-standard exception");
        return false;
    }
    if (handle.empty()) {
        core::log_error(tag(cls) + "loader returned an empty handle");
        return false;
    }
    if (handle.kind() != rc->handle_kind) {
        // Destroying the handle here runs its own destructor cleanup.
        core::log_error(tag(cls) + "loader returned a " + to_string(handle.kind()) +
                        " handle, expected " + to_string(rc->handle_kind));
        return false;
    }
    const double load_s = seconds_since(t0);
    const core::MemoryInfo after = probe_->query();

    ActiveRecord rec;
    rec.info.cls = cls;
    rec.info.kind = handle.kind();
    rec.info.native_process_id = handle.process_id();
    rec.info.load_duration_s = load_s;
    rec.info.memory_footprint_gb = std::max(0.0, before.available_gb() - after.available_gb());
    rec.last_used = Clock::now();

    slot->handle = std::make_unique<ResourceHandle>(std::move(handle));
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_[cls] = rec;
        metrics_.loads++;
        metrics_.total_load_time_s += load_s;
        metrics_.current_memory_gb = after.used_gb();
        if (metrics_.current_memory_gb > metrics_.peak_memory_gb) {
            metrics_.peak_memory_gb = metrics_.current_memory_gb;
        }
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2fs", load_s);
    core::log_info(tag(cls) + "loaded in " + buf + ", footprint " + fmt_gb(rec.info.memory_footprint_gb));
    return true;
}

void ResourceManagerImpl::teardown(ResourceClass cls, ClassSlot& slot, ResourceHandle& handle) {
    if (slot.unloader) {
        slot.unloader(handle);
        return;
    }
    const ResourceConstraints* rc = constraints_for(cls);
    const HandleKind kind = rc ? rc->handle_kind : handle.kind();
    switch (kind) {
    case HandleKind::NativeProcess:
        if (handle.process()) {
            const auto pid = handle.process_id();
            if (!handle.process()->terminate(options_.unload_grace)) {
                core::log_warn(tag(cls) + "process " + (pid ? std::to_string(*pid) : std::string("?")) +
                               " did not exit within grace period, killed");
            }
        }
        break;
    case HandleKind::InProcess:
        if (handle.engine()) {
            handle.engine()->shutdown();
        }
        break;
    }
}

void ResourceManagerImpl::release(ResourceClass cls) {
    ClassSlot* slot = slot_for(cls);
    if (!slot || !is_loaded(cls)) return;

    std::lock_guard<std::mutex> class_lock(slot->lock);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = active_.find(cls);
        if (it == active_.end()) return;
        it->second.unloading = true;
    }

    core::log_info(tag(cls) + "unloading");
    const auto t0 = Clock::now();
    std::unique_ptr<ResourceHandle> handle = std::move(slot->handle);
    if (handle) {
        try {
            teardown(cls, *slot, *handle);
        } catch (const std::exception& e) {
            core::log_error(tag(cls) + "teardown failed, dropping instance: " + e.what());
        } catch (...) {
            core::log_error(tag(cls) + "teardown failed with a non-standard exception, dropping instance");
        }
        handle.reset();
    }
    const double unload_s = seconds_since(t0);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_.erase(cls);
        metrics_.unloads++;
        metrics_.total_unload_time_s += unload_s;
    }
    reclaim_memory();
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2fs", unload_s);
    core::log_info(tag(cls) + "unloaded in " + buf);
}

bool ResourceManagerImpl::swap(ResourceClass from, ResourceClass to, const LoadConfig& config) {
    if (from == to) {
        core::log_error(std::string("[resource] cannot swap ") + to_string(from) + " into itself");
        return false;
    }
    if (!constraints_for(to)) {
        core::log_error(tag(to) + "no constraints registered");
        return false;
    }

    core::log_info(std::string("[resource] swap ") + to_string(from) + " -> " + to_string(to));
    const MemoryCheck check = check_memory_threshold();
    if (!check.safe) {
        core::log_warn("[resource] pre-swap: " + check.message);
        force_cleanup();
    }

    release(from);

    // Give native allocations time to return to the OS
    if (options_.swap_settle.count() > 0) {
        std::this_thread::sleep_for(options_.swap_settle);
    }
    force_cleanup();

    if (!acquire(to, config)) {
        core::log_error(std::string("[resource] swap to ") + to_string(to) + " failed");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics_.swaps++;
    }
    return true;
}

bool ResourceManagerImpl::with_resource(ResourceClass cls,
                                        const std::function<void(ResourceHandle&)>& fn) {
    ClassSlot* slot = slot_for(cls);
    if (!slot) return false;
    std::lock_guard<std::mutex> class_lock(slot->lock);
    if (!slot->handle) return false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = active_.find(cls);
        if (it != active_.end()) it->second.last_used = Clock::now();
    }
    fn(*slot->handle);
    return true;
}

bool ResourceManagerImpl::is_loaded(ResourceClass cls) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = active_.find(cls);
    return it != active_.end() && !it->second.unloading;
}

//==============================================================================
// Memory
//==============================================================================

void ResourceManagerImpl::reclaim_memory() {
    core::reclaim_heap();
}

void ResourceManagerImpl::force_cleanup() {
    reclaim_memory();
    const core::MemoryInfo mi = probe_->query();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics_.cleanups++;
        metrics_.current_memory_gb = mi.used_gb();
        if (metrics_.current_memory_gb > metrics_.peak_memory_gb) {
            metrics_.peak_memory_gb = metrics_.current_memory_gb;
        }
    }
    core::log_debug("[resource] cleanup done, " + fmt_gb(mi.available_gb()) + " available");
}

MemoryCheck ResourceManagerImpl::check_memory_threshold() const {
    const core::MemoryInfo mi = probe_->query();
    const double used = mi.used_fraction();
    MemoryCheck out;
    if (used >= options_.critical_threshold) {
        out.safe = false;
        out.message = "Critical memory usage: " + fmt_percent(used);
    } else if (used >= options_.warning_threshold) {
        out.safe = false;
        out.message = "High memory usage: " + fmt_percent(used);
    } else {
        out.message = "Memory usage OK: " + fmt_percent(used);
    }
    return out;
}

void ResourceManagerImpl::sample_memory() {
    const core::MemoryInfo mi = probe_->query();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics_.current_memory_gb = mi.used_gb();
        if (metrics_.current_memory_gb > metrics_.peak_memory_gb) {
            metrics_.peak_memory_gb = metrics_.current_memory_gb;
        }
    }
    if (mi.used_fraction() >= options_.critical_threshold) {
        core::log_warn("[monitor] critical memory usage " + fmt_percent(mi.used_fraction()) + ", cleaning up");
        force_cleanup();
    }
}

//==============================================================================
// Snapshots
//==============================================================================

StatusSnapshot ResourceManagerImpl::status() const {
    StatusSnapshot s;
    s.memory = check_memory_threshold();
    s.warning_threshold = options_.warning_threshold;
    s.critical_threshold = options_.critical_threshold;
    s.monitoring = monitor_running_.load();
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& kv : active_) {
        if (kv.second.unloading) continue;
        LoadedResourceInfo info = kv.second.info;
        info.seconds_since_last_use = seconds_since(kv.second.last_used);
        s.loaded.push_back(info);
    }
    return s;
}

MetricsSnapshot ResourceManagerImpl::metrics() const {
    const core::MemoryInfo mi = probe_->query();
    MetricsSnapshot m;
    m.memory_percent = mi.percent_used();
    m.available_memory_gb = mi.available_gb();
    m.total_memory_gb = mi.total_gb();
    m.gpu = gpu_;
    std::lock_guard<std::mutex> lock(state_mutex_);
    m.counters = metrics_;
    for (const auto& kv : active_) {
        if (!kv.second.unloading) m.active.push_back(kv.first);
    }
    return m;
}

//==============================================================================
// Continuous Monitor
//==============================================================================

void ResourceManagerImpl::enable_monitoring() {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (monitor_thread_) return;
    // A fresh flag per thread: a loop still being joined keeps its own stop request
    auto stop = std::make_shared<bool>(false);
    monitor_stop_ = stop;
    monitor_running_ = true;
    monitor_thread_ = std::make_unique<std::thread>([this, stop] { monitor_loop(stop); });
    core::log_info("[monitor] started");
}

void ResourceManagerImpl::disable_monitoring() {
    std::unique_ptr<std::thread> t;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (!monitor_thread_) return;
        *monitor_stop_ = true;
        monitor_stop_.reset();
        t = std::move(monitor_thread_);
    }
    monitor_cv_.notify_all();
    // The loop never takes a class lock, so this join is bounded by one sample.
    if (t->joinable()) t->join();
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_running_ = monitor_thread_ != nullptr;
    }
    core::log_info("[monitor] stopped");
}

void ResourceManagerImpl::monitor_loop(std::shared_ptr<bool> stop) {
    std::unique_lock<std::mutex> lock(monitor_mutex_);
    while (!*stop) {
        lock.unlock();
        try {
            sample_memory();
        } catch (const std::exception& e) {
            core::log_error(std::string("[monitor] sample failed: ") + e.what());
        } catch (...) {
            core::log_error("[monitor] sample failed with a non-standard exception");
        }
        lock.lock();
        monitor_cv_.wait_for(lock, options_.monitor_interval, [&stop] { return *stop; });
    }
}

void ResourceManagerImpl::release_all() {
    for (const auto& kv : slots_) {
        release(kv.first);
    }
    disable_monitoring();
    force_cleanup();
}

//==============================================================================
// Public API (forwarding)
//==============================================================================

ResourceManager::ResourceManager(std::shared_ptr<core::MemoryProbe> probe, ResourceManagerOptions options)
    : impl_(std::make_unique<ResourceManagerImpl>(std::move(probe), std::move(options))) {}

ResourceManager::~ResourceManager() = default;

void ResourceManager::register_loader(ResourceClass cls, Loader loader, Unloader unloader) {
    impl_->register_loader(cls, std::move(loader), std::move(unloader));
}

bool ResourceManager::acquire(ResourceClass cls, const LoadConfig& config) {
    return impl_->acquire(cls, config);
}

void ResourceManager::release(ResourceClass cls) { impl_->release(cls); }

bool ResourceManager::swap(ResourceClass from, ResourceClass to, const LoadConfig& config) {
    return impl_->swap(from, to, config);
}

bool ResourceManager::with_resource(ResourceClass cls, const std::function<void(ResourceHandle&)>& fn) {
    return impl_->with_resource(cls, fn);
}

bool ResourceManager::is_loaded(ResourceClass cls) const { return impl_->is_loaded(cls); }
void ResourceManager::force_cleanup() { impl_->force_cleanup(); }
void ResourceManager::release_all() { impl_->release_all(); }
MemoryCheck ResourceManager::check_memory_threshold() const { return impl_->check_memory_threshold(); }
StatusSnapshot ResourceManager::status() const { return impl_->status(); }
MetricsSnapshot ResourceManager::metrics() const { return impl_->metrics(); }
GpuAcceleration ResourceManager::gpu_acceleration() const { return impl_->gpu(); }
void ResourceManager::enable_monitoring() { impl_->enable_monitoring(); }
void ResourceManager::disable_monitoring() { impl_->disable_monitoring(); }
bool ResourceManager::monitoring_enabled() const { return impl_->monitoring_enabled(); }

} // namespace resource
