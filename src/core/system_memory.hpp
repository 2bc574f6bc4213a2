// Copyright (c) 2025 VAM Desktop Live Whisper
// Host memory queries and heap reclamation

#pragma once

#include <cstdint>

namespace core {

struct MemoryInfo {
    uint64_t total_bytes = 0;
    uint64_t available_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;

    double total_gb() const { return total_bytes / 1073741824.0; }
    double available_gb() const { return available_bytes / 1073741824.0; }
    double used_gb() const { return used_bytes / 1073741824.0; }
    // Fraction of total memory in use, 0..1
    double used_fraction() const {
        return total_bytes ? static_cast<double>(total_bytes - available_bytes) / total_bytes : 0.0;
    }
    double percent_used() const { return used_fraction() * 100.0; }
};

// Source of memory readings. Tests inject scripted implementations.
class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;
    virtual MemoryInfo query() = 0;
};

// Reads the running host: /proc/meminfo (sysinfo fallback) on Linux, Mach VM stats on macOS.
class SystemMemoryProbe : public MemoryProbe {
public:
    MemoryInfo query() override;
};

// Returns freed heap pages to the OS where the C library supports it.
void reclaim_heap();

} // namespace core
