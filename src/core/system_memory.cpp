// Copyright (c) 2025 VAM Desktop Live Whisper
// Host memory queries and heap reclamation

#include "core/system_memory.hpp"
#include "core/logging.hpp"

#include <fstream>
#include <sstream>
#include <string>

#if defined(__linux__)
#include <sys/sysinfo.h>
#include <malloc.h>
#elif defined(__APPLE__)
#include <sys/types.h>
#include <sys/sysctl.h>
#include <mach/mach.h>
#endif

namespace core {

#if defined(__linux__)
namespace {

// Values in /proc/meminfo are reported in kB.
bool read_proc_meminfo(MemoryInfo& out) {
    std::ifstream f("/proc/meminfo");
    if (!f) return false;
    uint64_t total = 0, available = 0, free_kb = 0;
    bool have_total = false, have_avail = false;
    std::string line;
    while (std::getline(f, line)) {
        std::istringstream ss(line);
        std::string key;
        uint64_t value = 0;
        ss >> key >> value;
        if (key == "MemTotal:") { total = value; have_total = true; }
        else if (key == "MemAvailable:") { available = value; have_avail = true; }
        else if (key == "MemFree:") { free_kb = value; }
    }
    if (!have_total || !have_avail) return false;
    out.total_bytes = total * 1024;
    out.available_bytes = available * 1024;
    out.free_bytes = free_kb * 1024;
    out.used_bytes = out.total_bytes - out.available_bytes;
    return true;
}

} // namespace
#endif

MemoryInfo SystemMemoryProbe::query() {
    MemoryInfo mi;
#if defined(__linux__)
    if (read_proc_meminfo(mi)) return mi;
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        mi.total_bytes = static_cast<uint64_t>(info.totalram) * info.mem_unit;
        mi.free_bytes = static_cast<uint64_t>(info.freeram) * info.mem_unit;
        mi.available_bytes = (static_cast<uint64_t>(info.freeram) + info.bufferram) * info.mem_unit;
        mi.used_bytes = mi.total_bytes - mi.available_bytes;
    } else {
        log_error("[memory] sysinfo failed");
    }
#elif defined(__APPLE__)
    int64_t mem_size = 0;
    size_t size = sizeof(mem_size);
    if (sysctlbyname("hw.memsize", &mem_size, &size, nullptr, 0) == 0) {
        mi.total_bytes = static_cast<uint64_t>(mem_size);
    }
    vm_size_t page_size;
    vm_statistics64_data_t vm_stats;
    mach_msg_type_number_t count = sizeof(vm_stats) / sizeof(natural_t);
    if (host_page_size(mach_host_self(), &page_size) == KERN_SUCCESS &&
        host_statistics64(mach_host_self(), HOST_VM_INFO,
                          (host_info64_t)&vm_stats, &count) == KERN_SUCCESS) {
        mi.free_bytes = static_cast<uint64_t>(vm_stats.free_count) * page_size;
        mi.available_bytes = static_cast<uint64_t>(vm_stats.free_count + vm_stats.inactive_count) * page_size;
        mi.used_bytes = mi.total_bytes > mi.available_bytes ? mi.total_bytes - mi.available_bytes : 0;
    } else {
        log_error("[memory] host_statistics64 failed");
    }
#endif
    return mi;
}

void reclaim_heap() {
#if defined(__linux__) && defined(__GLIBC__)
    malloc_trim(0);
#endif
}

} // namespace core
