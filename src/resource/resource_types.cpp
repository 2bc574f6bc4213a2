// Copyright (c) 2025 VAM Desktop Live Whisper
// Resource classes, per-class constraints and the owned instance handle

#include "resource/resource_types.hpp"

#include <filesystem>
#include <stdexcept>

namespace resource {

const ConstraintsTable& default_constraints() {
    static const ConstraintsTable table = {
        {ResourceClass::Transcription, {2.0, 4.0, false, 1, HandleKind::InProcess}},
        {ResourceClass::Correction, {6.0, 8.0, false, 1, HandleKind::NativeProcess}},
    };
    return table;
}

const char* to_string(ResourceClass cls) {
    switch (cls) {
    case ResourceClass::Transcription: return "transcription";
    case ResourceClass::Correction: return "correction";
    }
    return "unknown";
}

const char* to_string(HandleKind kind) {
    switch (kind) {
    case HandleKind::NativeProcess: return "native_process";
    case HandleKind::InProcess: return "in_process";
    }
    return "unknown";
}

const char* to_string(GpuAcceleration gpu) {
    switch (gpu) {
    case GpuAcceleration::Cpu: return "cpu";
    case GpuAcceleration::Cuda: return "cuda";
    case GpuAcceleration::Metal: return "metal";
    }
    return "cpu";
}

ResourceClass parse_resource_class(const std::string& name) {
    if (name == "transcription" || name == "whisper") return ResourceClass::Transcription;
    if (name == "correction" || name == "llm") return ResourceClass::Correction;
    throw std::invalid_argument("unknown resource class: " + name);
}

GpuAcceleration detect_gpu_acceleration() {
#if defined(__APPLE__)
    return GpuAcceleration::Metal;
#else
    std::error_code ec;
    if (std::filesystem::exists("/proc/driver/nvidia/version", ec)) {
        return GpuAcceleration::Cuda;
    }
    return GpuAcceleration::Cpu;
#endif
}

ResourceHandle ResourceHandle::native_process(std::unique_ptr<core::NativeProcess> process) {
    ResourceHandle h;
    h.kind_ = HandleKind::NativeProcess;
    h.process_ = std::move(process);
    return h;
}

ResourceHandle ResourceHandle::in_process(std::unique_ptr<InProcessEngine> engine) {
    ResourceHandle h;
    h.kind_ = HandleKind::InProcess;
    h.engine_ = std::move(engine);
    return h;
}

std::optional<int> ResourceHandle::process_id() const {
    if (process_ && process_->pid() > 0) return static_cast<int>(process_->pid());
    return std::nullopt;
}

} // namespace resource
