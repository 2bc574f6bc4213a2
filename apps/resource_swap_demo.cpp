// Copyright (c) 2025 VAM Desktop Live Whisper
// resource_swap_demo - drives the resource manager with simulated engines

#include "app/summary.hpp"
#include "core/logging.hpp"
#include "resource/resource_manager.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

// Holds a block of touched memory so the swap shows up in the readings
class SimulatedEngine : public resource::InProcessEngine {
public:
    SimulatedEngine(std::string name, size_t megabytes)
        : name_(std::move(name)), block_(megabytes * 1024 * 1024, 1) {}

    std::string name() const override { return name_; }
    void shutdown() override {
        std::vector<char>().swap(block_);
    }

    size_t size_mb() const { return block_.size() / (1024 * 1024); }

private:
    std::string name_;
    std::vector<char> block_;
};

void print_step(const std::string& title, resource::ResourceManager& rm) {
    std::cout << "\n--- " << title << " ---\n";
    std::cout << app::format_status(rm.status()) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    size_t megabytes = 256;
    int rounds = 3;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mb" && i + 1 < argc) {
            megabytes = static_cast<size_t>(std::atoi(argv[++i]));
        } else if (arg == "--rounds" && i + 1 < argc) {
            rounds = std::atoi(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            core::set_log_level(core::LogLevel::Debug);
        } else {
            std::cerr << "Usage: " << argv[0] << " [--mb N] [--rounds N] [-v]\n";
            return 1;
        }
    }

    std::cout << "=== Resource Swap Demo ===\n";
    std::cout << "Engine size: " << megabytes << " MB, rounds: " << rounds << "\n";

    // Small footprints so the demo runs on any host
    resource::ResourceManagerOptions options;
    options.swap_settle = std::chrono::milliseconds(200);
    options.unload_grace = std::chrono::milliseconds(500);
    for (auto& entry : options.constraints) {
        entry.second.min_memory_gb = 0.1;
        entry.second.preferred_memory_gb = 0.5;
        entry.second.gpu_required = false;
        entry.second.handle_kind = resource::HandleKind::InProcess;
    }

    resource::ResourceManager rm(std::make_shared<core::SystemMemoryProbe>(), options);

    auto loader = [megabytes](resource::ResourceClass cls, const resource::LoadConfig&) {
        return resource::ResourceHandle::in_process(
            std::make_unique<SimulatedEngine>(resource::to_string(cls), megabytes));
    };
    rm.register_loader(resource::ResourceClass::Transcription, loader);
    rm.register_loader(resource::ResourceClass::Correction, loader);

    std::cout << "GPU acceleration: " << resource::to_string(rm.gpu_acceleration()) << "\n";
    print_step("initial", rm);

    if (!rm.acquire(resource::ResourceClass::Transcription)) {
        std::cerr << "Failed to load transcription engine\n";
        return 1;
    }
    print_step("transcription loaded", rm);

    resource::ResourceClass current = resource::ResourceClass::Transcription;
    for (int r = 0; r < rounds; ++r) {
        resource::ResourceClass next = current == resource::ResourceClass::Transcription
                                           ? resource::ResourceClass::Correction
                                           : resource::ResourceClass::Transcription;
        auto t0 = std::chrono::steady_clock::now();
        if (!rm.swap(current, next)) {
            std::cerr << "Swap " << resource::to_string(current) << " -> "
                      << resource::to_string(next) << " failed\n";
            rm.release_all();
            return 1;
        }
        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        current = next;

        rm.with_resource(current, [](resource::ResourceHandle& h) {
            if (auto* engine = h.engine_as<SimulatedEngine>()) {
                std::cout << "Using " << engine->name() << " (" << engine->size_mb() << " MB)\n";
            }
        });
        print_step("round " + std::to_string(r + 1) + " (" + std::to_string(secs) + " s)", rm);
    }

    rm.release_all();
    print_step("released", rm);

    std::cout << "\n" << app::format_metrics(rm.metrics()) << "\n";
    return 0;
}
