// Copyright (c) 2025 VAM Desktop Live Whisper
// Client for the correction worker process

#include "llm/process_corrector.hpp"
#include "core/logging.hpp"

#include <memory>
#include <stdexcept>

namespace llm {

std::string escape_line(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out.push_back(c); break;
        }
    }
    return out;
}

std::string unescape_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out.push_back(s[i]);
            continue;
        }
        const char n = s[++i];
        if (n == 'n') out.push_back('\n');
        else if (n == 'r') out.push_back('\r');
        else if (n == '\\') out.push_back('\\');
        else { out.push_back('\\'); out.push_back(n); }
    }
    return out;
}

std::string clean_model_output(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    bool space = false;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            space = !t.empty();
            continue;
        }
        if (space) { t.push_back(' '); space = false; }
        t.push_back(c);
    }
    // Wrapping quotes
    while (t.size() >= 2 && ((t.front() == '"' && t.back() == '"') || (t.front() == '\'' && t.back() == '\''))) {
        t = t.substr(1, t.size() - 2);
        size_t a = t.find_first_not_of(' ');
        size_t b = t.find_last_not_of(' ');
        t = (a == std::string::npos) ? std::string() : t.substr(a, b - a + 1);
    }
    return t;
}

ProcessCorrector::ProcessCorrector(CorrectorOptions options)
    : options_(std::move(options)) {
    if (options_.context_length < 16) {
        throw std::invalid_argument("context_length too small");
    }
}

int ProcessCorrector::max_chunk_tokens() const {
    return static_cast<int>(options_.context_length * 0.6);
}

std::string ProcessCorrector::correct(core::NativeProcess& worker, const text::PromptRequest& request) const {
    const text::CorrectionPrompt prompt = text::build_correction_prompt(request);

    if (!worker.write_line(escape_line(prompt.combined()))) {
        throw std::runtime_error("correction worker closed its input");
    }
    std::string line;
    if (!worker.read_line(line, options_.response_timeout)) {
        if (!worker.is_running()) {
            throw std::runtime_error("correction worker exited");
        }
        core::log_error("[llm] no response within " + std::to_string(options_.response_timeout.count()) +
                        " ms, stopping worker pid " + std::to_string(worker.pid()));
        if (!worker.terminate(std::chrono::milliseconds(2000))) {
            core::log_warn("[llm] worker had to be killed");
        }
        throw std::runtime_error("correction worker timed out");
    }
    std::string out = clean_model_output(unescape_line(line));
    if (out.empty()) {
        throw std::runtime_error("correction worker returned an empty answer");
    }
    return out;
}

resource::Loader make_worker_loader(std::vector<std::string> default_command) {
    return [default_command](resource::ResourceClass, const resource::LoadConfig& cfg) {
        std::vector<std::string> argv = cfg.command.empty() ? default_command : cfg.command;
        if (argv.empty()) {
            throw std::runtime_error("no correction worker command configured");
        }
        if (!cfg.model.empty()) {
            argv.push_back("--model");
            argv.push_back(cfg.model);
        }

        // Remaining extras become worker options: --temperature 0.3 ...
        std::chrono::milliseconds ready_timeout(120000);
        for (const auto& kv : cfg.extra) {
            if (kv.first == "ready_timeout_ms") {
                ready_timeout = std::chrono::milliseconds(std::stoi(kv.second));
                continue;
            }
            argv.push_back("--" + kv.first);
            argv.push_back(kv.second);
        }

        auto proc = std::make_unique<core::NativeProcess>();
        if (!proc->start(argv)) {
            throw std::runtime_error("failed to start correction worker " + argv[0]);
        }
        std::string line;
        if (!proc->read_line(line, ready_timeout) || line != kReadyLine) {
            if (!proc->terminate(std::chrono::milliseconds(1000))) {
                core::log_warn("[llm] unresponsive worker killed");
            }
            throw std::runtime_error("correction worker " + argv[0] + " did not report " + kReadyLine);
        }
        core::log_info("[llm] worker ready, pid " + std::to_string(proc->pid()));
        return resource::ResourceHandle::native_process(std::move(proc));
    };
}

} // namespace llm
