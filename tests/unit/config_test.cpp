#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/logging.hpp"

int main() {
    core::Config cfg;
    assert(cfg.context_length == 2048);
    assert(cfg.correction_level == "standard");
    assert(cfg.memory_warning_threshold == 0.80);
    assert(cfg.memory_critical_threshold == 0.90);

    assert(core::apply_config_value(cfg, "max_parallel_chunks", "3"));
    assert(cfg.max_parallel_chunks == 3);
    assert(!core::apply_config_value(cfg, "max_parallel_chunks", "0"));
    assert(!core::apply_config_value(cfg, "context_length", "12x"));
    assert(core::apply_config_value(cfg, "use_gpu", "off"));
    assert(!cfg.use_gpu);
    assert(!core::apply_config_value(cfg, "use_gpu", "vielleicht"));
    assert(!cfg.neighbor_context);
    assert(core::apply_config_value(cfg, "neighbor_context", "true"));
    assert(cfg.neighbor_context);
    assert(core::apply_config_value(cfg, "temperature", "0.7"));
    assert(cfg.temperature == 0.7);
    assert(!core::apply_config_value(cfg, "token_strategy", "bytes"));
    assert(!core::apply_config_value(cfg, "no_such_key", "1"));
    assert(!core::apply_config_value(cfg, "log_level", "loud"));

    auto argv = core::split_command_line("python3 \"/opt/my worker/run.py\"  --fast ");
    assert(argv.size() == 3);
    assert(argv[0] == "python3");
    assert(argv[1] == "/opt/my worker/run.py");
    assert(argv[2] == "--fast");
    assert(core::split_command_line("   ").empty());

    const std::string path = "/tmp/localscribe_config_test.conf";
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "\n"
          << "correction_command = ./worker --threads 4\n"
          << "correction_level=strict\n"
          << "overlap_sentences = 2\n"
          << "not a pair\n"
          << "unknown_key = 5\n"
          << "monitoring_enabled = yes\n";
    }
    core::Config file_cfg;
    assert(core::load_config(path, file_cfg));
    assert(file_cfg.correction_command.size() == 3);
    assert(file_cfg.correction_command[0] == "./worker");
    assert(file_cfg.correction_level == "strict");
    assert(file_cfg.overlap_sentences == 2);
    assert(file_cfg.monitoring_enabled);
    std::remove(path.c_str());
    assert(!core::load_config(path, file_cfg));

    setenv("LOCALSCRIBE_CORRECTION_LEVEL", "light", 1);
    setenv("LOCALSCRIBE_SWAP_SETTLE_MS", "100", 1);
    setenv("LOCALSCRIBE_CONTEXT_LENGTH", "nope", 1);
    core::apply_env_overrides(file_cfg);
    assert(file_cfg.correction_level == "light");
    assert(file_cfg.swap_settle_ms == 100);
    assert(file_cfg.context_length == 2048);

    core::LogLevel lvl;
    assert(core::parse_log_level("debug", lvl) && lvl == core::LogLevel::Debug);
    assert(core::parse_log_level("warn", lvl) && lvl == core::LogLevel::Warning);
    assert(!core::parse_log_level("chatty", lvl));

    // Sink sees formatted lines at or above the active level
    std::vector<std::string> lines;
    core::set_log_sink([&lines](core::LogLevel, const std::string& line) { lines.push_back(line); });
    core::set_log_level(core::LogLevel::Warning);
    core::log_info("[test] hidden");
    core::log_warn("[test] shown");
    core::set_log_sink({});
    core::log_error("[test] after sink removed");
    assert(lines.size() == 1);
    assert(lines[0] == "[WARN] [test] shown");
    assert(core::log_level() == core::LogLevel::Warning);
    return 0;
}
