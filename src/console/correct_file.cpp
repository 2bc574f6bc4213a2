// Copyright (c) 2025 VAM Desktop Live Whisper
// Console tool: correct a transcript file through the local correction worker

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "app/runtime.hpp"
#include "app/summary.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

static void print_usage() {
    std::cerr <<
        "usage: correct_file <input.txt> [options]\n"
        "  --config <file>        key = value configuration file\n"
        "  --worker \"<cmd ...>\"   correction worker command line\n"
        "  --model <path>         model passed to the worker\n"
        "  --level <name>         light | standard | strict\n"
        "  --language <code>      sentence rules and prompt wording (de, en)\n"
        "  --dialect              normalize dialect to standard German\n"
        "  --context              send neighbouring chunks as prompt context\n"
        "  --overlap <n>          overlapping sentences between chunks\n"
        "  --parallel <n>         chunks in flight (1 = sequential)\n"
        "  --no-fallback          fail instead of rule-based correction\n"
        "  --output <file>        default: <stem>_corrected<ext>\n"
        "  --set key=value        any configuration key\n"
        "  -v, --verbose          debug logging\n";
}

int main(int argc, char** argv) {
    core::Config cfg = core::get_config();
    std::string input;
    std::string output;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        bool ok = true;
        if (a == "-h" || a == "--help") { print_usage(); return 0; }
        if (a == "-v" || a == "--verbose") { cfg.log_level = "debug"; continue; }
        if (a == "--config" && i + 1 < argc) { ok = core::load_config(argv[++i], cfg); }
        else if (a == "--worker" && i + 1 < argc) { ok = core::apply_config_value(cfg, "correction_command", argv[++i]); }
        else if (a == "--model" && i + 1 < argc) { ok = core::apply_config_value(cfg, "correction_model_path", argv[++i]); }
        else if (a == "--level" && i + 1 < argc) { ok = core::apply_config_value(cfg, "correction_level", argv[++i]); }
        else if (a == "--language" && i + 1 < argc) { ok = core::apply_config_value(cfg, "language", argv[++i]); }
        else if (a == "--dialect") { cfg.dialect_normalization = true; }
        else if (a == "--context") { cfg.neighbor_context = true; }
        else if (a == "--overlap" && i + 1 < argc) { ok = core::apply_config_value(cfg, "overlap_sentences", argv[++i]); }
        else if (a == "--parallel" && i + 1 < argc) { ok = core::apply_config_value(cfg, "max_parallel_chunks", argv[++i]); }
        else if (a == "--no-fallback") { cfg.fallback_on_error = false; }
        else if (a == "--output" && i + 1 < argc) { output = argv[++i]; }
        else if (a == "--set" && i + 1 < argc) {
            std::string kv = argv[++i];
            size_t eq = kv.find('=');
            ok = eq != std::string::npos && core::apply_config_value(cfg, kv.substr(0, eq), kv.substr(eq + 1));
        }
        else if (input.empty() && a.rfind("-", 0) != 0) { input = a; }
        else { ok = false; }
        if (!ok) {
            std::cerr << "invalid argument: " << a << "\n";
            print_usage();
            return 2;
        }
    }
    if (input.empty()) {
        print_usage();
        return 2;
    }
    core::LogLevel lvl;
    if (core::parse_log_level(cfg.log_level, lvl)) core::set_log_level(lvl);

    try {
        std::ifstream in(input, std::ios::binary);
        if (!in) {
            core::log_error("cannot read " + input);
            return 1;
        }
        std::stringstream ss;
        ss << in.rdbuf();
        const std::string transcript = ss.str();

        app::Runtime rt(cfg);
        core::log_info(app::format_availability(rt.availability()));

        const app::CorrectionOptions options = rt.correction_options();
        auto progress = [](int done, int total, const std::string& status) {
            std::cout << "[progress] " << done << "/" << total << " " << status << std::endl;
        };
        const app::CorrectionOutcome outcome = rt.pipeline().correct(transcript, options, progress);

        if (output.empty()) output = app::corrected_output_path(input);
        std::ofstream out(output, std::ios::binary);
        if (!out || !(out << outcome.corrected_text << "\n")) {
            core::log_error("cannot write " + output);
            return 1;
        }
        core::log_info("wrote " + output);
        core::log_info("result: " + app::format_outcome(outcome));
        core::log_info("resources: " + app::format_metrics(rt.resources().metrics()));
        return outcome.success ? 0 : 1;
    } catch (const std::exception& e) {
        core::log_error(std::string("correct_file: ") + e.what());
        return 1;
    }
}
