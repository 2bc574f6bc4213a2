// Copyright (c) 2025 VAM Desktop Live Whisper
// Console tool: transcribe a WAV with whisper.cpp, then swap to the correction worker

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/runtime.hpp"
#include "app/summary.hpp"
#include "asr/whisper_engine.hpp"
#include "asr/whisper_token_estimator.hpp"
#include "audio/wav_reader.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

static void print_usage() {
    std::cerr <<
        "usage: transcribe_and_correct <audio.wav> [options]\n"
        "  --config <file>        key = value configuration file\n"
        "  --model <name|path>    whisper model (default from config)\n"
        "  --threads <n>          whisper threads, 0 = auto\n"
        "  --no-gpu               run whisper on the CPU\n"
        "  --language <code>      spoken language and sentence rules\n"
        "  --worker \"<cmd ...>\"   correction worker command line\n"
        "  --level <name>         light | standard | strict\n"
        "  --output-dir <dir>     default: next to the audio file\n"
        "  --set key=value        any configuration key\n"
        "  -v, --verbose          debug logging\n";
}

static bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    if (!out || !(out << text << "\n")) {
        core::log_error("cannot write " + path.string());
        return false;
    }
    core::log_info("wrote " + path.string());
    return true;
}

int main(int argc, char** argv) {
    core::Config cfg = core::get_config();
    std::string input;
    std::string output_dir;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        bool ok = true;
        if (a == "-h" || a == "--help") { print_usage(); return 0; }
        if (a == "-v" || a == "--verbose") { cfg.log_level = "debug"; continue; }
        if (a == "--config" && i + 1 < argc) { ok = core::load_config(argv[++i], cfg); }
        else if (a == "--model" && i + 1 < argc) { cfg.whisper_model = argv[++i]; }
        else if (a == "--threads" && i + 1 < argc) { ok = core::apply_config_value(cfg, "whisper_threads", argv[++i]); }
        else if (a == "--no-gpu") { cfg.use_gpu = false; }
        else if (a == "--language" && i + 1 < argc) {
            cfg.transcription_language = argv[++i];
            cfg.language = cfg.transcription_language;
        }
        else if (a == "--worker" && i + 1 < argc) { ok = core::apply_config_value(cfg, "correction_command", argv[++i]); }
        else if (a == "--level" && i + 1 < argc) { ok = core::apply_config_value(cfg, "correction_level", argv[++i]); }
        else if (a == "--output-dir" && i + 1 < argc) { output_dir = argv[++i]; }
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
        std::vector<float> pcm;
        audio::WavInfo info;
        if (!audio::load_wav_16k(input, pcm, info)) {
            core::log_error("cannot decode " + input);
            return 1;
        }
        core::log_info("[audio] " + input + ": " + std::to_string(info.sample_rate) + " Hz, " +
                       std::to_string(info.channels) + " ch, " + std::to_string(info.duration_seconds) + " s");

        app::Runtime rt(cfg);
        resource::ResourceManager& rm = rt.resources();

        asr::WhisperEngineOptions wopts;
        wopts.model = cfg.whisper_model;
        wopts.threads = cfg.whisper_threads;
        wopts.use_gpu = cfg.use_gpu;
        wopts.language = cfg.transcription_language;
        rm.register_loader(resource::ResourceClass::Transcription, asr::make_whisper_loader(wopts));

        if (!rm.acquire(resource::ResourceClass::Transcription)) {
            core::log_error("whisper model could not be loaded");
            return 1;
        }

        const app::CorrectionOptions options = rt.correction_options();
        const text::BatchProcessor base = rt.pipeline().make_processor(options);
        std::string transcript;
        std::vector<text::TextChunk> chunks;
        // Chunk with the exact tokenizer while the model is still resident
        const bool ran = rm.with_resource(resource::ResourceClass::Transcription, [&](resource::ResourceHandle& h) {
            asr::WhisperEngine* engine = h.engine_as<asr::WhisperEngine>();
            if (!engine) {
                throw std::runtime_error("transcription resource is not a whisper engine");
            }
            transcript = asr::join_segments(engine->transcribe(pcm));
            if (transcript.find_first_not_of(" \t\r\n") == std::string::npos) return;
            text::BatchProcessor bp(base.options(),
                                    std::make_shared<asr::WhisperTokenEstimator>(*engine),
                                    text::make_sentence_splitter(options.language));
            chunks = bp.chunk(transcript);
        });
        if (!ran) {
            core::log_error("transcription resource vanished");
            return 1;
        }

        const std::filesystem::path in_path(input);
        const std::filesystem::path dir = output_dir.empty() ? in_path.parent_path() : std::filesystem::path(output_dir);
        const std::filesystem::path transcript_path = dir / (in_path.stem().string() + ".txt");
        if (!write_text(transcript_path, transcript)) return 1;

        if (chunks.empty()) {
            core::log_warn("no speech recognized, skipping correction");
            rm.release(resource::ResourceClass::Transcription);
            return 0;
        }

        if (!rm.swap(resource::ResourceClass::Transcription, resource::ResourceClass::Correction, options.load_config)) {
            core::log_warn("swap to correction failed");
        }
        auto progress = [](int done, int total, const std::string& status) {
            std::cout << "[progress] " << done << "/" << total << " " << status << std::endl;
        };
        const app::CorrectionOutcome outcome = rt.pipeline().correct_prepared(transcript, chunks, options, progress);

        if (!write_text(app::corrected_output_path(transcript_path.string()), outcome.corrected_text)) return 1;
        core::log_info("result: " + app::format_outcome(outcome));
        core::log_info("resources: " + app::format_metrics(rm.metrics()));
        return outcome.success ? 0 : 1;
    } catch (const std::exception& e) {
        core::log_error(std::string("transcribe_and_correct: ") + e.what());
        return 1;
    }
}
