// Copyright (c) 2025 VAM Desktop Live Whisper
// WAV decoding to 16 kHz mono float PCM for transcription

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace audio {

struct WavInfo {
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;
    double duration_seconds = 0.0;
};

// Reads PCM16 or float32 WAV with any channel count, downmixes to mono.
// Returns false for missing, malformed or unsupported files.
bool read_wav_mono(const std::string& path, std::vector<float>& mono, WavInfo& info);

// Linear interpolation resampler.
std::vector<float> resample_linear(const std::vector<float>& in, int in_hz, int out_hz);

// read_wav_mono + resample to 16 kHz
bool load_wav_16k(const std::string& path, std::vector<float>& pcm_16k, WavInfo& info);

} // namespace audio
