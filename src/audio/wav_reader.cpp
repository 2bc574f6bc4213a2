// Copyright (c) 2025 VAM Desktop Live Whisper
// WAV decoding to 16 kHz mono float PCM for transcription

#include "audio/wav_reader.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

namespace audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};
} // namespace

bool read_wav_mono(const std::string& path, std::vector<float>& mono, WavInfo& info) {
    mono.clear();
    info = WavInfo{};

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        core::log_error("[wav] cannot open " + path);
        return false;
    }
    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) return false;
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0 ||
        std::strncmp(hdr.fmt, "fmt ", 4) != 0) {
        core::log_error("[wav] not a RIFF/WAVE file: " + path);
        return false;
    }
    if (hdr.numChannels == 0 || hdr.sampleRate == 0) return false;

    // Skip optional fmt extension, then find the data chunk
    uint32_t fmtExtra = hdr.subchunk1Size > 16 ? hdr.subchunk1Size - 16 : 0;
    if (fmtExtra) f.seekg(fmtExtra, std::ios::cur);

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) return false;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        // chunks are word aligned
        f.seekg(chunkSize + (chunkSize & 1u), std::ios::cur);
    }
    if (!found) {
        core::log_error("[wav] no data chunk in " + path);
        return false;
    }

    const uint16_t ch = hdr.numChannels;
    const size_t bytesPerSample = hdr.bitsPerSample / 8;
    if (bytesPerSample == 0) return false;
    const size_t frameCount = chunkSize / (bytesPerSample * ch);
    mono.resize(frameCount);

    if (hdr.audioFormat == 1 && hdr.bitsPerSample == 16) {
        std::vector<int16_t> buf(frameCount * ch);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(int16_t))) return false;
        constexpr float scale = 1.0f / 32768.0f;
        for (size_t i = 0; i < frameCount; ++i) {
            int sum = 0;
            for (uint16_t c = 0; c < ch; ++c) sum += buf[i * ch + c];
            mono[i] = static_cast<float>(sum) / ch * scale;
        }
    } else if (hdr.audioFormat == 3 && hdr.bitsPerSample == 32) {
        std::vector<float> buf(frameCount * ch);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(float))) return false;
        for (size_t i = 0; i < frameCount; ++i) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < ch; ++c) sum += buf[i * ch + c];
            mono[i] = std::clamp(sum / ch, -1.0f, 1.0f);
        }
    } else {
        core::log_error("[wav] unsupported format " + std::to_string(hdr.audioFormat) + "/" +
                        std::to_string(hdr.bitsPerSample) + " bit in " + path);
        mono.clear();
        return false;
    }

    info.sample_rate = static_cast<int>(hdr.sampleRate);
    info.channels = ch;
    info.bits_per_sample = hdr.bitsPerSample;
    info.duration_seconds = static_cast<double>(frameCount) / hdr.sampleRate;
    return true;
}

std::vector<float> resample_linear(const std::vector<float>& in, int in_hz, int out_hz) {
    if (in_hz == out_hz || in_hz <= 0 || out_hz <= 0 || in.empty()) return in;
    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in.size() * ratio));
    std::vector<float> out(out_len);
    // Linear interpolation on sample positions
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in.size() - 1);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double frac = src_pos - static_cast<double>(i0);
        out[i] = static_cast<float>((1.0 - frac) * in[i0] + frac * in[i1]);
    }
    return out;
}

bool load_wav_16k(const std::string& path, std::vector<float>& pcm_16k, WavInfo& info) {
    std::vector<float> mono;
    if (!read_wav_mono(path, mono, info)) return false;
    pcm_16k = resample_linear(mono, info.sample_rate, 16000);
    return true;
}

} // namespace audio
