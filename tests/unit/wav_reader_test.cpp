#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include "audio/wav_reader.hpp"

static void put32(std::ofstream& f, uint32_t v) { f.write(reinterpret_cast<const char*>(&v), 4); }
static void put16(std::ofstream& f, uint16_t v) { f.write(reinterpret_cast<const char*>(&v), 2); }

// Stereo PCM16 with a LIST chunk before the data
static void write_stereo_wav(const std::string& path, int rate, const std::vector<int16_t>& interleaved) {
    std::ofstream f(path, std::ios::binary);
    const uint32_t data_bytes = static_cast<uint32_t>(interleaved.size() * 2);
    const char list_payload[] = {'I', 'N', 'F', 'O', 'x'};  // odd size, padded
    f.write("RIFF", 4);
    put32(f, 36 + 8 + 6 + 8 + data_bytes);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put32(f, 16);
    put16(f, 1);
    put16(f, 2);
    put32(f, static_cast<uint32_t>(rate));
    put32(f, static_cast<uint32_t>(rate * 4));
    put16(f, 4);
    put16(f, 16);
    f.write("LIST", 4);
    put32(f, 5);
    f.write(list_payload, 5);
    f.put('\0');
    f.write("data", 4);
    put32(f, data_bytes);
    f.write(reinterpret_cast<const char*>(interleaved.data()), data_bytes);
}

int main() {
    const std::string path = "/tmp/localscribe_wav_reader_test.wav";
    std::vector<int16_t> samples;
    for (int i = 0; i < 8000; ++i) {
        samples.push_back(16384);   // left
        samples.push_back(-16384);  // right
    }
    samples[0] = 16384;
    samples[1] = 16384;
    write_stereo_wav(path, 8000, samples);

    std::vector<float> mono;
    audio::WavInfo info;
    assert(audio::read_wav_mono(path, mono, info));
    assert(info.sample_rate == 8000);
    assert(info.channels == 2);
    assert(info.bits_per_sample == 16);
    assert(mono.size() == 8000);
    assert(std::fabs(info.duration_seconds - 1.0) < 1e-9);
    assert(std::fabs(mono[0] - 0.5f) < 1e-6f);
    assert(std::fabs(mono[1]) < 1e-6f);

    std::vector<float> pcm;
    assert(audio::load_wav_16k(path, pcm, info));
    assert(pcm.size() == 16000);

    auto same = audio::resample_linear(mono, 8000, 8000);
    assert(same.size() == mono.size());
    auto ramp = audio::resample_linear({0.0f, 1.0f}, 1, 2);
    assert(ramp.size() == 4);
    assert(std::fabs(ramp[1] - 0.5f) < 1e-6f);

    std::remove(path.c_str());
    assert(!audio::read_wav_mono(path, mono, info));

    // Not a WAV file
    {
        std::ofstream f(path, std::ios::binary);
        f << "this is definitely not a riff header, just text padding it out";
    }
    assert(!audio::read_wav_mono(path, mono, info));
    std::remove(path.c_str());
    return 0;
}
