#include "dualst/wav.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace dualst {

namespace {

struct ChunkHeader {
    char id[4];
    uint32_t size;
};

struct FmtChunk {
    uint16_t audio_format;
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
};

std::vector<float> decode_samples(std::ifstream &file, const FmtChunk &fmt,
                                  uint32_t size, const std::string &path) {
    std::vector<float> samples;
    if (fmt.audio_format == 1 && fmt.bits_per_sample == 16) {
        std::vector<int16_t> raw(size / sizeof(int16_t));
        file.read(reinterpret_cast<char *>(raw.data()),
                  raw.size() * sizeof(int16_t));
        samples.resize(raw.size());
        for (size_t i = 0; i < raw.size(); ++i)
            samples[i] = static_cast<float>(raw[i]) / 32768.0f;
    } else if (fmt.audio_format == 3 && fmt.bits_per_sample == 32) {
        samples.resize(size / sizeof(float));
        file.read(reinterpret_cast<char *>(samples.data()),
                  samples.size() * sizeof(float));
    } else {
        throw std::runtime_error(
            "Unsupported WAV format " + std::to_string(fmt.audio_format) +
            " with " + std::to_string(fmt.bits_per_sample) + " bits: " + path);
    }
    if (!file) {
        throw std::runtime_error("Truncated WAV data chunk: " + path);
    }
    return samples;
}

} // namespace

WavData read_wav(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open WAV file: " + path);
    }

    char riff[4], wave[4];
    uint32_t riff_size = 0;
    file.read(riff, 4);
    file.read(reinterpret_cast<char *>(&riff_size), sizeof(riff_size));
    file.read(wave, 4);
    if (!file || std::strncmp(riff, "RIFF", 4) != 0 ||
        std::strncmp(wave, "WAVE", 4) != 0) {
        throw std::runtime_error("Not a RIFF/WAVE file: " + path);
    }

    FmtChunk fmt{};
    bool found_fmt = false;
    std::vector<float> samples;

    // Chunks are word-aligned and may appear in any order before "data".
    ChunkHeader chunk{};
    while (file.read(reinterpret_cast<char *>(&chunk), sizeof(chunk))) {
        auto body = file.tellg();
        if (std::strncmp(chunk.id, "fmt ", 4) == 0) {
            file.read(reinterpret_cast<char *>(&fmt),
                      std::min<size_t>(chunk.size, sizeof(fmt)));
            found_fmt = true;
        } else if (std::strncmp(chunk.id, "data", 4) == 0) {
            if (!found_fmt) {
                throw std::runtime_error("WAV data chunk before fmt: " + path);
            }
            samples = decode_samples(file, fmt, chunk.size, path);
            break;
        }
        file.seekg(body + static_cast<std::streamoff>((chunk.size + 1) & ~1u));
    }

    if (!found_fmt || samples.empty() || fmt.num_channels == 0) {
        throw std::runtime_error("WAV file has no usable audio: " + path);
    }

    int channels = fmt.num_channels;
    int frames = static_cast<int>(samples.size()) / channels;
    std::vector<float> mono(frames);
    for (int i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c)
            sum += samples[static_cast<size_t>(i) * channels + c];
        mono[i] = sum / static_cast<float>(channels);
    }

    return WavData{
        axiom::Tensor::from_data(mono.data(), {mono.size()}, true),
        static_cast<int>(fmt.sample_rate),
        channels,
        frames,
    };
}

} // namespace dualst
