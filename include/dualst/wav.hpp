#pragma once

#include <string>

#include <axiom/axiom.hpp>

namespace dualst {

struct WavData {
    axiom::Tensor samples; // float32 mono, shape (num_samples,)
    int sample_rate;
    int num_channels; // before downmix
    int num_samples;
};

// 16-bit PCM (format 1) or 32-bit float (format 3), samples in [-1, 1].
// Multi-channel input is averaged to mono.
WavData read_wav(const std::string &path);

} // namespace dualst
