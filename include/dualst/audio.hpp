#pragma once

#include <string>
#include <vector>

#include <axiom/axiom.hpp>

namespace dualst {

struct FbankConfig {
    int sample_rate = 16000;
    int frame_length = 400; // 25 ms
    int frame_shift = 160;  // 10 ms
    int n_fft = 512;        // frame_length rounded up to a power of two
    int num_mel_bins = 80;
    float preemph = 0.97f;
    float low_freq = 20.0f;
    float high_freq = 0.0f; // <= 0 is an offset from Nyquist
    bool remove_dc_offset = true;
};

// Kaldi-compatible log mel filterbank (the features ESPnet recipes train on):
//   int16 scaling -> framing (no centre padding) -> DC removal ->
//   pre-emphasis -> Povey window -> |FFT|^2 -> HTK mel -> log
// Input:  1D float32 tensor (num_samples,) in [-1, 1]
// Output: (n_frames, num_mel_bins) float32
// Throws std::invalid_argument when the audio is shorter than one frame.
axiom::Tensor compute_fbank(const axiom::Tensor &samples,
                            const FbankConfig &config = {});

// Utterance-independent mean/variance normalization from Kaldi global stats.
// Stats layout (2, D + 1): row 0 = [sum_1..sum_D, count],
//                          row 1 = [sumsq_1..sumsq_D, 0]
class GlobalCMVN {
  public:
    explicit GlobalCMVN(bool norm_vars = true) : norm_vars_(norm_vars) {}

    void load(const std::string &npy_path);
    void set_stats(const std::vector<double> &sum,
                   const std::vector<double> &sumsq, double count);

    bool loaded() const { return !mean_.empty(); }
    int dim() const { return static_cast<int>(mean_.size()); }

    // (T, D) or (1, T, D) -> same shape
    axiom::Tensor apply(const axiom::Tensor &features) const;

  private:
    bool norm_vars_;
    std::vector<float> mean_;
    std::vector<float> inv_std_;
};

} // namespace dualst
