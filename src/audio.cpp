#include "dualst/audio.hpp"

#include <axiom/fft.hpp>
#include <axiom/io/numpy.hpp>

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <stdexcept>

namespace dualst {

using namespace axiom;

// ─── HTK Mel Scale (matches Kaldi) ───────────────────────────────────────────

namespace detail {

double hz_to_mel_htk(double freq) { return 1127.0 * std::log1p(freq / 700.0); }

// Triangular filters evenly spaced on the mel scale. Kaldi skips the Nyquist
// bin, so its row stays zero.
// Returns: (n_fft / 2 + 1, num_bins)
Tensor build_kaldi_mel_banks(const FbankConfig &config) {
    int n_freqs = config.n_fft / 2 + 1;
    int num_bins = config.num_mel_bins;
    double nyquist = 0.5 * config.sample_rate;
    double high = config.high_freq > 0.0f ? config.high_freq
                                          : nyquist + config.high_freq;
    if (config.low_freq < 0.0f || high <= config.low_freq || high > nyquist) {
        throw std::invalid_argument("Bad mel frequency range [" +
                                    std::to_string(config.low_freq) + ", " +
                                    std::to_string(high) + "]");
    }

    double mel_low = hz_to_mel_htk(config.low_freq);
    double mel_high = hz_to_mel_htk(high);
    double mel_delta = (mel_high - mel_low) / (num_bins + 1);
    double bin_width = static_cast<double>(config.sample_rate) / config.n_fft;

    std::vector<float> fb(static_cast<size_t>(n_freqs) * num_bins, 0.0f);
    for (int m = 0; m < num_bins; ++m) {
        double left = mel_low + m * mel_delta;
        double center = left + mel_delta;
        double right = center + mel_delta;
        for (int f = 0; f < config.n_fft / 2; ++f) {
            double mel = hz_to_mel_htk(bin_width * f);
            if (mel <= left || mel >= right)
                continue;
            double w = mel <= center ? (mel - left) / (center - left)
                                     : (right - mel) / (right - center);
            fb[static_cast<size_t>(f) * num_bins + m] = static_cast<float>(w);
        }
    }
    return Tensor::from_data(
        fb.data(),
        Shape{static_cast<size_t>(n_freqs), static_cast<size_t>(num_bins)},
        true);
}

std::vector<float> povey_window(int length) {
    std::vector<float> w(length);
    double a = 2.0 * M_PI / (length - 1);
    for (int i = 0; i < length; ++i) {
        w[i] = static_cast<float>(std::pow(0.5 - 0.5 * std::cos(a * i), 0.85));
    }
    return w;
}

} // namespace detail

// ─── Filterbank ──────────────────────────────────────────────────────────────

Tensor compute_fbank(const Tensor &samples, const FbankConfig &config) {
    if (config.frame_length < 2 || config.frame_shift < 1 ||
        config.n_fft < config.frame_length || config.num_mel_bins < 1) {
        throw std::invalid_argument("Bad fbank framing configuration");
    }

    auto x = samples.cpu().ascontiguousarray();
    if (x.shape().size() != 1) {
        throw std::invalid_argument("compute_fbank expects 1D samples");
    }
    int n = static_cast<int>(x.shape()[0]);
    if (n < config.frame_length) {
        throw std::invalid_argument(
            "Audio too short: " + std::to_string(n) + " samples, need " +
            std::to_string(config.frame_length));
    }
    const float *src = x.typed_data<float>();

    int n_frames = 1 + (n - config.frame_length) / config.frame_shift;
    auto window = detail::povey_window(config.frame_length);

    // 1. Per-frame processing, each frame zero-padded to n_fft
    std::vector<float> frames(static_cast<size_t>(n_frames) * config.n_fft,
                              0.0f);
    for (int t = 0; t < n_frames; ++t) {
        float *frame = frames.data() + static_cast<size_t>(t) * config.n_fft;
        const float *in = src + static_cast<size_t>(t) * config.frame_shift;
        for (int i = 0; i < config.frame_length; ++i) {
            frame[i] = in[i] * 32768.0f; // Kaldi works on int16 amplitudes
        }

        if (config.remove_dc_offset) {
            double mean = 0.0;
            for (int i = 0; i < config.frame_length; ++i)
                mean += frame[i];
            mean /= config.frame_length;
            for (int i = 0; i < config.frame_length; ++i)
                frame[i] -= static_cast<float>(mean);
        }

        if (config.preemph != 0.0f) {
            for (int i = config.frame_length - 1; i > 0; --i)
                frame[i] -= config.preemph * frame[i - 1];
            frame[0] -= config.preemph * frame[0];
        }

        for (int i = 0; i < config.frame_length; ++i)
            frame[i] *= window[i];
    }

    // 2. Frames laid end to end, so a rectangular STFT with hop = n_fft
    //    transforms each one independently
    auto framed = Tensor::from_data(
        frames.data(), Shape{static_cast<size_t>(n_frames) * config.n_fft},
        true);
    std::vector<float> ones(config.n_fft, 1.0f);
    auto rect = Tensor::from_data(ones.data(),
                                  Shape{static_cast<size_t>(config.n_fft)}, true);
    auto spec = fft::stft(framed, config.n_fft, config.n_fft, config.n_fft,
                          rect, /*center=*/false, /*pad_mode=*/"reflect");

    // 3. Power spectrum and mel filterbank
    auto magnitudes = ops::abs(spec); // (n_fft/2+1, n_frames)
    auto power = magnitudes * magnitudes;
    auto mel_fb = detail::build_kaldi_mel_banks(config);
    auto mel = ops::matmul(mel_fb.transpose(), power) // (bins, n_frames)
                   .transpose()
                   .cpu()
                   .ascontiguousarray();

    // 4. Log with Kaldi's energy floor
    size_t total = static_cast<size_t>(n_frames) * config.num_mel_bins;
    const float *energies = mel.typed_data<float>();
    std::vector<float> out(total);
    for (size_t i = 0; i < total; ++i) {
        out[i] = std::log(std::max(energies[i], FLT_EPSILON));
    }
    return Tensor::from_data(out.data(),
                             Shape{static_cast<size_t>(n_frames),
                                   static_cast<size_t>(config.num_mel_bins)},
                             true);
}

// ─── GlobalCMVN ──────────────────────────────────────────────────────────────

void GlobalCMVN::load(const std::string &npy_path) {
    auto stats = axiom::io::numpy::load(npy_path).cpu().ascontiguousarray();
    if (stats.shape().size() != 2 || stats.shape()[0] != 2 ||
        stats.shape()[1] < 2) {
        throw std::runtime_error("CMVN stats must be (2, D + 1): " + npy_path);
    }
    size_t cols = stats.shape()[1];
    size_t dim = cols - 1;

    std::vector<double> values(2 * cols);
    if (stats.dtype() == DType::Float64) {
        const double *d = stats.typed_data<double>();
        values.assign(d, d + 2 * cols);
    } else if (stats.dtype() == DType::Float32) {
        const float *d = stats.typed_data<float>();
        values.assign(d, d + 2 * cols);
    } else {
        throw std::runtime_error("CMVN stats must be float32 or float64: " +
                                 npy_path);
    }

    std::vector<double> sum(values.begin(), values.begin() + dim);
    std::vector<double> sumsq(values.begin() + cols,
                              values.begin() + cols + dim);
    set_stats(sum, sumsq, values[dim]);
}

void GlobalCMVN::set_stats(const std::vector<double> &sum,
                           const std::vector<double> &sumsq, double count) {
    if (sum.empty() || sum.size() != sumsq.size()) {
        throw std::invalid_argument("CMVN sum and sumsq sizes differ");
    }
    if (count < 1.0) {
        throw std::invalid_argument("CMVN frame count must be >= 1");
    }
    mean_.resize(sum.size());
    inv_std_.resize(sum.size());
    for (size_t i = 0; i < sum.size(); ++i) {
        double mean = sum[i] / count;
        double var = std::max(sumsq[i] / count - mean * mean, 1.0e-20);
        mean_[i] = static_cast<float>(mean);
        inv_std_[i] = norm_vars_ ? static_cast<float>(1.0 / std::sqrt(var))
                                 : 1.0f;
    }
}

Tensor GlobalCMVN::apply(const Tensor &features) const {
    if (!loaded()) {
        throw std::runtime_error("GlobalCMVN::apply called before load");
    }
    auto dims = features.shape();
    if (dims.empty() || static_cast<int>(dims.back()) != dim()) {
        throw std::invalid_argument("CMVN dim " + std::to_string(dim()) +
                                    " does not match feature dim");
    }
    auto d = Shape{static_cast<size_t>(dim())};
    auto mean = Tensor::from_data(mean_.data(), d, true).to(features.device());
    auto scale =
        Tensor::from_data(inv_std_.data(), d, true).to(features.device());
    return (features - mean) * scale;
}

} // namespace dualst
