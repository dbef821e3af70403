#include "dualst/encoder.hpp"

#include <stdexcept>
#include <string>

namespace dualst {

// ─── Conv2dSubsampling ───────────────────────────────────────────────────────

Conv2dSubsampling::Conv2dSubsampling()
    : conv1_(/*stride=*/{2, 2}, /*padding=*/{0, 0}),
      conv2_(/*stride=*/{2, 2}, /*padding=*/{0, 0}), out_(true) {
    AX_REGISTER_MODULES(conv1_, conv2_, out_);
}

Tensor Conv2dSubsampling::forward(const Tensor &input) const {
    auto frames = static_cast<int>(input.shape()[1]);
    if (output_length(frames) < 1) {
        throw std::runtime_error("Input too short for conv2d subsampling: " +
                                 std::to_string(frames) + " frames");
    }

    auto x = input.unsqueeze(1); // (batch, 1, time, idim)
    x = ops::relu(conv1_(x));
    x = ops::relu(conv2_(x));

    // (batch, C, T', F') → (batch, T', C * F')
    auto shape = x.shape();
    x = x.permute({0, 2, 1, 3});
    x = x.ascontiguousarray();
    x = x.reshape({shape[0], shape[2], shape[1] * shape[3]});

    return add_positional_encoding(out_(x));
}

// ─── SpeechTransformerEncoder ────────────────────────────────────────────────

SpeechTransformerEncoder::SpeechTransformerEncoder(const EncoderConfig &config)
    : normalize_before_(config.normalize_before) {
    for (int i = 0; i < config.num_layers; ++i) {
        encoders_.emplace_back<EncoderLayer>(config.num_heads,
                                             config.normalize_before);
    }
    if (normalize_before_) {
        AX_REGISTER_MODULES(embed_, encoders_, after_norm_);
    } else {
        AX_REGISTER_MODULES(embed_, encoders_);
    }
}

Tensor SpeechTransformerEncoder::forward(const Tensor &input,
                                         const Tensor &mask) const {
    auto x = embed_(input);
    for (const auto &layer : encoders_.each<EncoderLayer>()) {
        x = layer(x, mask);
    }
    if (normalize_before_) {
        return after_norm_(x);
    }
    return x;
}

} // namespace dualst
