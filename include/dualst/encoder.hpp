#pragma once

#include <axiom/axiom.hpp>
#include <axiom/nn.hpp>

#include "dualst/config.hpp"
#include "dualst/transformer.hpp"

namespace dualst {

using namespace axiom;
using namespace axiom::nn;

// ─── Convolutional Subsampling (Conv2d, ESPnet "conv2d" input layer) ────────
//
//   Conv2d(1, d_model, 3, stride=2) → ReLU
//   Conv2d(d_model, d_model, 3, stride=2) → ReLU
//   Linear(d_model * F', d_model)      with F' = ((idim - 1) / 2 - 1) / 2
//   → scaled positional encoding
//
// Total downsample: 4x in time.

class Conv2dSubsampling : public Module {
  public:
    Conv2dSubsampling();

    // (batch, time, idim) → (batch, T', d_model)
    Tensor forward(const Tensor &input) const;
    Tensor operator()(const Tensor &input) const { return forward(input); }

    // Output length for `length` input frames.
    static int output_length(int length) { return ((length - 1) / 2 - 1) / 2; }

  private:
    Conv2d conv1_;
    Conv2d conv2_;
    Linear out_;
};

// ─── Speech Transformer Encoder ─────────────────────────────────────────────

class SpeechTransformerEncoder : public Module {
  public:
    explicit SpeechTransformerEncoder(const EncoderConfig &config = {});

    // input: (batch, time, idim) → (batch, T', hidden_size)
    Tensor forward(const Tensor &input, const Tensor &mask = Tensor()) const;
    Tensor operator()(const Tensor &input,
                      const Tensor &mask = Tensor()) const {
        return forward(input, mask);
    }

  private:
    Conv2dSubsampling embed_;
    ModuleList encoders_;
    LayerNorm after_norm_;
    bool normalize_before_ = true;
};

} // namespace dualst
