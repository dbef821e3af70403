#pragma once

#include <axiom/axiom.hpp>
#include <axiom/nn.hpp>

namespace dualst {

using namespace axiom;
using namespace axiom::nn;

// ─── Scaled Dot-Product Multi-Head Attention ────────────────────────────────

// query: (batch, q_len, d_model), key/value: (batch, kv_len, d_model)
// mask: (1, 1, q_len, kv_len) with 1.0 at blocked positions, or empty.
// Fully blocked rows produce zero context vectors.
Tensor multi_head_attention(const MultiHeadAttention &mha, const Tensor &query,
                            const Tensor &key, const Tensor &value,
                            const Tensor &mask = Tensor());

// ─── Absolute Sinusoidal Positional Encoding ────────────────────────────────

// (seq_len, d_model): pe[pos, 2i] = sin(pos / 10000^(2i/d)),
//                     pe[pos, 2i+1] = cos(pos / 10000^(2i/d))
Tensor positional_encoding(int seq_len, int d_model);

// x * sqrt(d_model) + pe, for x: (batch, seq, d_model)
Tensor add_positional_encoding(const Tensor &x);

// ─── Position-wise Feed-Forward ─────────────────────────────────────────────

class PositionwiseFeedForward : public Module {
  public:
    PositionwiseFeedForward();

    Tensor forward(const Tensor &input) const;
    Tensor operator()(const Tensor &input) const { return forward(input); }

  private:
    Linear w_1_; // hidden → ffn_intermediate
    Linear w_2_; // ffn_intermediate → hidden
};

// ─── Encoder Layer ──────────────────────────────────────────────────────────

// Pre-norm: LayerNorm → MHA → Residual → LayerNorm → FFN → Residual
// Post-norm when normalize_before is false.

class EncoderLayer : public Module {
  public:
    explicit EncoderLayer(int num_heads = 4, bool normalize_before = true);

    // input: (batch, seq, hidden)
    Tensor forward(const Tensor &input, const Tensor &mask = Tensor()) const;
    Tensor operator()(const Tensor &input,
                      const Tensor &mask = Tensor()) const {
        return forward(input, mask);
    }

  private:
    MultiHeadAttention self_attn_;
    PositionwiseFeedForward feed_forward_;
    LayerNorm norm1_;
    LayerNorm norm2_;
    bool normalize_before_ = true;
};

} // namespace dualst
