#pragma once

#include <vector>

#include <axiom/axiom.hpp>
#include <axiom/nn.hpp>

#include "dualst/config.hpp"
#include "dualst/transformer.hpp"

namespace dualst {

using namespace axiom;
using namespace axiom::nn;

// Hidden states (or outputs) of the ST and ASR streams.
struct DualStreams {
    Tensor st;
    Tensor asr;
};

// ─── Dual Decoder Layer ─────────────────────────────────────────────────────
//
// Per stream: self-attention → source attention → feed-forward, each with a
// residual connection. With cross coupling the receiving stream additionally
// attends to the other stream at the self and/or source sub-layer and adds
// the result scaled by cross_weight, or by the layer's own learned weights
// (cross_weight, cross_weight_asr) when `learn_weight` is set.

class DualDecoderLayer : public Module {
  public:
    DualDecoderLayer(const DecoderConfig &config, bool with_cross,
                     bool learn_weight = false);

    // False until a checkpoint provided both learned weights.
    bool has_learned_weights() const {
        return cross_weight_.storage() && cross_weight_asr_.storage();
    }

    // x_*: (1, len_*, hidden), memory: (1, T', hidden)
    // mask_*: self masks, cross_mask_st: ST attends ASR,
    // cross_mask_asr: ASR attends ST.
    DualStreams forward(const Tensor &x_st, const Tensor &mask_st,
                        const Tensor &x_asr, const Tensor &mask_asr,
                        const Tensor &memory, const Tensor &cross_mask_st,
                        const Tensor &cross_mask_asr,
                        const CrossConfig &cross) const;

  private:
    MultiHeadAttention self_attn_;
    MultiHeadAttention src_attn_;
    PositionwiseFeedForward feed_forward_;
    MultiHeadAttention self_attn_asr_;
    MultiHeadAttention src_attn_asr_;
    PositionwiseFeedForward feed_forward_asr_;

    MultiHeadAttention cross_self_attn_;
    MultiHeadAttention cross_self_attn_asr_;
    MultiHeadAttention cross_src_attn_;
    MultiHeadAttention cross_src_attn_asr_;

    LayerNorm norm1_, norm2_, norm3_;
    LayerNorm norm1_asr_, norm2_asr_, norm3_asr_;

    Tensor cross_weight_;     // scalar, scales what ST receives
    Tensor cross_weight_asr_; // scalar, scales what ASR receives

    bool normalize_before_ = true;
    bool with_cross_ = false;
    bool learn_weight_ = false;

    Tensor pre(const LayerNorm &norm, const Tensor &x) const {
        return normalize_before_ ? norm(x) : x;
    }
    Tensor post(const LayerNorm &norm, const Tensor &x) const {
        return normalize_before_ ? x : norm(x);
    }
};

// ─── Dual Decoder ───────────────────────────────────────────────────────────

class DualDecoder : public Module {
  public:
    DualDecoder(const DecoderConfig &config, bool with_cross,
                bool learn_cross_weight = false);

    const DecoderConfig &config() const { return config_; }
    bool has_cross() const { return with_cross_; }
    bool learns_cross_weight() const { return learn_cross_weight_; }

    // True when every layer holds its learned cross weights.
    bool has_learned_cross_weights() const;

    // Full teacher-forced pass. Returns logits (1, len_*, vocab_size).
    DualStreams forward(const std::vector<int> &tokens_st,
                        const Tensor &mask_st,
                        const std::vector<int> &tokens_asr,
                        const Tensor &mask_asr, const Tensor &memory,
                        const Tensor &cross_mask_st,
                        const Tensor &cross_mask_asr,
                        const CrossConfig &cross) const;

    // Log-probabilities of the next token of each stream: (vocab_size,)
    DualStreams forward_one_step(const std::vector<int> &tokens_st,
                                 const Tensor &mask_st,
                                 const std::vector<int> &tokens_asr,
                                 const Tensor &mask_asr, const Tensor &memory,
                                 const Tensor &cross_mask_st,
                                 const Tensor &cross_mask_asr,
                                 const CrossConfig &cross) const;

  private:
    DecoderConfig config_;
    bool with_cross_ = false;
    bool learn_cross_weight_ = false;

    Embedding embed_;
    Embedding embed_asr_;
    ModuleList decoders_;
    LayerNorm after_norm_;
    LayerNorm after_norm_asr_;
    Linear output_layer_;
    Linear output_layer_asr_;

    DualStreams hidden(const std::vector<int> &tokens_st, const Tensor &mask_st,
                       const std::vector<int> &tokens_asr,
                       const Tensor &mask_asr, const Tensor &memory,
                       const Tensor &cross_mask_st,
                       const Tensor &cross_mask_asr,
                       const CrossConfig &cross) const;
};

// (1, n) Int32 tensor of token ids.
Tensor token_tensor(const std::vector<int> &tokens);

} // namespace dualst
