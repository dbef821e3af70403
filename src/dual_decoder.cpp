#include "dualst/dual_decoder.hpp"

#include <stdexcept>

namespace dualst {

Tensor token_tensor(const std::vector<int> &tokens) {
    auto t = Tensor(Shape{1, tokens.size()}, DType::Int32);
    int32_t *data = t.typed_data<int32_t>();
    for (size_t i = 0; i < tokens.size(); ++i) {
        data[i] = static_cast<int32_t>(tokens[i]);
    }
    return t;
}

// ─── DualDecoderLayer ────────────────────────────────────────────────────────

DualDecoderLayer::DualDecoderLayer(const DecoderConfig &config,
                                   bool with_cross, bool learn_weight)
    : self_attn_(config.num_heads), src_attn_(config.num_heads),
      self_attn_asr_(config.num_heads), src_attn_asr_(config.num_heads),
      cross_self_attn_(config.num_heads),
      cross_self_attn_asr_(config.num_heads),
      cross_src_attn_(config.num_heads), cross_src_attn_asr_(config.num_heads),
      normalize_before_(config.normalize_before), with_cross_(with_cross),
      learn_weight_(with_cross && learn_weight) {
    if (learn_weight_) {
        AX_REGISTER_PARAMETERS(cross_weight_, cross_weight_asr_);
    }
    if (with_cross_) {
        AX_REGISTER_MODULES(self_attn_, src_attn_, feed_forward_,
                            self_attn_asr_, src_attn_asr_, feed_forward_asr_,
                            cross_self_attn_, cross_self_attn_asr_,
                            cross_src_attn_, cross_src_attn_asr_, norm1_,
                            norm2_, norm3_, norm1_asr_, norm2_asr_,
                            norm3_asr_);
    } else {
        AX_REGISTER_MODULES(self_attn_, src_attn_, feed_forward_,
                            self_attn_asr_, src_attn_asr_, feed_forward_asr_,
                            norm1_, norm2_, norm3_, norm1_asr_, norm2_asr_,
                            norm3_asr_);
    }
}

DualStreams DualDecoderLayer::forward(const Tensor &x_st, const Tensor &mask_st,
                                      const Tensor &x_asr,
                                      const Tensor &mask_asr,
                                      const Tensor &memory,
                                      const Tensor &cross_mask_st,
                                      const Tensor &cross_mask_asr,
                                      const CrossConfig &cross) const {
    bool coupled = cross.enabled();
    if (coupled && !with_cross_) {
        throw std::runtime_error(
            "Cross attention requested but the decoder was built without it");
    }
    bool to_st = coupled && cross.cross_to_st;
    bool to_asr = coupled && cross.cross_to_asr;

    auto scale_st = [&](const Tensor &x) {
        return learn_weight_ ? x * cross_weight_ : x * cross.cross_weight;
    };
    auto scale_asr = [&](const Tensor &x) {
        return learn_weight_ ? x * cross_weight_asr_ : x * cross.cross_weight;
    };

    // Self-attention
    auto n_st = pre(norm1_, x_st);
    auto n_asr = pre(norm1_asr_, x_asr);

    auto h_st = x_st + multi_head_attention(self_attn_, n_st, n_st, n_st,
                                            mask_st);
    auto h_asr = x_asr + multi_head_attention(self_attn_asr_, n_asr, n_asr,
                                              n_asr, mask_asr);
    if (cross.cross_self) {
        bool emb = cross.cross_self_from == CrossFrom::Embedding;
        if (to_st) {
            const auto &other = emb ? x_asr : n_asr;
            h_st = h_st + scale_st(multi_head_attention(
                              cross_self_attn_, n_st, other, other,
                              cross_mask_st));
        }
        if (to_asr) {
            const auto &other = emb ? x_st : n_st;
            h_asr = h_asr + scale_asr(multi_head_attention(
                                cross_self_attn_asr_, n_asr, other, other,
                                cross_mask_asr));
        }
    }
    h_st = post(norm1_, h_st);
    h_asr = post(norm1_asr_, h_asr);

    // Source attention over the encoder memory
    auto s_st = pre(norm2_, h_st);
    auto s_asr = pre(norm2_asr_, h_asr);

    auto g_st = h_st + multi_head_attention(src_attn_, s_st, memory, memory);
    auto g_asr =
        h_asr + multi_head_attention(src_attn_asr_, s_asr, memory, memory);
    if (cross.cross_src) {
        bool emb = cross.cross_src_from == CrossFrom::Embedding;
        if (to_st) {
            const auto &other = emb ? x_asr : s_asr;
            g_st = g_st + scale_st(multi_head_attention(
                              cross_src_attn_, s_st, other, other,
                              cross_mask_st));
        }
        if (to_asr) {
            const auto &other = emb ? x_st : s_st;
            g_asr = g_asr + scale_asr(multi_head_attention(
                                cross_src_attn_asr_, s_asr, other, other,
                                cross_mask_asr));
        }
    }
    g_st = post(norm2_, g_st);
    g_asr = post(norm2_asr_, g_asr);

    // Feed-forward
    auto out_st = g_st + feed_forward_(pre(norm3_, g_st));
    auto out_asr = g_asr + feed_forward_asr_(pre(norm3_asr_, g_asr));

    return {post(norm3_, out_st), post(norm3_asr_, out_asr)};
}

// ─── DualDecoder ─────────────────────────────────────────────────────────────

DualDecoder::DualDecoder(const DecoderConfig &config, bool with_cross,
                         bool learn_cross_weight)
    : config_(config), with_cross_(with_cross),
      learn_cross_weight_(with_cross && learn_cross_weight),
      output_layer_(true), output_layer_asr_(true) {
    for (int i = 0; i < config.num_layers; ++i) {
        decoders_.emplace_back<DualDecoderLayer>(config, with_cross,
                                                 learn_cross_weight_);
    }
    if (config.normalize_before) {
        AX_REGISTER_MODULES(embed_, embed_asr_, decoders_, after_norm_,
                            after_norm_asr_, output_layer_, output_layer_asr_);
    } else {
        AX_REGISTER_MODULES(embed_, embed_asr_, decoders_, output_layer_,
                            output_layer_asr_);
    }
}

bool DualDecoder::has_learned_cross_weights() const {
    for (const auto &layer : decoders_.each<DualDecoderLayer>()) {
        if (!layer.has_learned_weights())
            return false;
    }
    return true;
}

DualStreams DualDecoder::hidden(const std::vector<int> &tokens_st,
                                const Tensor &mask_st,
                                const std::vector<int> &tokens_asr,
                                const Tensor &mask_asr, const Tensor &memory,
                                const Tensor &cross_mask_st,
                                const Tensor &cross_mask_asr,
                                const CrossConfig &cross) const {
    if (tokens_st.empty() || tokens_asr.empty()) {
        throw std::invalid_argument("DualDecoder: empty token stream");
    }
    if (learn_cross_weight_ && !has_learned_cross_weights()) {
        throw std::runtime_error(
            "DualDecoder: learned cross weights were not loaded");
    }

    auto ys = token_tensor(tokens_st);
    auto ys_asr = token_tensor(tokens_asr);
    if (memory.device() != ys.device()) {
        ys = ys.to(memory.device());
        ys_asr = ys_asr.to(memory.device());
    }

    auto x = add_positional_encoding(embed_(ys));
    auto x_asr = add_positional_encoding(embed_asr_(ys_asr));

    for (const auto &layer : decoders_.each<DualDecoderLayer>()) {
        auto out = layer.forward(x, mask_st, x_asr, mask_asr, memory,
                                 cross_mask_st, cross_mask_asr, cross);
        x = out.st;
        x_asr = out.asr;
    }
    if (config_.normalize_before) {
        x = after_norm_(x);
        x_asr = after_norm_asr_(x_asr);
    }
    return {x, x_asr};
}

DualStreams DualDecoder::forward(const std::vector<int> &tokens_st,
                                 const Tensor &mask_st,
                                 const std::vector<int> &tokens_asr,
                                 const Tensor &mask_asr, const Tensor &memory,
                                 const Tensor &cross_mask_st,
                                 const Tensor &cross_mask_asr,
                                 const CrossConfig &cross) const {
    auto h = hidden(tokens_st, mask_st, tokens_asr, mask_asr, memory,
                    cross_mask_st, cross_mask_asr, cross);
    return {output_layer_(h.st), output_layer_asr_(h.asr)};
}

DualStreams DualDecoder::forward_one_step(
    const std::vector<int> &tokens_st, const Tensor &mask_st,
    const std::vector<int> &tokens_asr, const Tensor &mask_asr,
    const Tensor &memory, const Tensor &cross_mask_st,
    const Tensor &cross_mask_asr, const CrossConfig &cross) const {
    auto h = hidden(tokens_st, mask_st, tokens_asr, mask_asr, memory,
                    cross_mask_st, cross_mask_asr, cross);

    auto last = [](const Tensor &x) {
        auto len = static_cast<int64_t>(x.shape()[1]);
        return x.slice({Slice(), Slice(len - 1, len)});
    };

    auto vocab = static_cast<size_t>(config_.vocab_size);
    // log_softmax on CPU needs contiguous input
    auto y = output_layer_(last(h.st)).cpu().ascontiguousarray();
    auto y_asr = output_layer_asr_(last(h.asr)).cpu().ascontiguousarray();
    y = ops::log_softmax(y, /*axis=*/-1).reshape({vocab});
    y_asr = ops::log_softmax(y_asr, /*axis=*/-1).reshape({vocab});
    return {y, y_asr};
}

} // namespace dualst
