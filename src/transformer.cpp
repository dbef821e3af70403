#include "dualst/transformer.hpp"

#include <cmath>

namespace dualst {

// ─── Multi-Head Attention ────────────────────────────────────────────────────

Tensor multi_head_attention(const MultiHeadAttention &mha, const Tensor &query,
                            const Tensor &key, const Tensor &value,
                            const Tensor &mask) {
    auto q = mha.q_proj()(query);
    auto k = mha.k_proj()(key);
    auto v = mha.v_proj()(value);

    int num_heads = mha.num_heads();
    auto d_model = static_cast<int>(q.shape().back());
    int head_dim = d_model / num_heads;
    float scale = 1.0f / std::sqrt(static_cast<float>(head_dim));

    auto batch = q.shape()[0];
    auto q_len = q.shape()[1];
    auto kv_len = k.shape()[1];
    auto nh = static_cast<size_t>(num_heads);
    auto hd = static_cast<size_t>(head_dim);

    q = q.reshape({batch, q_len, nh, hd}).transpose({0, 2, 1, 3});
    k = k.reshape({batch, kv_len, nh, hd}).transpose({0, 2, 1, 3});
    v = v.reshape({batch, kv_len, nh, hd}).transpose({0, 2, 1, 3});

    auto scores = ops::matmul(q, k, false, true) * scale;

    Tensor attn_weights;
    if (mask.storage()) {
        auto m = mask;
        if (scores.device() != m.device())
            m = m.to(scores.device());
        scores = ops::masked_fill(scores, m, -1e9f);
        attn_weights = ops::softmax(scores, -1);
        attn_weights = ops::masked_fill(attn_weights, m, 0.0f);
    } else {
        attn_weights = ops::softmax(scores, -1);
    }

    auto out = ops::matmul(attn_weights, v);
    out = out.transpose({0, 2, 1, 3});
    out = out.reshape({batch, q_len, static_cast<size_t>(d_model)});
    return mha.out_proj()(out);
}

// ─── Positional Encoding ─────────────────────────────────────────────────────

Tensor positional_encoding(int seq_len, int d_model) {
    auto pe = Tensor::zeros(
        {static_cast<size_t>(seq_len), static_cast<size_t>(d_model)});

    float *pe_data = pe.typed_data<float>();
    for (int pos = 0; pos < seq_len; ++pos) {
        for (int i = 0; i < d_model; i += 2) {
            float div_term = std::exp(static_cast<float>(i) *
                                      (-std::log(10000.0f) / d_model));
            pe_data[pos * d_model + i] =
                std::sin(static_cast<float>(pos) * div_term);
            if (i + 1 < d_model) {
                pe_data[pos * d_model + i + 1] =
                    std::cos(static_cast<float>(pos) * div_term);
            }
        }
    }
    return pe;
}

Tensor add_positional_encoding(const Tensor &x) {
    int seq_len = static_cast<int>(x.shape()[1]);
    int d_model = static_cast<int>(x.shape()[2]);
    auto pe = positional_encoding(seq_len, d_model).unsqueeze(0);
    if (x.device() != pe.device()) {
        pe = pe.to(x.device());
    }
    float xscale = std::sqrt(static_cast<float>(d_model));
    return x * xscale + pe;
}

// ─── PositionwiseFeedForward ─────────────────────────────────────────────────

PositionwiseFeedForward::PositionwiseFeedForward() : w_1_(true), w_2_(true) {
    AX_REGISTER_MODULES(w_1_, w_2_);
}

Tensor PositionwiseFeedForward::forward(const Tensor &input) const {
    return w_2_(ops::relu(w_1_(input)));
}

// ─── EncoderLayer ────────────────────────────────────────────────────────────

EncoderLayer::EncoderLayer(int num_heads, bool normalize_before)
    : self_attn_(num_heads), normalize_before_(normalize_before) {
    AX_REGISTER_MODULES(self_attn_, feed_forward_, norm1_, norm2_);
}

Tensor EncoderLayer::forward(const Tensor &input, const Tensor &mask) const {
    auto x = normalize_before_ ? norm1_(input) : input;
    x = input + multi_head_attention(self_attn_, x, x, x, mask);
    if (!normalize_before_)
        x = norm1_(x);

    auto ffn_in = normalize_before_ ? norm2_(x) : x;
    x = x + feed_forward_(ffn_in);
    return normalize_before_ ? x : norm2_(x);
}

} // namespace dualst
