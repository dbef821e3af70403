#pragma once

#include <cstdint>
#include <string>

namespace dualst {

// ─── Encoder Config ─────────────────────────────────────────────────────────

struct EncoderConfig {
    int input_dim = 83; // 80 fbank + 3 pitch
    int hidden_size = 256;
    int num_layers = 12;
    int num_heads = 4;
    int ffn_intermediate = 2048;
    bool normalize_before = true;
    float layer_norm_eps = 1e-12f;
};

// ─── Dual Decoder Config ────────────────────────────────────────────────────

struct DecoderConfig {
    int vocab_size = 8000; // odim; sos = eos = vocab_size - 1
    int hidden_size = 256;
    int num_layers = 6;
    int num_heads = 4;
    int ffn_intermediate = 2048;
    bool normalize_before = true;
    float layer_norm_eps = 1e-12f;
};

// ─── Cross-Attention Coupling ───────────────────────────────────────────────

// Where the other stream's keys/values come from.
enum class CrossFrom {
    Embedding, // the other stream's layer input
    PreNorm,   // the other stream's normalized input to the same sub-layer
};

enum class CrossOperator { None, Sum };

struct CrossConfig {
    bool cross_self = false;
    bool cross_src = false;
    CrossFrom cross_self_from = CrossFrom::Embedding;
    CrossFrom cross_src_from = CrossFrom::Embedding;
    CrossOperator cross_operator = CrossOperator::None;
    float cross_weight = 0.0f;
    // Per-layer weights read from the checkpoint instead of cross_weight.
    bool cross_weight_learnable = false;
    bool cross_to_asr = false;
    bool cross_to_st = false;

    // wait-k synchronization; at most one may be positive
    int wait_k_asr = 0; // ST waits for this many ASR tokens
    int wait_k_st = 0;  // ASR waits for this many ST tokens

    bool enabled() const {
        return cross_operator != CrossOperator::None &&
               (cross_to_asr || cross_to_st);
    }
};

// ─── Task Capabilities ──────────────────────────────────────────────────────

enum class Task : uint8_t {
    None = 0,
    ST = 1 << 0,
    ASR = 1 << 1,
    MT = 1 << 2,
};

inline Task operator|(Task a, Task b) {
    return static_cast<Task>(static_cast<uint8_t>(a) |
                             static_cast<uint8_t>(b));
}

inline bool has_task(Task set, Task t) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(t)) != 0;
}

// ─── Model Config ───────────────────────────────────────────────────────────

struct DualConfig {
    EncoderConfig encoder;
    DecoderConfig decoder;
    CrossConfig cross;

    // Multi-task weights; the capability set is derived from them.
    float asr_weight = 0.3f;
    float mt_weight = 0.0f;
    float mtlalpha = 0.0f;

    bool one_to_many = false;
    std::string lang_tok; // "decoder-pre" prepends <2xx> as the start token

    Task tasks() const {
        Task t = Task::ST;
        if (asr_weight > 0.0f && mtlalpha < 1.0f)
            t = t | Task::ASR;
        if (mt_weight > 0.0f)
            t = t | Task::MT;
        return t;
    }
};

// Throws std::invalid_argument on inconsistent settings.
void validate(const DualConfig &config);
void validate(const CrossConfig &cross, Task tasks, bool normalize_before);

// ─── Presets ────────────────────────────────────────────────────────────────

// MuST-C one-to-many recipe: fbank+pitch input, BPE 8000, dual decoder with
// cross attention at self and source, summed with weight 0.3.
inline DualConfig make_must_c_config() {
    DualConfig cfg;
    cfg.encoder.input_dim = 83;
    cfg.encoder.hidden_size = 256;
    cfg.encoder.num_layers = 12;
    cfg.encoder.num_heads = 4;
    cfg.encoder.ffn_intermediate = 2048;
    cfg.decoder.vocab_size = 8000;
    cfg.decoder.hidden_size = 256;
    cfg.decoder.num_layers = 6;
    cfg.decoder.num_heads = 4;
    cfg.decoder.ffn_intermediate = 2048;
    cfg.cross.cross_self = true;
    cfg.cross.cross_src = true;
    cfg.cross.cross_operator = CrossOperator::Sum;
    cfg.cross.cross_weight = 0.3f;
    cfg.cross.cross_to_asr = true;
    cfg.cross.cross_to_st = true;
    cfg.asr_weight = 0.5f;
    cfg.one_to_many = true;
    cfg.lang_tok = "decoder-pre";
    return cfg;
}

// Independent decoders (no coupling), useful as a baseline.
inline DualConfig make_independent_config() {
    DualConfig cfg = make_must_c_config();
    cfg.cross = CrossConfig{};
    return cfg;
}

} // namespace dualst
