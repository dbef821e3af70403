#pragma once

#include <string>
#include <vector>

#include <axiom/axiom.hpp>

#include "dualst/step_decoder.hpp"
#include "dualst/vocab.hpp"

namespace dualst {

using namespace axiom;

// ─── Search Config ──────────────────────────────────────────────────────────

struct SearchConfig {
    int beam_size = 10;
    float penalty = 0.0f; // added (i + 1) * penalty when a hypothesis ends
    int n_best = 1;

    // 0 = use the full encoder length T
    float maxlenratio = 0.0f;
    float maxlenratio_asr = 0.0f;
    float minlenratio = 0.0f;
    float minlenratio_asr = 0.0f;

    // Diversity forcing, both in [0, 1)
    float ratio_diverse_st = 0.0f;
    float ratio_diverse_asr = 0.0f;

    // Relaxation retries when nothing reaches the ended state.
    int max_retries = 5;

    // A stream that emitted eos at or before this step index is still
    // expanded; afterwards it is frozen.
    int end_grace_steps = 2;

    float lm_weight = 0.0f; // shallow fusion on the ST stream

    // Language tags used as start tokens ("de" → "<2de>"); empty = <eos>.
    std::string tgt_lang;
    std::string src_lang;

    bool verbose = false;
};

// Throws std::invalid_argument.
void validate(const SearchConfig &config);

// ─── Hypothesis ─────────────────────────────────────────────────────────────

struct Hypothesis {
    float score = 0.0f;
    std::vector<int> tokens_st;  // starts with the ST start token
    std::vector<int> tokens_asr; // starts with the ASR start token
    bool ended_st = false;
    bool ended_asr = false;
    int steps = 0; // expansions this hypothesis went through

    bool ended() const { return ended_st && ended_asr; }
};

struct DecodeResult {
    std::vector<Hypothesis> hyps; // descending score, at most n_best

    // Minimum-length ratios actually used (relaxed after retries).
    float minlenratio = 0.0f;
    float minlenratio_asr = 0.0f;
    int retries = 0;
};

// ─── Selection Primitives ───────────────────────────────────────────────────

struct ScoredToken {
    float score;
    int id;
};

// Top-k of a distribution, descending; ties go to the lower id. Non-finite
// entries are never selected; `rejected` counts NaN / +inf entries.
std::vector<ScoredToken> topk(const float *scores, int n, int k,
                              int *rejected = nullptr);

// Rows/columns kept by diversity forcing: max(1, floor((1 - ratio) * beam)).
int diversity_span(int beam, float ratio);

struct JointCandidate {
    float score;
    int st;  // token id
    int asr; // token id
};

// Joint top-`beam` over S[a][b] = st[a].score + asr[b].score, where `st` and
// `asr` are per-stream top lists. Diversity forcing restricts S before
// selection:
//   ST only:  columns [0, ct), ct = span(ratio_st)
//   ASR only: rows [0, cr),    cr = span(ratio_asr)
//   both:     S[:cr, :ct] with ct = max(ct, ceil(beam / cr))
// Candidates are ordered row-major on ties. Fewer than `beam` are returned
// when the retained sub-matrix is smaller.
std::vector<JointCandidate>
select_joint_topk(const std::vector<ScoredToken> &st,
                  const std::vector<ScoredToken> &asr, int beam,
                  float ratio_diverse_st, float ratio_diverse_asr);

// ESPnet end detection: true when, for each of the last M lengths, the best
// ended hypothesis of that length is more than |d_end| below the overall
// best. Hypothesis length is the ST sequence length, steps + 1 - st_lag
// (start token included; the first st_lag steps add no ST token).
bool end_detect(const std::vector<Hypothesis> &ended, int i, int st_lag = 0,
                int M = 3, float d_end = -10.0f);

struct LengthBounds {
    int maxlen;
    int maxlen_asr;
    int minlen;
    int minlen_asr;
};

LengthBounds length_bounds(int encoder_length, const SearchConfig &config);

// ─── Joint Beam Search ──────────────────────────────────────────────────────

class DualBeamSearch {
  public:
    DualBeamSearch(SpeechEncoder &encoder, DualStepDecoder &decoder);

    // Encode once, then search. Throws std::invalid_argument on bad
    // configuration; decoder errors propagate.
    DecodeResult decode(const Tensor &features, const SearchConfig &config,
                        const Vocabulary &vocab,
                        const LanguageModel *lm = nullptr);

    // Search over precomputed encoder output (1, T', hidden).
    DecodeResult decode_encoded(const Tensor &memory,
                                const SearchConfig &config,
                                const Vocabulary &vocab,
                                const LanguageModel *lm = nullptr);

  private:
    SpeechEncoder &encoder_;
    DualStepDecoder &decoder_;

    std::vector<Hypothesis> search(const Tensor &memory,
                                   const SearchConfig &config,
                                   const Vocabulary &vocab,
                                   const LanguageModel *lm);
};

} // namespace dualst
