#pragma once

#include <vector>

#include <axiom/axiom.hpp>

#include "dualst/config.hpp"
#include "dualst/mask.hpp"

namespace dualst {

using namespace axiom;

// ─── Collaborator Interfaces ────────────────────────────────────────────────
//
// The beam search only talks to the acoustic model through these seams, so
// any encoder / step decoder (including scripted ones in tests) can drive it.

class SpeechEncoder {
  public:
    virtual ~SpeechEncoder() = default;

    // features: (T, D) or (1, T, D) → hidden states (1, T', hidden)
    virtual Tensor encode(const Tensor &features) = 0;
};

struct DualStepRequest {
    std::vector<int> tokens_st;
    std::vector<int> tokens_asr;
    AttentionMask self_mask_st;
    AttentionMask self_mask_asr;
    AttentionMask cross_mask_st;  // ST queries attend ASR keys
    AttentionMask cross_mask_asr; // ASR queries attend ST keys
    Tensor memory;                // (1, T', hidden)
    CrossConfig coupling;
    bool want_st = true;
    bool want_asr = true;
};

// Next-token log-probabilities, (vocab_size,) each. A stream that was not
// requested is left empty (no storage).
struct DualStepOutput {
    Tensor logp_st;
    Tensor logp_asr;
};

class DualStepDecoder {
  public:
    virtual ~DualStepDecoder() = default;

    virtual DualStepOutput step(const DualStepRequest &request) = 0;

    // Coupling and wait-k settings the decoder was trained with.
    virtual const CrossConfig &cross_config() const = 0;
};

// Optional shallow-fusion language model over the ST stream.
class LanguageModel {
  public:
    virtual ~LanguageModel() = default;

    // Log-probabilities of the next token given the prefix: (vocab_size,)
    virtual Tensor score(const std::vector<int> &tokens) const = 0;
};

} // namespace dualst
