#pragma once

#include <string>

#include <axiom/axiom.hpp>
#include <axiom/nn.hpp>

#include "dualst/config.hpp"
#include "dualst/dual_decoder.hpp"
#include "dualst/encoder.hpp"
#include "dualst/step_decoder.hpp"

namespace dualst {

using namespace axiom;
using namespace axiom::nn;

// ─── E2E Dual-Decoder Speech Translation Model ──────────────────────────────
//
// Shared speech encoder feeding two coupled decoders: ST (translation) and
// ASR (transcription). sos = eos = vocab_size - 1.

class E2EDualDecoder : public Module,
                       public SpeechEncoder,
                       public DualStepDecoder {
  public:
    static constexpr int kPad = 0;
    static constexpr int kIgnoreId = -1;

    // Validates the configuration; throws std::invalid_argument.
    explicit E2EDualDecoder(const DualConfig &config = make_must_c_config());

    const DualConfig &config() const { return config_; }
    Task tasks() const { return tasks_; }
    int sos() const { return config_.decoder.vocab_size - 1; }
    int eos() const { return config_.decoder.vocab_size - 1; }

    // Load safetensors weights; returns the number of tensors read.
    size_t load(const std::string &weights_path);

    SpeechTransformerEncoder &encoder() { return encoder_; }
    DualDecoder &dual_decoder() { return dual_decoder_; }

    Tensor encode(const Tensor &features) override;
    DualStepOutput step(const DualStepRequest &request) override;
    const CrossConfig &cross_config() const override { return config_.cross; }

  private:
    DualConfig config_;
    Task tasks_;
    SpeechTransformerEncoder encoder_;
    DualDecoder dual_decoder_;
};

} // namespace dualst
