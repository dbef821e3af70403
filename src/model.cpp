#include "dualst/model.hpp"

#include <axiom/io/safetensors.hpp>

#include <stdexcept>
#include <string>

namespace dualst {

namespace {

// Runs before any member is built so bad configs never allocate layers.
const DualConfig &checked(const DualConfig &config) {
    validate(config);
    if (!has_task(config.tasks(), Task::ASR)) {
        throw std::invalid_argument(
            "E2EDualDecoder needs the ASR task (asr_weight > 0, mtlalpha < 1)");
    }
    return config;
}

} // namespace

E2EDualDecoder::E2EDualDecoder(const DualConfig &config)
    : config_(checked(config)), tasks_(config.tasks()),
      encoder_(config.encoder),
      dual_decoder_(config.decoder, config.cross.enabled(),
                    config.cross.cross_weight_learnable) {
    AX_REGISTER_MODULES(encoder_, dual_decoder_);
}

size_t E2EDualDecoder::load(const std::string &weights_path) {
    auto weights = axiom::io::safetensors::load(weights_path);
    if (!dual_decoder_.learns_cross_weight()) {
        for (const auto &[name, tensor] : weights) {
            if (name.ends_with(".cross_weight") ||
                name.ends_with(".cross_weight_asr")) {
                throw std::runtime_error(
                    weights_path + ": checkpoint has learned cross weight " +
                    name + "; set cross_weight_learnable");
            }
        }
    }
    load_state_dict(weights, /*prefix=*/"", /*strict=*/false);
    if (dual_decoder_.learns_cross_weight() &&
        !dual_decoder_.has_learned_cross_weights()) {
        throw std::runtime_error(
            weights_path +
            ": config has learnable cross weights but the checkpoint lacks "
            "cross_weight / cross_weight_asr");
    }
    return weights.size();
}

Tensor E2EDualDecoder::encode(const Tensor &features) {
    auto x = features;
    if (x.shape().size() == 2) {
        x = x.unsqueeze(0);
    }
    if (x.shape().size() != 3 || x.shape()[0] != 1) {
        throw std::runtime_error(
            "encode expects (T, D) or (1, T, D) features");
    }
    auto dim = static_cast<int>(x.shape()[2]);
    if (dim != config_.encoder.input_dim) {
        throw std::runtime_error("Feature dim " + std::to_string(dim) +
                                 " does not match model input_dim " +
                                 std::to_string(config_.encoder.input_dim));
    }
    return encoder_(x);
}

DualStepOutput E2EDualDecoder::step(const DualStepRequest &request) {
    auto out = dual_decoder_.forward_one_step(
        request.tokens_st, request.self_mask_st.to_fill_tensor(),
        request.tokens_asr, request.self_mask_asr.to_fill_tensor(),
        request.memory, request.cross_mask_st.to_fill_tensor(),
        request.cross_mask_asr.to_fill_tensor(), request.coupling);

    DualStepOutput result;
    if (request.want_st)
        result.logp_st = out.st;
    if (request.want_asr)
        result.logp_asr = out.asr;
    return result;
}

} // namespace dualst
