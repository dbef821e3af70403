#include "dualst/config.hpp"

#include <stdexcept>
#include <string>

namespace dualst {

void validate(const CrossConfig &cross, Task tasks, bool normalize_before) {
    if (cross.wait_k_asr < 0 || cross.wait_k_st < 0) {
        throw std::invalid_argument("wait-k lags must be non-negative");
    }
    if (cross.wait_k_asr > 0 && cross.wait_k_st > 0) {
        throw std::invalid_argument(
            "wait_k_asr and wait_k_st are mutually exclusive (got " +
            std::to_string(cross.wait_k_asr) + " and " +
            std::to_string(cross.wait_k_st) + ")");
    }

    bool do_asr = has_task(tasks, Task::ASR);
    bool any_direction = cross.cross_to_asr || cross.cross_to_st;

    if (any_direction) {
        if (!do_asr) {
            throw std::invalid_argument(
                "cross attention requires the ASR task");
        }
        if (!cross.cross_self && !cross.cross_src) {
            throw std::invalid_argument(
                "cross_to_asr/cross_to_st need cross_self or cross_src");
        }
        if (cross.cross_operator == CrossOperator::Sum &&
            cross.cross_weight <= 0.0f) {
            throw std::invalid_argument(
                "cross_operator=sum needs a positive cross_weight");
        }
    }
    if ((cross.cross_operator != CrossOperator::None) !=
        (do_asr && any_direction)) {
        throw std::invalid_argument(
            "cross_operator must be set exactly when the ASR task is active "
            "and a cross direction is enabled");
    }
    if ((cross.cross_self_from != CrossFrom::Embedding ||
         cross.cross_src_from != CrossFrom::Embedding) &&
        !normalize_before) {
        throw std::invalid_argument(
            "pre-norm cross sources require normalize_before");
    }
}

void validate(const DualConfig &config) {
    if (config.encoder.input_dim < 7) {
        throw std::invalid_argument(
            "input_dim too small for conv2d subsampling: " +
            std::to_string(config.encoder.input_dim));
    }
    if (config.encoder.hidden_size % config.encoder.num_heads != 0) {
        throw std::invalid_argument(
            "encoder hidden_size must be divisible by num_heads");
    }
    if (config.decoder.hidden_size % config.decoder.num_heads != 0) {
        throw std::invalid_argument(
            "decoder hidden_size must be divisible by num_heads");
    }
    if (config.decoder.hidden_size != config.encoder.hidden_size) {
        throw std::invalid_argument(
            "encoder and decoder hidden sizes must match");
    }
    if (config.decoder.vocab_size < 2) {
        throw std::invalid_argument("vocab_size must be at least 2");
    }
    validate(config.cross, config.tasks(), config.decoder.normalize_before);
}

} // namespace dualst
