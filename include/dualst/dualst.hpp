#pragma once

// Umbrella header: includes all dualst components

#include "dualst/audio.hpp"
#include "dualst/beam_search.hpp"
#include "dualst/config.hpp"
#include "dualst/dual_decoder.hpp"
#include "dualst/encoder.hpp"
#include "dualst/mask.hpp"
#include "dualst/model.hpp"
#include "dualst/step_decoder.hpp"
#include "dualst/transformer.hpp"
#include "dualst/translate.hpp"
#include "dualst/vocab.hpp"
#include "dualst/wav.hpp"
