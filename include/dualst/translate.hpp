#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <axiom/axiom.hpp>

#include "dualst/audio.hpp"
#include "dualst/beam_search.hpp"
#include "dualst/config.hpp"
#include "dualst/model.hpp"
#include "dualst/vocab.hpp"
#include "dualst/wav.hpp"

namespace dualst {

// ─── Translation Result ─────────────────────────────────────────────────────

struct NBestEntry {
    float score = 0.0f;
    std::string st_text;  // translation
    std::string asr_text; // transcription
    std::vector<int> st_ids;
    std::vector<int> asr_ids;
};

struct TranslateResult {
    std::vector<NBestEntry> nbest; // best first
    float minlenratio = 0.0f;      // effective, after relaxation
    float minlenratio_asr = 0.0f;
    int retries = 0;

    bool empty() const { return nbest.empty(); }
};

// ─── Input Checks ───────────────────────────────────────────────────────────

// One-to-many models trained with "decoder-pre" language tags start both
// streams from <2xx>; decoding them from <eos> gives garbage.
inline void check_language_tags(const DualConfig &model,
                                const SearchConfig &search) {
    if (!model.one_to_many || model.lang_tok != "decoder-pre")
        return;
    if (search.tgt_lang.empty() || search.src_lang.empty()) {
        throw std::invalid_argument(
            "Model starts decoding from language tags; set tgt_lang and "
            "src_lang (--tgt-lang / --src-lang)");
    }
}

// Log mel features for the model. Throws std::runtime_error on a sample rate
// or feature dim the model cannot take.
inline axiom::Tensor wav_features(const WavData &wav, const FbankConfig &fbank,
                                  int input_dim) {
    if (wav.sample_rate != fbank.sample_rate) {
        throw std::runtime_error(
            "Expected " + std::to_string(fbank.sample_rate) +
            " Hz audio, got " + std::to_string(wav.sample_rate) + " Hz");
    }
    if (fbank.num_mel_bins != input_dim) {
        throw std::runtime_error(
            "Model expects " + std::to_string(input_dim) +
            "-dim features but fbank gives " +
            std::to_string(fbank.num_mel_bins) +
            "; pass precomputed features as .npy");
    }
    return compute_fbank(wav.samples, fbank);
}

// ─── High-Level Translation API ─────────────────────────────────────────────

/// Joint speech translation + transcription with an E2EDualDecoder.
///
///   dualst::Translator t("model.safetensors", "dict.txt");
///   dualst::SearchConfig search;
///   search.tgt_lang = "de";
///   search.src_lang = "en";
///   auto result = t.translate_wav("audio.wav", search);
///   std::cout << result.nbest[0].st_text << std::endl;
///
/// The model output dim follows the dict (blank, tokens, eos), whatever
/// config.decoder.vocab_size says.
class Translator {
  public:
    Translator(const std::string &weights_path, const std::string &dict_path,
               const DualConfig &config = make_must_c_config())
        : vocab_(load_vocab(dict_path)), model_(sized(config, vocab_)) {
        model_.load(weights_path);
    }

    /// Move model to GPU (Metal). Call once after construction.
    void to_gpu() {
        model_.to(axiom::Device::GPU);
        use_gpu_ = true;
    }

    void load_cmvn(const std::string &npy_path) { cmvn_.load(npy_path); }

    /// Optional shallow-fusion LM for the ST stream; not owned.
    void set_language_model(const LanguageModel *lm) { lm_ = lm; }

    FbankConfig &fbank_config() { return fbank_; }
    E2EDualDecoder &model() { return model_; }
    const Vocabulary &vocab() const { return vocab_; }

    /// Features for decoded audio; see wav_features().
    axiom::Tensor features(const WavData &wav) const {
        return wav_features(wav, fbank_, model_.config().encoder.input_dim);
    }

    /// Translate a 16 kHz WAV file.
    TranslateResult translate_wav(const std::string &wav_path,
                                  const SearchConfig &search = {}) {
        return translate(features(read_wav(wav_path)), search);
    }

    /// Translate (T, D) or (1, T, D) features. Global CMVN is applied first
    /// when loaded.
    TranslateResult translate(const axiom::Tensor &features,
                              const SearchConfig &search = {}) {
        check_language_tags(model_.config(), search);
        auto x = cmvn_.loaded() ? cmvn_.apply(features) : features;
        if (use_gpu_) {
            x = x.gpu();
        }

        DualBeamSearch searcher(model_, model_);
        auto decoded = searcher.decode(x, search, vocab_, lm_);

        TranslateResult result;
        result.minlenratio = decoded.minlenratio;
        result.minlenratio_asr = decoded.minlenratio_asr;
        result.retries = decoded.retries;
        for (const auto &hyp : decoded.hyps) {
            NBestEntry entry;
            entry.score = hyp.score;
            // Drop the start token; eos is kept in the ids.
            entry.st_ids.assign(hyp.tokens_st.begin() + 1, hyp.tokens_st.end());
            entry.asr_ids.assign(hyp.tokens_asr.begin() + 1,
                                 hyp.tokens_asr.end());
            entry.st_text = vocab_.decode(entry.st_ids);
            entry.asr_text = vocab_.decode(entry.asr_ids);
            result.nbest.push_back(std::move(entry));
        }
        return result;
    }

  private:
    Vocabulary vocab_; // before model_: it sizes the output layers
    E2EDualDecoder model_;
    GlobalCMVN cmvn_;
    FbankConfig fbank_;
    const LanguageModel *lm_ = nullptr;
    bool use_gpu_ = false;

    static Vocabulary load_vocab(const std::string &dict_path) {
        Vocabulary vocab;
        vocab.load(dict_path);
        return vocab;
    }

    static DualConfig sized(DualConfig config, const Vocabulary &vocab) {
        config.decoder.vocab_size = static_cast<int>(vocab.size());
        return config;
    }
};

} // namespace dualst
