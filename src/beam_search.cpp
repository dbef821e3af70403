#include "dualst/beam_search.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace dualst {

void validate(const SearchConfig &config) {
    if (config.beam_size < 1) {
        throw std::invalid_argument("beam_size must be >= 1, got " +
                                    std::to_string(config.beam_size));
    }
    if (config.n_best < 1) {
        throw std::invalid_argument("n_best must be >= 1, got " +
                                    std::to_string(config.n_best));
    }
    if (config.penalty < 0.0f) {
        throw std::invalid_argument("penalty must be >= 0");
    }
    if (config.maxlenratio < 0.0f || config.maxlenratio_asr < 0.0f ||
        config.minlenratio < 0.0f || config.minlenratio_asr < 0.0f) {
        throw std::invalid_argument("length ratios must be >= 0");
    }
    auto in_unit = [](float r) { return r >= 0.0f && r < 1.0f; };
    if (!in_unit(config.ratio_diverse_st) ||
        !in_unit(config.ratio_diverse_asr)) {
        throw std::invalid_argument("diversity ratios must be in [0, 1)");
    }
    if (config.max_retries < 0 || config.end_grace_steps < 0) {
        throw std::invalid_argument(
            "max_retries and end_grace_steps must be >= 0");
    }
    if (config.lm_weight < 0.0f) {
        throw std::invalid_argument("lm_weight must be >= 0");
    }
}

// ─── Selection Primitives ────────────────────────────────────────────────────

std::vector<ScoredToken> topk(const float *scores, int n, int k,
                              int *rejected) {
    std::vector<ScoredToken> all;
    all.reserve(n);
    int bad = 0;
    for (int i = 0; i < n; ++i) {
        float s = scores[i];
        if (std::isfinite(s)) {
            all.push_back({s, i});
        } else if (!(s < 0.0f)) { // NaN or +inf; -inf is just impossible
            ++bad;
        }
    }
    if (rejected)
        *rejected = bad;

    auto kk = std::min(static_cast<size_t>(std::max(k, 0)), all.size());
    std::partial_sort(all.begin(), all.begin() + kk, all.end(),
                      [](const ScoredToken &a, const ScoredToken &b) {
                          if (a.score != b.score)
                              return a.score > b.score;
                          return a.id < b.id;
                      });
    all.resize(kk);
    return all;
}

int diversity_span(int beam, float ratio) {
    return std::max(1, static_cast<int>((1.0f - ratio) * beam));
}

std::vector<JointCandidate>
select_joint_topk(const std::vector<ScoredToken> &st,
                  const std::vector<ScoredToken> &asr, int beam,
                  float ratio_diverse_st, float ratio_diverse_asr) {
    int rows = static_cast<int>(st.size());
    int cols = static_cast<int>(asr.size());

    bool div_st = ratio_diverse_st > 0.0f;
    bool div_asr = ratio_diverse_asr > 0.0f;
    if (div_st && !div_asr) {
        cols = std::min(cols, diversity_span(beam, ratio_diverse_st));
    } else if (div_asr && !div_st) {
        rows = std::min(rows, diversity_span(beam, ratio_diverse_asr));
    } else if (div_st && div_asr) {
        int cr = diversity_span(beam, ratio_diverse_asr);
        int ct = diversity_span(beam, ratio_diverse_st);
        ct = std::max(ct, (beam + cr - 1) / cr);
        rows = std::min(rows, cr);
        cols = std::min(cols, ct);
    }

    std::vector<JointCandidate> cands;
    cands.reserve(static_cast<size_t>(rows) * cols);
    for (int a = 0; a < rows; ++a) {
        for (int b = 0; b < cols; ++b) {
            cands.push_back({st[a].score + asr[b].score, st[a].id, asr[b].id});
        }
    }
    std::stable_sort(cands.begin(), cands.end(),
                     [](const JointCandidate &x, const JointCandidate &y) {
                         return x.score > y.score;
                     });
    if (static_cast<int>(cands.size()) > beam)
        cands.resize(beam);
    return cands;
}

bool end_detect(const std::vector<Hypothesis> &ended, int i, int st_lag,
                int M, float d_end) {
    if (ended.empty())
        return false;

    float best = ended.front().score;
    for (const auto &h : ended)
        best = std::max(best, h.score);

    int count = 0;
    for (int m = 0; m < M; ++m) {
        int length = i - m;
        bool found = false;
        float best_same = 0.0f;
        for (const auto &h : ended) {
            if (h.steps + 1 - st_lag != length)
                continue;
            if (!found || h.score > best_same)
                best_same = h.score;
            found = true;
        }
        if (found && best_same - best < d_end)
            ++count;
    }
    return count == M;
}

LengthBounds length_bounds(int encoder_length, const SearchConfig &config) {
    auto max_len = [encoder_length](float ratio) {
        if (ratio == 0.0f)
            return encoder_length;
        return std::max(1, static_cast<int>(ratio * encoder_length));
    };
    return {max_len(config.maxlenratio), max_len(config.maxlenratio_asr),
            static_cast<int>(config.minlenratio * encoder_length),
            static_cast<int>(config.minlenratio_asr * encoder_length)};
}

// ─── DualBeamSearch ──────────────────────────────────────────────────────────

namespace {

std::vector<float> read_logp(const Tensor &t, size_t vocab,
                             const char *stream) {
    if (!t.storage()) {
        throw std::runtime_error(
            std::string("Step decoder returned no distribution for ") +
            stream);
    }
    auto c = t.cpu().ascontiguousarray();
    size_t n = 1;
    for (auto d : c.shape())
        n *= d;
    if (n != vocab) {
        throw std::runtime_error(std::string("Step decoder returned ") +
                                 std::to_string(n) + " scores for " + stream +
                                 ", vocabulary has " + std::to_string(vocab));
    }
    const float *data = c.typed_data<float>();
    return std::vector<float>(data, data + n);
}

std::string join(const Vocabulary &vocab, const std::vector<int> &ids) {
    std::string out;
    for (const auto &t : vocab.tokens(ids))
        out += t;
    return out;
}

} // namespace

DualBeamSearch::DualBeamSearch(SpeechEncoder &encoder,
                               DualStepDecoder &decoder)
    : encoder_(encoder), decoder_(decoder) {}

DecodeResult DualBeamSearch::decode(const Tensor &features,
                                    const SearchConfig &config,
                                    const Vocabulary &vocab,
                                    const LanguageModel *lm) {
    validate(config);
    return decode_encoded(encoder_.encode(features), config, vocab, lm);
}

DecodeResult DualBeamSearch::decode_encoded(const Tensor &memory,
                                            const SearchConfig &config,
                                            const Vocabulary &vocab,
                                            const LanguageModel *lm) {
    validate(config);
    const auto &sync = decoder_.cross_config();
    if (sync.wait_k_asr < 0 || sync.wait_k_st < 0 ||
        (sync.wait_k_asr > 0 && sync.wait_k_st > 0)) {
        throw std::invalid_argument(
            "wait_k_asr and wait_k_st are mutually exclusive and >= 0");
    }
    if (vocab.size() < 2) {
        throw std::invalid_argument("Vocabulary needs at least blank and eos");
    }
    if (memory.shape().size() != 3 || memory.shape()[1] == 0) {
        throw std::invalid_argument(
            "Encoder output must be (1, T', hidden) with T' > 0");
    }

    SearchConfig cfg = config;
    DecodeResult result;
    for (int attempt = 0;; ++attempt) {
        auto ended = search(memory, cfg, vocab, lm);
        result.minlenratio = cfg.minlenratio;
        result.minlenratio_asr = cfg.minlenratio_asr;
        result.retries = attempt;

        if (!ended.empty()) {
            std::stable_sort(ended.begin(), ended.end(),
                             [](const Hypothesis &a, const Hypothesis &b) {
                                 return a.score > b.score;
                             });
            if (static_cast<int>(ended.size()) > cfg.n_best)
                ended.resize(cfg.n_best);
            result.hyps = std::move(ended);
            break;
        }

        bool relaxable = cfg.minlenratio > 0.0f || cfg.minlenratio_asr > 0.0f;
        if (attempt >= cfg.max_retries || !relaxable) {
            std::cerr << "Warning: no N-best results after " << attempt
                      << " retries" << std::endl;
            break;
        }
        std::cerr << "Warning: no N-best results, decoding again with "
                     "smaller minlenratio"
                  << std::endl;
        cfg.minlenratio = std::max(0.0f, cfg.minlenratio - 0.1f);
        cfg.minlenratio_asr = std::max(0.0f, cfg.minlenratio_asr - 0.1f);
    }

    if (cfg.verbose && !result.hyps.empty()) {
        const auto &best = result.hyps.front();
        std::cerr << "total log probability: " << best.score << std::endl;
        std::cerr << "normalized log probability: "
                  << best.score / static_cast<float>(best.tokens_st.size())
                  << std::endl;
    }
    return result;
}

std::vector<Hypothesis> DualBeamSearch::search(const Tensor &memory,
                                               const SearchConfig &cfg,
                                               const Vocabulary &vocab,
                                               const LanguageModel *lm) {
    const auto &sync = decoder_.cross_config();
    const int eos = vocab.eos();
    const int beam = cfg.beam_size;
    const auto vocab_size = vocab.size();
    const int ignore_id = -1;

    int sos_st = cfg.tgt_lang.empty() ? eos : vocab.language_token(cfg.tgt_lang);
    int sos_asr =
        cfg.src_lang.empty() ? eos : vocab.language_token(cfg.src_lang);

    int T = static_cast<int>(memory.shape()[1]);
    auto bounds = length_bounds(T, cfg);
    if (cfg.verbose) {
        std::cerr << "input lengths: " << T << std::endl;
        std::cerr << "max output length: " << bounds.maxlen
                  << "; min output length: " << bounds.minlen << std::endl;
        std::cerr << "max output length asr: " << bounds.maxlen_asr
                  << "; min output length asr: " << bounds.minlen_asr
                  << std::endl;
    }

    Hypothesis init;
    init.tokens_st = {sos_st};
    init.tokens_asr = {sos_asr};
    std::vector<Hypothesis> hyps = {init};
    std::vector<Hypothesis> ended;

    int steps = std::max(bounds.maxlen, bounds.maxlen_asr);
    for (int i = 0; i < steps; ++i) {
        std::vector<Hypothesis> kept;
        int rejected_total = 0;

        // ST waits for wait_k_asr ASR tokens, ASR for wait_k_st ST tokens.
        bool lag_st = i < sync.wait_k_asr;
        bool lag_asr = i < sync.wait_k_st;

        for (const auto &hyp : hyps) {
            bool frozen_st = hyp.ended_st && i > cfg.end_grace_steps;
            bool frozen_asr = hyp.ended_asr && i > cfg.end_grace_steps;
            bool want_st = !lag_st && !frozen_st;
            bool want_asr = !lag_asr && !frozen_asr;

            // One stream frozen while the other still waits for its lag:
            // nothing can be expanded, so the hypothesis is dropped.
            if (!want_st && !want_asr) {
                std::cerr << "Warning: hypothesis has no stream to expand at "
                             "step "
                          << i << ", dropping it" << std::endl;
                continue;
            }

            DualStepRequest req;
            req.tokens_st = hyp.tokens_st;
            req.tokens_asr = hyp.tokens_asr;
            req.self_mask_st =
                subsequent_mask(static_cast<int>(hyp.tokens_st.size()));
            req.self_mask_asr =
                subsequent_mask(static_cast<int>(hyp.tokens_asr.size()));
            req.cross_mask_st = build_cross_mask(hyp.tokens_st, hyp.tokens_asr,
                                                 ignore_id, -sync.wait_k_asr);
            req.cross_mask_asr = build_cross_mask(
                hyp.tokens_asr, hyp.tokens_st, ignore_id, -sync.wait_k_st);
            req.memory = memory;
            req.coupling = sync;
            req.want_st = want_st;
            req.want_asr = want_asr;

            auto out = decoder_.step(req);

            std::vector<ScoredToken> top_st, top_asr;
            int rejected = 0;
            if (want_st) {
                auto logp = read_logp(out.logp_st, vocab_size, "ST");
                if (lm && cfg.lm_weight > 0.0f) {
                    auto lm_logp = read_logp(lm->score(hyp.tokens_st),
                                             vocab_size, "LM");
                    for (size_t v = 0; v < vocab_size; ++v)
                        logp[v] += cfg.lm_weight * lm_logp[v];
                }
                top_st = topk(logp.data(), static_cast<int>(vocab_size), beam,
                              &rejected);
                rejected_total += rejected;
            }
            if (want_asr) {
                auto logp = read_logp(out.logp_asr, vocab_size, "ASR");
                top_asr = topk(logp.data(), static_cast<int>(vocab_size), beam,
                               &rejected);
                rejected_total += rejected;
            }

            std::vector<JointCandidate> cands;
            if (want_st && want_asr) {
                cands = select_joint_topk(top_st, top_asr, beam,
                                          cfg.ratio_diverse_st,
                                          cfg.ratio_diverse_asr);
            } else if (want_st) {
                for (const auto &t : top_st)
                    cands.push_back({t.score, t.id, -1});
            } else {
                for (const auto &t : top_asr)
                    cands.push_back({t.score, -1, t.id});
            }

            for (const auto &c : cands) {
                Hypothesis child = hyp;
                child.score += c.score;
                child.steps += 1;
                // A stream without a distribution is carried unchanged: it
                // is either still waiting for its lag or frozen after eos.
                if (want_st) {
                    child.tokens_st.push_back(c.st);
                    child.ended_st = c.st == eos;
                }
                if (want_asr) {
                    child.tokens_asr.push_back(c.asr);
                    child.ended_asr = c.asr == eos;
                }
                kept.push_back(std::move(child));
            }
        }

        if (rejected_total > 0) {
            std::cerr << "Warning: rejected " << rejected_total
                      << " non-finite scores at step " << i << std::endl;
        }

        std::stable_sort(kept.begin(), kept.end(),
                         [](const Hypothesis &a, const Hypothesis &b) {
                             return a.score > b.score;
                         });
        if (static_cast<int>(kept.size()) > beam)
            kept.resize(beam);

        if (cfg.verbose && !kept.empty()) {
            std::cerr << "position " << i << std::endl;
            std::cerr << "best hypo: " << join(vocab, kept[0].tokens_st)
                      << std::endl;
            std::cerr << "best hypo asr: " << join(vocab, kept[0].tokens_asr)
                      << std::endl;
        }

        // Force eos at the last position so something can end.
        if (i == bounds.maxlen - 1) {
            for (auto &h : kept) {
                if (!h.ended_st) {
                    h.tokens_st.push_back(eos);
                    h.ended_st = true;
                }
            }
        }
        if (i == bounds.maxlen_asr - 1) {
            for (auto &h : kept) {
                if (!h.ended_asr) {
                    h.tokens_asr.push_back(eos);
                    h.ended_asr = true;
                }
            }
        }

        std::vector<Hypothesis> remained;
        for (auto &h : kept) {
            if (!h.ended()) {
                remained.push_back(std::move(h));
                continue;
            }
            if (static_cast<int>(h.tokens_st.size()) > bounds.minlen &&
                static_cast<int>(h.tokens_asr.size()) > bounds.minlen_asr) {
                h.score += static_cast<float>(i + 1) * cfg.penalty;
                ended.push_back(std::move(h));
            }
        }

        if (end_detect(ended, i, sync.wait_k_asr) &&
            cfg.maxlenratio == 0.0f &&
            cfg.maxlenratio_asr == 0.0f) {
            if (cfg.verbose)
                std::cerr << "end detected at " << i << std::endl;
            break;
        }

        hyps = std::move(remained);
        if (hyps.empty()) {
            if (cfg.verbose)
                std::cerr << "no hypothesis. Finish decoding." << std::endl;
            break;
        }
        if (cfg.verbose) {
            std::cerr << "remained hypotheses: " << hyps.size()
                      << ", ended hypotheses: " << ended.size() << std::endl;
        }
    }
    return ended;
}

} // namespace dualst
