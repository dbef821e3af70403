#include <gtest/gtest.h>

#include "dualst/dualst.hpp"

#include <axiom/io/numpy.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <set>

using namespace dualst;
using namespace axiom;

// ─── Test Fixture with model paths ──────────────────────────────────────────

static std::string model_path(const std::string &filename) {
    // Try a few relative paths since test runner CWD may vary
    for (const auto &base : {"models", "../models", "../../models"}) {
        auto p = std::string(base) + "/" + filename;
        if (std::filesystem::exists(p))
            return p;
    }
    return std::string("models/") + filename;
}

static bool has_model_files() {
    return std::filesystem::exists(model_path("model.safetensors")) &&
           std::filesystem::exists(model_path("dict.txt")) &&
           std::filesystem::exists(model_path("features.npy"));
}

static std::string temp_file(const std::string &name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// ─── Scripted collaborators ─────────────────────────────────────────────────

// blank, a, b, c, <2de>, <2en>, eos
static const Vocabulary kVocab =
    Vocabulary::from_units({"a", "b", "c", "<2de>", "<2en>"});
static const int kEos = 6;
static const int kV = 7;

// Flat distribution at `rest` with `id` at `best`.
static std::vector<float> prefer(int id, float best = -0.1f,
                                 float rest = -5.0f) {
    std::vector<float> logp(kV, rest);
    logp[id] = best;
    return logp;
}

using Scorer =
    std::function<std::vector<float>(const std::vector<int> &prefix, bool st)>;

// Emits script[k] at position k (k = tokens already emitted), eos after.
static Scorer script(std::vector<int> st, std::vector<int> asr) {
    return [st, asr](const std::vector<int> &prefix, bool is_st) {
        const auto &seq = is_st ? st : asr;
        size_t k = prefix.size() - 1;
        return prefer(k < seq.size() ? seq[k] : kEos);
    };
}

class ScriptedModel : public SpeechEncoder, public DualStepDecoder {
  public:
    explicit ScriptedModel(Scorer scorer) : scorer_(std::move(scorer)) {}

    Tensor encode(const Tensor &features) override {
        ++encode_calls;
        return Tensor::zeros({1, features.shape()[0], 4});
    }

    DualStepOutput step(const DualStepRequest &req) override {
        requests.push_back(req);
        DualStepOutput out;
        if (req.want_st)
            out.logp_st = to_tensor(scorer_(req.tokens_st, true));
        if (req.want_asr)
            out.logp_asr = to_tensor(scorer_(req.tokens_asr, false));
        return out;
    }

    const CrossConfig &cross_config() const override { return cross; }

    CrossConfig cross;
    std::vector<DualStepRequest> requests;
    int encode_calls = 0;

  private:
    Scorer scorer_;

    static Tensor to_tensor(std::vector<float> v) {
        return Tensor::from_data(v.data(), Shape{v.size()}, true);
    }
};

class FixedLM : public LanguageModel {
  public:
    explicit FixedLM(std::vector<float> logp) : logp_(std::move(logp)) {}

    Tensor score(const std::vector<int> &) const override {
        auto v = logp_;
        return Tensor::from_data(v.data(), Shape{v.size()}, true);
    }

  private:
    std::vector<float> logp_;
};

static Tensor frames(size_t t) { return Tensor::zeros({t, 4}); }

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 1: Config Presets and Validation
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConfigPresets, MakeMustCConfig) {
    auto cfg = make_must_c_config();
    EXPECT_EQ(cfg.encoder.input_dim, 83);
    EXPECT_EQ(cfg.encoder.num_layers, 12);
    EXPECT_EQ(cfg.decoder.num_layers, 6);
    EXPECT_EQ(cfg.decoder.vocab_size, 8000);
    EXPECT_TRUE(cfg.cross.cross_self);
    EXPECT_TRUE(cfg.cross.cross_src);
    EXPECT_EQ(cfg.cross.cross_operator, CrossOperator::Sum);
    EXPECT_FLOAT_EQ(cfg.cross.cross_weight, 0.3f);
    EXPECT_TRUE(cfg.cross.enabled());
    EXPECT_NO_THROW(validate(cfg));
}

TEST(ConfigPresets, MakeIndependentConfig) {
    auto cfg = make_independent_config();
    EXPECT_FALSE(cfg.cross.enabled());
    EXPECT_NO_THROW(validate(cfg));
}

TEST(ConfigPresets, TasksFollowWeights) {
    auto cfg = make_must_c_config();
    EXPECT_TRUE(has_task(cfg.tasks(), Task::ST));
    EXPECT_TRUE(has_task(cfg.tasks(), Task::ASR));
    EXPECT_FALSE(has_task(cfg.tasks(), Task::MT));

    cfg.asr_weight = 0.0f;
    EXPECT_FALSE(has_task(cfg.tasks(), Task::ASR));
    cfg.asr_weight = 0.5f;
    cfg.mtlalpha = 1.0f;
    EXPECT_FALSE(has_task(cfg.tasks(), Task::ASR));
    cfg.mt_weight = 0.1f;
    EXPECT_TRUE(has_task(cfg.tasks(), Task::MT));
}

TEST(ConfigValidation, BothWaitKPositive) {
    auto cfg = make_must_c_config();
    cfg.cross.wait_k_asr = 2;
    cfg.cross.wait_k_st = 1;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, NegativeWaitK) {
    auto cfg = make_must_c_config();
    cfg.cross.wait_k_st = -1;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, SumNeedsPositiveWeight) {
    auto cfg = make_must_c_config();
    cfg.cross.cross_weight = 0.0f;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, CrossNeedsAsrTask) {
    auto cfg = make_must_c_config();
    cfg.asr_weight = 0.0f;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, DirectionNeedsSelfOrSrc) {
    auto cfg = make_must_c_config();
    cfg.cross.cross_self = false;
    cfg.cross.cross_src = false;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, OperatorWithoutDirection) {
    auto cfg = make_independent_config();
    cfg.cross.cross_operator = CrossOperator::Sum;
    cfg.cross.cross_weight = 0.3f;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, PreNormSourceNeedsNormalizeBefore) {
    auto cfg = make_must_c_config();
    cfg.cross.cross_self_from = CrossFrom::PreNorm;
    EXPECT_NO_THROW(validate(cfg));
    cfg.decoder.normalize_before = false;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, HiddenSizeMismatch) {
    auto cfg = make_must_c_config();
    cfg.decoder.hidden_size = 512;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST(ConfigValidation, SearchConfig) {
    SearchConfig search;
    EXPECT_NO_THROW(validate(search));

    auto bad = search;
    bad.beam_size = 0;
    EXPECT_THROW(validate(bad), std::invalid_argument);
    bad = search;
    bad.n_best = 0;
    EXPECT_THROW(validate(bad), std::invalid_argument);
    bad = search;
    bad.ratio_diverse_st = 1.0f;
    EXPECT_THROW(validate(bad), std::invalid_argument);
    bad = search;
    bad.minlenratio_asr = -0.1f;
    EXPECT_THROW(validate(bad), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 2: Masks
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Mask, SubsequentIsLowerTriangular) {
    auto m = subsequent_mask(3);
    EXPECT_EQ(m.rows, 3);
    EXPECT_EQ(m.cols, 3);
    EXPECT_TRUE(m(0, 0));
    EXPECT_FALSE(m(0, 1));
    EXPECT_TRUE(m(2, 0));
    EXPECT_TRUE(m(2, 2));
    EXPECT_FALSE(m(1, 2));
}

TEST(Mask, SubsequentNegativeThrows) {
    EXPECT_THROW(subsequent_mask(-1), std::invalid_argument);
    EXPECT_TRUE(subsequent_mask(0).empty());
}

TEST(Mask, TargetHidesIgnoredKeys) {
    auto m = target_mask({6, 1, -1}, -1);
    EXPECT_TRUE(m(2, 0));
    EXPECT_TRUE(m(2, 1));
    EXPECT_FALSE(m(2, 2));
}

TEST(Mask, CrossLagZeroIsCausal) {
    auto m = build_cross_mask({6, 1, 2}, {6, 3, 4}, -1, 0);
    EXPECT_EQ(m, subsequent_mask(3));
}

TEST(Mask, CrossNegativeLagSeesAhead) {
    // ST waiting for 2 ASR tokens: its start token sees the first three
    auto m = build_cross_mask({6}, {6, 3, 3}, -1, -2);
    ASSERT_EQ(m.rows, 1);
    ASSERT_EQ(m.cols, 3);
    EXPECT_TRUE(m(0, 0));
    EXPECT_TRUE(m(0, 1));
    EXPECT_TRUE(m(0, 2));
}

TEST(Mask, CrossPositiveLagDelays) {
    auto m = build_cross_mask({6, 1, 2}, {6, 3, 4}, -1, 1);
    EXPECT_FALSE(m(0, 0));
    EXPECT_TRUE(m(1, 0));
    EXPECT_FALSE(m(1, 1));
    EXPECT_TRUE(m(2, 1));
}

TEST(Mask, CrossIgnoresPadding) {
    auto m = build_cross_mask({6, 1, -1}, {6, -1, 3}, -1, 0);
    EXPECT_TRUE(m(1, 0));
    EXPECT_FALSE(m(1, 1));
    EXPECT_FALSE(m(2, 0)); // ignored query row
}

TEST(Mask, FillTensorMarksBlocked) {
    auto t = subsequent_mask(2).to_fill_tensor();
    ASSERT_EQ(t.shape().size(), 4u);
    EXPECT_EQ(t.shape()[2], 2u);
    auto c = t.ascontiguousarray();
    const float *d = c.typed_data<float>();
    EXPECT_FLOAT_EQ(d[0], 0.0f);
    EXPECT_FLOAT_EQ(d[1], 1.0f);
    EXPECT_FLOAT_EQ(d[2], 0.0f);
    EXPECT_FLOAT_EQ(d[3], 0.0f);
    EXPECT_FALSE(AttentionMask{}.to_fill_tensor().storage());
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 3: Selection Primitives
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TopK, DescendingWithLowerIdOnTies) {
    std::vector<float> s = {0.1f, 0.5f, 0.3f, 0.5f};
    auto top = topk(s.data(), 4, 3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].id, 1);
    EXPECT_EQ(top[1].id, 3);
    EXPECT_EQ(top[2].id, 2);
}

TEST(TopK, RejectsNonFinite) {
    float inf = std::numeric_limits<float>::infinity();
    float nan = std::numeric_limits<float>::quiet_NaN();
    std::vector<float> s = {0.5f, nan, 0.5f, -inf, inf, 0.1f};
    int rejected = 0;
    auto top = topk(s.data(), 6, 10, &rejected);
    EXPECT_EQ(rejected, 2);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].id, 0);
    EXPECT_EQ(top[1].id, 2);
    EXPECT_EQ(top[2].id, 5);
}

TEST(DiversitySpan, ShrinksWithRatio) {
    EXPECT_EQ(diversity_span(8, 0.0f), 8);
    EXPECT_EQ(diversity_span(8, 0.25f), 6);
    EXPECT_EQ(diversity_span(8, 0.5f), 4);
    EXPECT_EQ(diversity_span(8, 0.75f), 2);
    EXPECT_EQ(diversity_span(8, 0.99f), 1);
}

static const std::vector<ScoredToken> kTopSt = {
    {-1.0f, 10}, {-2.0f, 11}, {-3.0f, 12}};
static const std::vector<ScoredToken> kTopAsr = {
    {-1.0f, 20}, {-2.0f, 21}, {-3.0f, 22}};

TEST(JointTopK, UnrestrictedRowMajorTies) {
    auto c = select_joint_topk(kTopSt, kTopAsr, 3, 0.0f, 0.0f);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_FLOAT_EQ(c[0].score, -2.0f);
    EXPECT_EQ(c[0].st, 10);
    EXPECT_EQ(c[0].asr, 20);
    // (10, 21) and (11, 20) tie; row-major order keeps (10, 21) first
    EXPECT_EQ(c[1].st, 10);
    EXPECT_EQ(c[1].asr, 21);
    EXPECT_EQ(c[2].st, 11);
    EXPECT_EQ(c[2].asr, 20);
}

TEST(JointTopK, StDiversityKeepsOneAsrColumn) {
    auto c = select_joint_topk(kTopSt, kTopAsr, 3, 0.5f, 0.0f);
    ASSERT_EQ(c.size(), 3u);
    for (size_t i = 0; i < c.size(); ++i) {
        EXPECT_EQ(c[i].asr, 20);
        EXPECT_EQ(c[i].st, 10 + static_cast<int>(i));
    }
}

TEST(JointTopK, AsrDiversityKeepsOneStRow) {
    auto c = select_joint_topk(kTopSt, kTopAsr, 3, 0.0f, 0.5f);
    ASSERT_EQ(c.size(), 3u);
    for (size_t i = 0; i < c.size(); ++i) {
        EXPECT_EQ(c[i].st, 10);
        EXPECT_EQ(c[i].asr, 20 + static_cast<int>(i));
    }
}

TEST(JointTopK, BothDiversityWidensColumns) {
    // cr = 1 row, ct widened to ceil(3 / 1) = 3 columns
    auto c = select_joint_topk(kTopSt, kTopAsr, 3, 0.5f, 0.5f);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c[2].st, 10);
    EXPECT_EQ(c[2].asr, 22);
}

TEST(JointTopK, StDiversityMonotonic) {
    std::vector<ScoredToken> st = {
        {-1.0f, 10}, {-2.0f, 11}, {-3.0f, 12}, {-4.0f, 13}};
    std::vector<ScoredToken> asr = {
        {-1.0f, 20}, {-1.1f, 21}, {-1.2f, 22}, {-1.3f, 23}};
    size_t previous = 0;
    for (float ratio : {0.0f, 0.25f, 0.5f, 0.75f}) {
        auto c = select_joint_topk(st, asr, 4, ratio, 0.0f);
        std::set<int> distinct;
        for (const auto &cand : c)
            distinct.insert(cand.st);
        EXPECT_GE(distinct.size(), previous) << "ratio " << ratio;
        previous = distinct.size();
    }
    EXPECT_EQ(previous, 4u);
}

TEST(JointTopK, UndersizedSubmatrixYieldsFewer) {
    std::vector<ScoredToken> st = {{-1.0f, 10}, {-2.0f, 11}};
    auto c = select_joint_topk(st, kTopAsr, 3, 0.9f, 0.0f);
    EXPECT_EQ(c.size(), 2u);
}

static Hypothesis ended_hyp(float score, int steps) {
    Hypothesis h;
    h.score = score;
    h.steps = steps;
    h.ended_st = h.ended_asr = true;
    return h;
}

TEST(EndDetect, EmptyIsFalse) { EXPECT_FALSE(end_detect({}, 5)); }

TEST(EndDetect, RecentHypothesesFarBelowBest) {
    std::vector<Hypothesis> ended = {ended_hyp(-1.0f, 0), ended_hyp(-20.0f, 4),
                                     ended_hyp(-20.0f, 3),
                                     ended_hyp(-20.0f, 2)};
    EXPECT_TRUE(end_detect(ended, 5));

    ended[2].score = -5.0f; // length 4 still competitive
    EXPECT_FALSE(end_detect(ended, 5));
}

TEST(EndDetect, MissingLengthIsFalse) {
    std::vector<Hypothesis> ended = {ended_hyp(-1.0f, 0), ended_hyp(-20.0f, 4),
                                     ended_hyp(-20.0f, 2)};
    EXPECT_FALSE(end_detect(ended, 5));
}

TEST(EndDetect, TranslationLagShortensLength) {
    // Two lagged steps add no translation token.
    std::vector<Hypothesis> ended = {ended_hyp(-1.0f, 0), ended_hyp(-20.0f, 6),
                                     ended_hyp(-20.0f, 5),
                                     ended_hyp(-20.0f, 4)};
    EXPECT_FALSE(end_detect(ended, 5));
    EXPECT_TRUE(end_detect(ended, 5, 2));
}

TEST(LengthBounds, RatiosScaleEncoderLength) {
    SearchConfig cfg;
    auto b = length_bounds(100, cfg);
    EXPECT_EQ(b.maxlen, 100);
    EXPECT_EQ(b.maxlen_asr, 100);
    EXPECT_EQ(b.minlen, 0);

    cfg.maxlenratio = 0.3f;
    cfg.minlenratio_asr = 0.25f;
    b = length_bounds(100, cfg);
    EXPECT_EQ(b.maxlen, 30);
    EXPECT_EQ(b.maxlen_asr, 100);
    EXPECT_EQ(b.minlen_asr, 25);

    cfg.maxlenratio = 0.001f;
    EXPECT_EQ(length_bounds(100, cfg).maxlen, 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 4: Joint Beam Search (scripted decoder)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BeamSearch, GreedyScoresAreAdditive) {
    ScriptedModel model(script({1, 2}, {3, 3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(result.hyps.size(), 1u);
    const auto &h = result.hyps[0];
    EXPECT_EQ(h.tokens_st, (std::vector<int>{kEos, 1, 2, kEos}));
    EXPECT_EQ(h.tokens_asr, (std::vector<int>{kEos, 3, 3, kEos}));
    EXPECT_NEAR(h.score, -0.6f, 1e-5f);
    EXPECT_EQ(model.encode_calls, 1);
    EXPECT_EQ(model.requests.size(), 3u);
}

TEST(BeamSearch, PenaltyAddedOnEnding) {
    ScriptedModel model(script({1, 2}, {3, 3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;
    cfg.penalty = 0.5f;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(result.hyps.size(), 1u);
    // ended at step 2: + (2 + 1) * 0.5
    EXPECT_NEAR(result.hyps[0].score, -0.6f + 1.5f, 1e-5f);
}

TEST(BeamSearch, SelfMasksMatchStreamLength) {
    ScriptedModel model(script({1, 2}, {3, 3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;
    search.decode(frames(10), cfg, kVocab);

    ASSERT_EQ(model.requests.size(), 3u);
    for (size_t i = 0; i < model.requests.size(); ++i) {
        const auto &req = model.requests[i];
        EXPECT_EQ(req.self_mask_st, subsequent_mask(static_cast<int>(i) + 1));
        EXPECT_EQ(req.self_mask_asr,
                  subsequent_mask(static_cast<int>(i) + 1));
        EXPECT_EQ(req.cross_mask_st, subsequent_mask(static_cast<int>(i) + 1));
        EXPECT_TRUE(req.want_st);
        EXPECT_TRUE(req.want_asr);
    }
}

TEST(BeamSearch, WaitKHoldsTranslationBack) {
    ScriptedModel model(script({1}, {3, 3, 3}));
    model.cross.wait_k_asr = 2;
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_GE(model.requests.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(model.requests[i].self_mask_st.rows, 1) << "step " << i;
        EXPECT_TRUE(model.requests[i].want_asr);
    }
    EXPECT_FALSE(model.requests[0].want_st);
    EXPECT_FALSE(model.requests[1].want_st);
    EXPECT_TRUE(model.requests[2].want_st);

    // At step 2 the ST start token sees all three ASR positions
    const auto &cross = model.requests[2].cross_mask_st;
    ASSERT_EQ(cross.cols, 3);
    EXPECT_TRUE(cross(0, 2));

    ASSERT_EQ(result.hyps.size(), 1u);
    EXPECT_EQ(result.hyps[0].tokens_st, (std::vector<int>{kEos, 1, kEos}));
    EXPECT_EQ(result.hyps[0].tokens_asr,
              (std::vector<int>{kEos, 3, 3, 3, kEos}));
}

TEST(BeamSearch, EndedStreamFreezesAfterGraceSteps) {
    // Translation ends at once; transcription runs six more tokens.
    ScriptedModel model(script({}, {3, 3, 3, 3, 3, 3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(model.requests.size(), 7u);
    for (size_t i = 0; i < model.requests.size(); ++i) {
        const auto &req = model.requests[i];
        EXPECT_EQ(req.want_st, i <= 2) << "step " << i;
        EXPECT_TRUE(req.want_asr) << "step " << i;
        EXPECT_EQ(req.tokens_st.size(), std::min<size_t>(i + 1, 4))
            << "step " << i;
        EXPECT_EQ(req.self_mask_st.rows,
                  static_cast<int>(req.tokens_st.size()));
    }

    ASSERT_EQ(result.hyps.size(), 1u);
    const auto &h = result.hyps[0];
    EXPECT_EQ(h.tokens_st, (std::vector<int>{kEos, kEos, kEos, kEos}));
    EXPECT_EQ(h.tokens_asr,
              (std::vector<int>{kEos, 3, 3, 3, 3, 3, 3, kEos}));
    // 3 translation + 7 transcription choices at -0.1 each
    EXPECT_NEAR(h.score, -1.0f, 1e-5f);
}

TEST(BeamSearch, HypothesisWithNothingToExpandIsDropped) {
    // Translation is frozen at step 3 while transcription still waits for
    // five translation tokens: that hypothesis cannot be expanded.
    ScriptedModel model(script({}, {3, 3}));
    model.cross.wait_k_st = 5;
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(model.requests.size(), 3u);
    for (const auto &req : model.requests) {
        EXPECT_TRUE(req.want_st);
        EXPECT_FALSE(req.want_asr);
    }
    EXPECT_TRUE(result.hyps.empty());
    EXPECT_EQ(result.retries, 0);
}

TEST(BeamSearch, InvalidWaitKThrows) {
    ScriptedModel model(script({1}, {3}));
    model.cross.wait_k_asr = 1;
    model.cross.wait_k_st = 1;
    DualBeamSearch search(model, model);
    EXPECT_THROW(search.decode(frames(10), SearchConfig{}, kVocab),
                 std::invalid_argument);
}

TEST(BeamSearch, InvalidBeamThrows) {
    ScriptedModel model(script({1}, {3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 0;
    EXPECT_THROW(search.decode(frames(10), cfg, kVocab),
                 std::invalid_argument);
    EXPECT_EQ(model.encode_calls, 0);
}

TEST(BeamSearch, ForcesEosAtMaxLength) {
    // eos never preferred, so only the length bound can end the streams
    ScriptedModel model([](const std::vector<int> &, bool) {
        auto logp = prefer(1);
        logp[kEos] = -10.0f;
        return logp;
    });
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;
    cfg.maxlenratio = 0.3f;
    cfg.maxlenratio_asr = 0.3f;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(result.hyps.size(), 1u);
    EXPECT_EQ(result.hyps[0].tokens_st,
              (std::vector<int>{kEos, 1, 1, 1, kEos}));
    EXPECT_EQ(result.hyps[0].tokens_asr.back(), kEos);
    EXPECT_NEAR(result.hyps[0].score, -0.6f, 1e-5f);
}

TEST(BeamSearch, RelaxesMinLengthOnEmptyResult) {
    // Both streams end with length 5; min length 5 rejects them first
    ScriptedModel model(script({1, 1, 1}, {3, 3, 3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;
    cfg.minlenratio = 0.5f;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(result.hyps.size(), 1u);
    EXPECT_EQ(result.retries, 1);
    EXPECT_FLOAT_EQ(result.minlenratio, 0.4f);
    EXPECT_EQ(result.hyps[0].tokens_st.size(), 5u);
    EXPECT_EQ(model.encode_calls, 1);
}

TEST(BeamSearch, EmptyWhenRetriesExhausted) {
    ScriptedModel model(script({1, 1, 1}, {3, 3, 3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;
    cfg.minlenratio = 0.9f;
    cfg.max_retries = 0;

    auto result = search.decode(frames(10), cfg, kVocab);
    EXPECT_TRUE(result.hyps.empty());
    EXPECT_EQ(result.retries, 0);
}

static std::vector<float> nbest_scorer(const std::vector<int> &prefix,
                                       bool st) {
    if (prefix.size() > 1)
        return prefer(kEos, -0.1f, -10.0f);
    std::vector<float> logp(kV, -10.0f);
    logp[kEos] = -0.5f;
    if (st) {
        logp[1] = -1.0f;
        logp[2] = -2.0f;
    } else {
        logp[3] = -1.0f;
    }
    return logp;
}

TEST(BeamSearch, NBestSortedByScore) {
    ScriptedModel model(nbest_scorer);
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 3;
    cfg.n_best = 2;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(result.hyps.size(), 2u);
    EXPECT_NEAR(result.hyps[0].score, -1.0f, 1e-5f);
    EXPECT_NEAR(result.hyps[1].score, -1.7f, 1e-5f);
    EXPECT_EQ(result.hyps[0].tokens_st, (std::vector<int>{kEos, kEos}));
    EXPECT_EQ(result.hyps[0].tokens_asr, (std::vector<int>{kEos, kEos}));
}

TEST(BeamSearch, Deterministic) {
    SearchConfig cfg;
    cfg.beam_size = 3;
    cfg.n_best = 3;

    ScriptedModel a(nbest_scorer), b(nbest_scorer);
    auto ra = DualBeamSearch(a, a).decode(frames(10), cfg, kVocab);
    auto rb = DualBeamSearch(b, b).decode(frames(10), cfg, kVocab);
    ASSERT_EQ(ra.hyps.size(), rb.hyps.size());
    for (size_t i = 0; i < ra.hyps.size(); ++i) {
        EXPECT_EQ(ra.hyps[i].score, rb.hyps[i].score);
        EXPECT_EQ(ra.hyps[i].tokens_st, rb.hyps[i].tokens_st);
        EXPECT_EQ(ra.hyps[i].tokens_asr, rb.hyps[i].tokens_asr);
    }
}

TEST(BeamSearch, LanguageTagsStartStreams) {
    ScriptedModel model(script({1}, {3}));
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;
    cfg.tgt_lang = "de";
    cfg.src_lang = "en";

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(result.hyps.size(), 1u);
    EXPECT_EQ(result.hyps[0].tokens_st.front(), kVocab.id("<2de>"));
    EXPECT_EQ(result.hyps[0].tokens_asr.front(), kVocab.id("<2en>"));

    cfg.tgt_lang = "fr";
    EXPECT_THROW(search.decode(frames(10), cfg, kVocab),
                 std::invalid_argument);
}

TEST(BeamSearch, LanguageModelFusionOnTranslation) {
    ScriptedModel model([](const std::vector<int> &prefix, bool st) {
        if (prefix.size() > 1)
            return prefer(kEos);
        auto logp = prefer(st ? 1 : 3, -0.5f);
        logp[2] = -1.0f;
        return logp;
    });
    std::vector<float> lm_logp(kV, -5.0f);
    lm_logp[2] = 0.0f;
    lm_logp[kEos] = 0.0f;
    FixedLM lm(lm_logp);

    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;

    auto plain = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(plain.hyps.size(), 1u);
    EXPECT_EQ(plain.hyps[0].tokens_st[1], 1);

    cfg.lm_weight = 1.0f;
    auto fused = search.decode(frames(10), cfg, kVocab, &lm);
    ASSERT_EQ(fused.hyps.size(), 1u);
    EXPECT_EQ(fused.hyps[0].tokens_st[1], 2);
    EXPECT_EQ(fused.hyps[0].tokens_asr[1], 3); // ASR unaffected
}

TEST(BeamSearch, NonFiniteScoresNeverSelected) {
    ScriptedModel model([](const std::vector<int> &prefix, bool) {
        if (prefix.size() > 1)
            return prefer(kEos);
        auto logp = prefer(3, -0.5f);
        logp[1] = std::numeric_limits<float>::quiet_NaN();
        logp[2] = std::numeric_limits<float>::infinity();
        return logp;
    });
    DualBeamSearch search(model, model);
    SearchConfig cfg;
    cfg.beam_size = 1;

    auto result = search.decode(frames(10), cfg, kVocab);
    ASSERT_EQ(result.hyps.size(), 1u);
    EXPECT_EQ(result.hyps[0].tokens_st[1], 3);
    EXPECT_TRUE(std::isfinite(result.hyps[0].score));
}

TEST(BeamSearch, WrongDistributionSizeThrows) {
    ScriptedModel model([](const std::vector<int> &, bool) {
        return std::vector<float>(5, -1.0f);
    });
    DualBeamSearch search(model, model);
    EXPECT_THROW(search.decode(frames(10), SearchConfig{}, kVocab),
                 std::runtime_error);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 5: Vocabulary
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Vocabulary, DefaultEmpty) {
    Vocabulary v;
    EXPECT_FALSE(v.loaded());
    EXPECT_EQ(v.size(), 0u);
}

TEST(Vocabulary, FromUnitsAddsBlankAndEos) {
    EXPECT_EQ(kVocab.size(), 7u);
    EXPECT_EQ(kVocab.token(0), "<blank>");
    EXPECT_EQ(kVocab.token(kEos), "<eos>");
    EXPECT_EQ(kVocab.eos(), kEos);
    EXPECT_EQ(kVocab.id("b"), 2);
    EXPECT_EQ(kVocab.id("zzz"), -1);
    EXPECT_THROW(kVocab.token(7), std::out_of_range);
}

TEST(Vocabulary, LoadDict) {
    auto path = temp_file("dualst_test_dict.txt");
    {
        std::ofstream f(path);
        f << "\xe2\x96\x81hello 1\n\xe2\x96\x81wor 2\nld 3\n<2de> 4\n";
    }
    Vocabulary v;
    v.load(path);
    EXPECT_EQ(v.size(), 6u);
    EXPECT_EQ(v.eos(), 5);
    EXPECT_EQ(v.language_token("de"), 4);
    EXPECT_THROW(v.language_token("fr"), std::invalid_argument);
    EXPECT_EQ(v.decode({4, 1, 2, 3, 5}), "hello world");
    std::filesystem::remove(path);
}

TEST(Vocabulary, NonConsecutiveIdsThrow) {
    auto path = temp_file("dualst_test_bad_dict.txt");
    {
        std::ofstream f(path);
        f << "a 1\nb 3\n";
    }
    Vocabulary v;
    EXPECT_THROW(v.load(path), std::runtime_error);
    std::filesystem::remove(path);
}

TEST(Vocabulary, MissingFileThrows) {
    Vocabulary v;
    EXPECT_THROW(v.load("/nonexistent/dict.txt"), std::runtime_error);
}

TEST(Vocabulary, LanguageTagDetection) {
    EXPECT_TRUE(is_language_tag("<2de>"));
    EXPECT_FALSE(is_language_tag("<eos>"));
    EXPECT_FALSE(is_language_tag("de"));
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 6: Features and Translator Input Checks
// ═══════════════════════════════════════════════════════════════════════════════

static Tensor sine(size_t n, float freq) {
    std::vector<float> data(n);
    for (size_t i = 0; i < n; ++i)
        data[i] = 0.5f * std::sin(2.0f * static_cast<float>(M_PI) * freq *
                                  static_cast<float>(i) / 16000.0f);
    return Tensor::from_data(data.data(), Shape{n}, true);
}

TEST(Fbank, ShapeFollowsFraming) {
    auto feats = compute_fbank(sine(16000, 440.0f));
    ASSERT_EQ(feats.shape().size(), 2u);
    EXPECT_EQ(feats.shape()[0], 98u); // 1 + (16000 - 400) / 160
    EXPECT_EQ(feats.shape()[1], 80u);

    auto c = feats.ascontiguousarray();
    const float *d = c.typed_data<float>();
    for (size_t i = 0; i < 98 * 80; ++i)
        ASSERT_TRUE(std::isfinite(d[i]));
}

TEST(Fbank, ToneEnergyInLowBins) {
    auto feats = compute_fbank(sine(4000, 440.0f)).ascontiguousarray();
    const float *d = feats.typed_data<float>();
    // 440 Hz lands around mel bin 14, far above the top bins
    EXPECT_GT(d[14], d[75]);
}

TEST(Fbank, TooShortThrows) {
    EXPECT_THROW(compute_fbank(sine(100, 440.0f)), std::invalid_argument);
}

TEST(Fbank, BadFrequencyRangeThrows) {
    FbankConfig cfg;
    cfg.high_freq = 9000.0f;
    EXPECT_THROW(compute_fbank(sine(1000, 440.0f), cfg),
                 std::invalid_argument);
}

TEST(GlobalCMVN, NormalizesWithStats) {
    GlobalCMVN cmvn;
    cmvn.set_stats({2.0, 4.0}, {4.0, 20.0}, 2.0);
    EXPECT_TRUE(cmvn.loaded());
    EXPECT_EQ(cmvn.dim(), 2);

    std::vector<float> x = {3.0f, 2.0f};
    auto out = cmvn.apply(Tensor::from_data(x.data(), Shape{1, 2}, true))
                   .cpu()
                   .ascontiguousarray();
    const float *d = out.typed_data<float>();
    EXPECT_NEAR(d[0], 2.0f, 1e-5f); // (3 - 1) / 1
    EXPECT_NEAR(d[1], 0.0f, 1e-5f); // (2 - 2) / sqrt(6)
}

TEST(GlobalCMVN, MeanOnly) {
    GlobalCMVN cmvn(/*norm_vars=*/false);
    cmvn.set_stats({2.0}, {40.0}, 2.0);
    std::vector<float> x = {5.0f};
    auto out = cmvn.apply(Tensor::from_data(x.data(), Shape{1, 1}, true))
                   .cpu()
                   .ascontiguousarray();
    EXPECT_NEAR(out.typed_data<float>()[0], 4.0f, 1e-5f);
}

TEST(GlobalCMVN, Errors) {
    GlobalCMVN cmvn;
    std::vector<float> x = {1.0f, 2.0f, 3.0f};
    auto t = Tensor::from_data(x.data(), Shape{1, 3}, true);
    EXPECT_THROW(cmvn.apply(t), std::runtime_error);
    cmvn.set_stats({1.0, 1.0}, {1.0, 1.0}, 1.0);
    EXPECT_THROW(cmvn.apply(t), std::invalid_argument);
    EXPECT_THROW(cmvn.set_stats({1.0}, {1.0, 2.0}, 1.0),
                 std::invalid_argument);
}

// Minimal RIFF writer for 16-bit PCM.
static void write_pcm16(const std::string &path, int channels,
                        const std::vector<int16_t> &samples) {
    uint32_t rate = 16000;
    uint16_t ch = static_cast<uint16_t>(channels);
    uint16_t bits = 16, format = 1;
    uint16_t align = ch * 2;
    uint32_t byte_rate = rate * align;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
    uint32_t fmt_size = 16, riff_size = 36 + data_size;

    std::ofstream f(path, std::ios::binary);
    f.write("RIFF", 4);
    f.write(reinterpret_cast<const char *>(&riff_size), 4);
    f.write("WAVEfmt ", 8);
    f.write(reinterpret_cast<const char *>(&fmt_size), 4);
    f.write(reinterpret_cast<const char *>(&format), 2);
    f.write(reinterpret_cast<const char *>(&ch), 2);
    f.write(reinterpret_cast<const char *>(&rate), 4);
    f.write(reinterpret_cast<const char *>(&byte_rate), 4);
    f.write(reinterpret_cast<const char *>(&align), 2);
    f.write(reinterpret_cast<const char *>(&bits), 2);
    f.write("data", 4);
    f.write(reinterpret_cast<const char *>(&data_size), 4);
    f.write(reinterpret_cast<const char *>(samples.data()), data_size);
}

TEST(Wav, ReadsAndDownmixesPcm16) {
    auto path = temp_file("dualst_test_stereo.wav");
    write_pcm16(path, 2, {16384, 0, 16384, 0, -16384, 0, 0, 0});

    auto wav = read_wav(path);
    EXPECT_EQ(wav.sample_rate, 16000);
    EXPECT_EQ(wav.num_channels, 2);
    EXPECT_EQ(wav.num_samples, 4);
    auto c = wav.samples.ascontiguousarray();
    const float *d = c.typed_data<float>();
    EXPECT_FLOAT_EQ(d[0], 0.25f);
    EXPECT_FLOAT_EQ(d[2], -0.25f);
    EXPECT_FLOAT_EQ(d[3], 0.0f);
    std::filesystem::remove(path);
}

TEST(Wav, RejectsNonRiff) {
    auto path = temp_file("dualst_test_bad.wav");
    {
        std::ofstream f(path, std::ios::binary);
        f << "not a wave file at all";
    }
    EXPECT_THROW(read_wav(path), std::runtime_error);
    std::filesystem::remove(path);
}

TEST(Translate, OneToManyNeedsLanguageTags) {
    auto cfg = make_must_c_config();
    SearchConfig search;
    EXPECT_THROW(check_language_tags(cfg, search), std::invalid_argument);
    search.tgt_lang = "de";
    EXPECT_THROW(check_language_tags(cfg, search), std::invalid_argument);
    search.src_lang = "en";
    EXPECT_NO_THROW(check_language_tags(cfg, search));

    cfg.lang_tok.clear();
    EXPECT_NO_THROW(check_language_tags(cfg, SearchConfig{}));
    cfg = make_must_c_config();
    cfg.one_to_many = false;
    EXPECT_NO_THROW(check_language_tags(cfg, SearchConfig{}));
}

TEST(Translate, WavFeaturesCheckRateAndDim) {
    WavData wav{sine(16000, 440.0f), 8000, 1, 16000};
    FbankConfig fbank;
    EXPECT_THROW(wav_features(wav, fbank, 80), std::runtime_error);

    wav.sample_rate = 16000;
    EXPECT_THROW(wav_features(wav, fbank, 83), std::runtime_error);

    auto feats = wav_features(wav, fbank, 80);
    EXPECT_EQ(feats.shape()[0], 98u);
    EXPECT_EQ(feats.shape()[1], 80u);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 7: Model Construction (no weights needed)
// ═══════════════════════════════════════════════════════════════════════════════

static DualConfig small_config() {
    auto cfg = make_must_c_config();
    cfg.encoder.hidden_size = 64;
    cfg.encoder.num_layers = 2;
    cfg.encoder.ffn_intermediate = 128;
    cfg.decoder.vocab_size = 10;
    cfg.decoder.hidden_size = 64;
    cfg.decoder.num_layers = 2;
    cfg.decoder.ffn_intermediate = 128;
    return cfg;
}

TEST(ModelConstruction, E2EDualDecoder) {
    E2EDualDecoder model(small_config());
    EXPECT_EQ(model.eos(), 9);
    EXPECT_EQ(model.sos(), model.eos());
    EXPECT_TRUE(model.dual_decoder().has_cross());
    EXPECT_FLOAT_EQ(model.cross_config().cross_weight, 0.3f);
}

TEST(ModelConstruction, IndependentDecoders) {
    auto cfg = small_config();
    cfg.cross = CrossConfig{};
    E2EDualDecoder model(cfg);
    EXPECT_FALSE(model.dual_decoder().has_cross());
}

TEST(ModelConstruction, LearnedCrossWeightMustBeLoaded) {
    auto cfg = small_config();
    cfg.cross.cross_weight_learnable = true;
    E2EDualDecoder model(cfg);
    EXPECT_TRUE(model.dual_decoder().learns_cross_weight());
    EXPECT_FALSE(model.dual_decoder().has_learned_cross_weights());

    DualStepRequest req;
    req.tokens_st = {model.sos()};
    req.tokens_asr = {model.sos()};
    req.self_mask_st = subsequent_mask(1);
    req.self_mask_asr = subsequent_mask(1);
    req.cross_mask_st = subsequent_mask(1);
    req.cross_mask_asr = subsequent_mask(1);
    req.memory = Tensor::zeros({1, 3, 64});
    req.coupling = model.cross_config();
    EXPECT_THROW(model.step(req), std::runtime_error);

    // Without coupling there is nothing to learn.
    cfg.cross = CrossConfig{};
    cfg.cross.cross_weight_learnable = true;
    EXPECT_FALSE(E2EDualDecoder(cfg).dual_decoder().learns_cross_weight());
}

TEST(ModelConstruction, RequiresAsrTask) {
    auto cfg = make_independent_config();
    cfg.asr_weight = 0.0f;
    EXPECT_THROW(E2EDualDecoder model(cfg), std::invalid_argument);
}

TEST(ModelConstruction, SubsamplingLength) {
    EXPECT_EQ(Conv2dSubsampling::output_length(100), 24);
    EXPECT_EQ(Conv2dSubsampling::output_length(7), 1);
    EXPECT_EQ(Conv2dSubsampling::output_length(6), 0);
}

TEST(ModelConstruction, PositionalEncodingStartsAtZero) {
    auto pe = positional_encoding(4, 6).ascontiguousarray();
    const float *d = pe.typed_data<float>();
    EXPECT_FLOAT_EQ(d[0], 0.0f); // sin(0)
    EXPECT_FLOAT_EQ(d[1], 1.0f); // cos(0)
    EXPECT_NEAR(d[6], std::sin(1.0f), 1e-6f);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 8: Translation with real weights
// ═══════════════════════════════════════════════════════════════════════════════

class ModelTest : public ::testing::Test {
  protected:
    void SetUp() override {
        if (!has_model_files()) {
            GTEST_SKIP() << "Model weights, dict, or features not found";
        }
    }

    static DualConfig config_for_dict() {
        Vocabulary dict;
        dict.load(model_path("dict.txt"));
        auto cfg = make_must_c_config();
        cfg.decoder.vocab_size = static_cast<int>(dict.size());
        return cfg;
    }
};

TEST_F(ModelTest, TranslatorProducesBothStreams) {
    Translator t(model_path("model.safetensors"), model_path("dict.txt"),
                 config_for_dict());
    auto features = axiom::io::numpy::load(model_path("features.npy"));
    SearchConfig cfg;
    cfg.beam_size = 4;
    cfg.n_best = 2;
    cfg.tgt_lang = "de";
    cfg.src_lang = "en";

    auto result = t.translate(features, cfg);
    ASSERT_FALSE(result.empty());
    EXPECT_LE(result.nbest.size(), 2u);
    EXPECT_FALSE(result.nbest[0].st_text.empty());
    EXPECT_FALSE(result.nbest[0].asr_text.empty());
    if (result.nbest.size() == 2) {
        EXPECT_GE(result.nbest[0].score, result.nbest[1].score);
    }
}

TEST_F(ModelTest, ForwardShapes) {
    E2EDualDecoder model(config_for_dict());
    model.load(model_path("model.safetensors"));
    auto features = axiom::io::numpy::load(model_path("features.npy"));
    if (features.shape().size() == 2)
        features = features.unsqueeze(0);
    auto frames_in = static_cast<int>(features.shape()[1]);

    auto memory = model.encode(features);
    ASSERT_EQ(memory.shape().size(), 3u);
    EXPECT_EQ(static_cast<int>(memory.shape()[1]),
              Conv2dSubsampling::output_length(frames_in));
    EXPECT_EQ(static_cast<int>(memory.shape()[2]),
              model.config().encoder.hidden_size);

    DualStepRequest req;
    req.tokens_st = {model.sos()};
    req.tokens_asr = {model.sos()};
    req.self_mask_st = subsequent_mask(1);
    req.self_mask_asr = subsequent_mask(1);
    req.cross_mask_st = build_cross_mask(req.tokens_st, req.tokens_asr,
                                         E2EDualDecoder::kIgnoreId, 0);
    req.cross_mask_asr = req.cross_mask_st;
    req.memory = memory;
    req.coupling = model.cross_config();
    auto out = model.step(req);
    ASSERT_TRUE(out.logp_st.storage());
    ASSERT_TRUE(out.logp_asr.storage());
    EXPECT_EQ(static_cast<int>(out.logp_st.shape()[0]),
              model.config().decoder.vocab_size);

    req.want_asr = false;
    EXPECT_FALSE(model.step(req).logp_asr.storage());
}

TEST_F(ModelTest, WaitKTranslation) {
    auto cfg = config_for_dict();
    cfg.cross.wait_k_asr = 3;
    Translator t(model_path("model.safetensors"), model_path("dict.txt"), cfg);
    auto features = axiom::io::numpy::load(model_path("features.npy"));
    SearchConfig search;
    search.beam_size = 2;
    search.tgt_lang = "de";
    search.src_lang = "en";

    auto result = t.translate(features, search);
    ASSERT_FALSE(result.empty());
    EXPECT_EQ(result.nbest[0].st_ids.back(), t.vocab().eos());
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Main
// ═══════════════════════════════════════════════════════════════════════════════

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
