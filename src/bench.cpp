#include "dualst/dualst.hpp"

#include <axiom/system.hpp>
#include <benchmark/benchmark.h>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static std::string flag_model;
static std::string flag_dict;
static bool flag_no_gpu = false;
static bool flag_markdown = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--model="))
            flag_model = arg.substr(8);
        else if (arg.starts_with("--dict="))
            flag_dict = arg.substr(7);
        else if (arg == "--no-gpu")
            flag_no_gpu = true;
        else if (arg == "--markdown")
            flag_markdown = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// "search_synthetic/10/real_time" → ("search_synthetic", "10")
static std::pair<std::string, std::string>
split_name(const std::string &name) {
    auto first = name.find('/');
    if (first == std::string::npos)
        return {name, ""};
    auto second = name.find('/', first + 1);
    return {name.substr(0, first),
            second == std::string::npos
                ? name.substr(first + 1)
                : name.substr(first + 1, second - first - 1)};
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Benchmark | Arg | Time (ms) |\n";
        std::cout << "|-----------|-----|-----------|\n";
        for (const auto &r : runs_) {
            if (r.error_occurred)
                continue;
            auto [name, arg] = split_name(r.benchmark_name());
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            std::cout << "| " << name << " | " << arg << " | " << std::fixed
                      << std::setprecision(2) << time_ms << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic model ────────────────────────────────────────────────────────

// Deterministic pseudo-random log-probs keyed on the stream prefix; eos
// becomes likely once a stream reaches `target_len` tokens.
class SyntheticModel : public dualst::SpeechEncoder,
                       public dualst::DualStepDecoder {
  public:
    SyntheticModel(int vocab_size, int target_len)
        : vocab_size_(vocab_size), target_len_(target_len) {}

    axiom::Tensor encode(const axiom::Tensor &features) override {
        return axiom::Tensor::zeros({1, features.shape()[0], 4});
    }

    dualst::DualStepOutput step(const dualst::DualStepRequest &req) override {
        dualst::DualStepOutput out;
        if (req.want_st)
            out.logp_st = scores(req.tokens_st, 0x9e3779b9u);
        if (req.want_asr)
            out.logp_asr = scores(req.tokens_asr, 0x85ebca6bu);
        return out;
    }

    const dualst::CrossConfig &cross_config() const override { return cross_; }

  private:
    int vocab_size_;
    int target_len_;
    dualst::CrossConfig cross_;

    axiom::Tensor scores(const std::vector<int> &prefix, uint32_t seed) const {
        uint32_t h = seed;
        for (int t : prefix)
            h = (h ^ static_cast<uint32_t>(t)) * 16777619u;
        std::vector<float> logp(vocab_size_);
        for (int v = 0; v < vocab_size_; ++v) {
            h = h * 1664525u + 1013904223u;
            logp[v] = -1.0f - 9.0f * static_cast<float>(h >> 8) / 16777216.0f;
        }
        int eos = vocab_size_ - 1;
        logp[eos] = static_cast<int>(prefix.size()) >= target_len_ ? -0.01f
                                                                     : -20.0f;
        return axiom::Tensor::from_data(
            logp.data(), axiom::Shape{static_cast<size_t>(vocab_size_)}, true);
    }
};

static dualst::Vocabulary synthetic_vocab(int size) {
    std::vector<std::string> units;
    for (int i = 1; i < size - 1; ++i)
        units.push_back("t" + std::to_string(i));
    return dualst::Vocabulary::from_units(units);
}

// ─── Model cache ────────────────────────────────────────────────────────────

struct ModelCache {
    std::unique_ptr<dualst::E2EDualDecoder> cpu;
    std::unique_ptr<dualst::E2EDualDecoder> gpu;
    dualst::Vocabulary vocab;
};

static ModelCache cache;

static dualst::E2EDualDecoder &load_model(bool gpu) {
    auto &slot = gpu ? cache.gpu : cache.cpu;
    if (!slot) {
        if (!cache.vocab.loaded())
            cache.vocab.load(flag_dict);
        auto cfg = dualst::make_must_c_config();
        cfg.decoder.vocab_size = static_cast<int>(cache.vocab.size());
        slot = std::make_unique<dualst::E2EDualDecoder>(cfg);
        slot->load(flag_model);
        if (gpu)
            slot->to(axiom::Device::GPU);
        std::cerr << "Loaded " << flag_model << (gpu ? " (GPU)" : " (CPU)")
                  << std::endl;
    }
    return *slot;
}

// ─── Benchmark registration ─────────────────────────────────────────────────

// Force tensor materialization (ensures lazy GPU graphs actually execute).
static void materialize(const axiom::Tensor &t) {
    auto s = t.strides();
    benchmark::DoNotOptimize(s);
}

static void register_benchmarks() {
    // Search cost alone: 200 encoder frames, both streams end around 20
    benchmark::RegisterBenchmark(
        "search_synthetic",
        [](benchmark::State &state) {
            SyntheticModel model(500, 20);
            auto vocab = synthetic_vocab(500);
            dualst::SearchConfig search;
            search.beam_size = static_cast<int>(state.range(0));
            dualst::DualBeamSearch searcher(model, model);
            auto features = axiom::Tensor::zeros({200, 4});

            for (auto _ : state) {
                auto result = searcher.decode(features, search, vocab);
                auto n = result.hyps.size();
                benchmark::DoNotOptimize(n);
            }
        })
        ->Arg(1)
        ->Arg(4)
        ->Arg(10)
        ->Arg(20)
        ->UseRealTime()
        ->Unit(benchmark::kMillisecond);

    if (flag_model.empty())
        return;

    bool has_gpu = !flag_no_gpu && axiom::system::is_metal_available();
    int dim = dualst::make_must_c_config().encoder.input_dim;

    auto reg = [dim](bool gpu) {
        std::string device = gpu ? "GPU" : "CPU";
        benchmark::RegisterBenchmark(
            ("encoder_" + device).c_str(),
            [gpu, dim](benchmark::State &state) {
                auto &model = load_model(gpu);
                auto n_frames = static_cast<size_t>(state.range(0) * 100);
                auto features = axiom::Tensor::randn(
                    {1, n_frames, static_cast<size_t>(dim)});
                if (gpu)
                    features = features.gpu();

                // Warmup: compile GPU graph outside timed loop
                materialize(model.encode(features));

                for (auto _ : state) {
                    materialize(model.encode(features));
                }
                state.counters["Throughput"] = benchmark::Counter(
                    static_cast<double>(state.range(0)),
                    benchmark::Counter::kIsRate);
            })
            ->Arg(1)
            ->Arg(5)
            ->Arg(10)
            ->UseRealTime()
            ->Unit(benchmark::kMillisecond);

        benchmark::RegisterBenchmark(
            ("decode_" + device).c_str(),
            [gpu, dim](benchmark::State &state) {
                auto &model = load_model(gpu);
                auto n_frames = static_cast<size_t>(state.range(0) * 100);
                auto features = axiom::Tensor::randn(
                    {1, n_frames, static_cast<size_t>(dim)});
                if (gpu)
                    features = features.gpu();
                dualst::SearchConfig search;
                search.beam_size = 4;
                search.maxlenratio = 0.3f;
                search.maxlenratio_asr = 0.3f;
                dualst::DualBeamSearch searcher(model, model);

                for (auto _ : state) {
                    auto result =
                        searcher.decode(features, search, cache.vocab);
                    auto n = result.hyps.size();
                    benchmark::DoNotOptimize(n);
                }
            })
            ->Arg(1)
            ->Arg(5)
            ->UseRealTime()
            ->Unit(benchmark::kMillisecond);
    };

    reg(false);
    if (has_gpu)
        reg(true);
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    if (!flag_model.empty() && flag_dict.empty()) {
        std::cerr
            << "Usage: dualst_bench [options] [benchmark flags]\n\n"
            << "Model flags (optional; synthetic search always runs):\n"
            << "  --model=PATH        E2EDualDecoder weights (.safetensors)\n"
            << "  --dict=PATH         Matching ESPnet dict (required with "
               "--model)\n"
            << "\nOptions:\n"
            << "  --no-gpu            Skip GPU benchmarks\n"
            << "  --markdown          Output as markdown table\n"
            << "\nGoogle Benchmark flags (passed through):\n"
            << "  --benchmark_filter=REGEX\n"
            << "  --benchmark_repetitions=N\n"
            << "  --benchmark_format={console|json|csv}\n"
            << std::endl;
        return 1;
    }

    benchmark::Initialize(&argc, argv);
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
