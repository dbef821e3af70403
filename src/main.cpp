#include "dualst/dualst.hpp"

#include <axiom/io/numpy.hpp>
#include <axiom/system.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog
        << " <model.safetensors> <dict.txt> <input.wav|features.npy> "
           "[options]\n"
        << "\nModel:\n"
        << "  --independent        No ST/ASR cross attention\n"
        << "  --wait-k-asr N       ST waits for N ASR tokens\n"
        << "  --wait-k-st N        ASR waits for N ST tokens\n"
        << "  --cmvn PATH          Kaldi global CMVN stats (.npy, (2, D+1))\n"
        << "  --gpu                Run on Metal GPU\n"
        << "\nSearch:\n"
        << "  --beam N             Beam size (default: 10)\n"
        << "  --nbest N            Hypotheses to print (default: 1)\n"
        << "  --penalty F          Insertion bonus per step\n"
        << "  --maxlenratio F      ST max length / encoder length (0 = T)\n"
        << "  --maxlenratio-asr F\n"
        << "  --minlenratio F      ST min length / encoder length\n"
        << "  --minlenratio-asr F\n"
        << "  --ratio-diverse-st F   Diversity forcing in [0, 1)\n"
        << "  --ratio-diverse-asr F\n"
        << "  --max-retries N      Min-length relaxation retries (default: 5)\n"
        << "  --src-lang LANG      ASR start token <2LANG> (required by "
           "the MuST-C preset)\n"
        << "  --tgt-lang LANG      ST start token <2LANG> (required by "
           "the MuST-C preset)\n"
        << "  --verbose            Per-step search log on stderr\n"
        << std::endl;
}

static bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int main(int argc, char *argv[]) {
    using namespace dualst;
    using Clock = std::chrono::high_resolution_clock;
    auto ms = [](Clock::time_point a, Clock::time_point b) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(b - a)
            .count();
    };

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    try {

        std::string weights_path = argv[1];
        std::string dict_path = argv[2];
        std::string input_path = argv[3];
        bool independent = false;
        bool use_gpu = false;
        int wait_k_asr = 0;
        int wait_k_st = 0;
        std::string cmvn_path;
        SearchConfig search;

        for (int i = 4; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--independent") {
                independent = true;
            } else if (arg == "--gpu") {
                use_gpu = true;
            } else if (arg == "--verbose") {
                search.verbose = true;
            } else if (arg == "--wait-k-asr" && has_value) {
                wait_k_asr = std::stoi(argv[++i]);
            } else if (arg == "--wait-k-st" && has_value) {
                wait_k_st = std::stoi(argv[++i]);
            } else if (arg == "--cmvn" && has_value) {
                cmvn_path = argv[++i];
            } else if (arg == "--beam" && has_value) {
                search.beam_size = std::stoi(argv[++i]);
            } else if (arg == "--nbest" && has_value) {
                search.n_best = std::stoi(argv[++i]);
            } else if (arg == "--penalty" && has_value) {
                search.penalty = std::stof(argv[++i]);
            } else if (arg == "--maxlenratio" && has_value) {
                search.maxlenratio = std::stof(argv[++i]);
            } else if (arg == "--maxlenratio-asr" && has_value) {
                search.maxlenratio_asr = std::stof(argv[++i]);
            } else if (arg == "--minlenratio" && has_value) {
                search.minlenratio = std::stof(argv[++i]);
            } else if (arg == "--minlenratio-asr" && has_value) {
                search.minlenratio_asr = std::stof(argv[++i]);
            } else if (arg == "--ratio-diverse-st" && has_value) {
                search.ratio_diverse_st = std::stof(argv[++i]);
            } else if (arg == "--ratio-diverse-asr" && has_value) {
                search.ratio_diverse_asr = std::stof(argv[++i]);
            } else if (arg == "--max-retries" && has_value) {
                search.max_retries = std::stoi(argv[++i]);
            } else if (arg == "--src-lang" && has_value) {
                search.src_lang = argv[++i];
            } else if (arg == "--tgt-lang" && has_value) {
                search.tgt_lang = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        validate(search);

        // 1. Config: the translator sizes the output layers from the dict
        DualConfig cfg =
            independent ? make_independent_config() : make_must_c_config();
        cfg.cross.wait_k_asr = wait_k_asr;
        cfg.cross.wait_k_st = wait_k_st;
        check_language_tags(cfg, search);

        // 2. Load model
        std::cout << "Loading model from: " << weights_path << std::endl;
        auto t0 = Clock::now();
        Translator translator(weights_path, dict_path, cfg);
        auto t1 = Clock::now();
        std::cout << "Model loaded (" << ms(t0, t1) << " ms), vocab "
                  << translator.vocab().size() << " tokens" << std::endl;

        if (use_gpu) {
            if (!axiom::system::is_metal_available()) {
                std::cerr << "Error: Metal GPU not available" << std::endl;
                return 1;
            }
            translator.to_gpu();
        }
        if (!cmvn_path.empty()) {
            translator.load_cmvn(cmvn_path);
            std::cout << "CMVN loaded: " << cmvn_path << std::endl;
        }

        // 3. Features
        t0 = Clock::now();
        axiom::Tensor features;
        if (ends_with(input_path, ".npy")) {
            features = axiom::io::numpy::load(input_path);
        } else {
            auto wav = read_wav(input_path);
            std::cout << "  Sample rate: " << wav.sample_rate
                      << ", channels: " << wav.num_channels
                      << ", samples: " << wav.num_samples << std::endl;
            features = translator.features(wav);
        }
        t1 = Clock::now();
        std::cout << "  Features: " << features.shape() << " ("
                  << ms(t0, t1) << " ms)" << std::endl;

        // 4. Joint beam search
        t0 = Clock::now();
        auto result = translator.translate(features, search);
        t1 = Clock::now();
        std::cout << "  Decode: " << ms(t0, t1) << " ms";
        if (result.retries > 0) {
            std::cout << " (" << result.retries
                      << " retries, minlenratio=" << result.minlenratio
                      << ", minlenratio_asr=" << result.minlenratio_asr << ")";
        }
        std::cout << std::endl;

        if (result.empty()) {
            std::cout << "\nNo hypothesis reached the end." << std::endl;
            return 0;
        }

        // 5. N-best
        for (size_t n = 0; n < result.nbest.size(); ++n) {
            const auto &entry = result.nbest[n];
            std::cout << "\n--- Hypothesis " << n + 1 << " (score "
                      << std::fixed << std::setprecision(4) << entry.score
                      << ") ---" << std::endl;
            std::cout << "ST:  " << entry.st_text << std::endl;
            std::cout << "ASR: " << entry.asr_text << std::endl;
        }

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
