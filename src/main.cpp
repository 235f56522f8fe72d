#include "decoder.hpp"
#include "sequence_model.hpp"
#include "utils/config.hpp"
#include "utils/model_weights.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
    struct CliOptions {
        std::optional<std::string> config_path;
        std::string weights_path;
        std::optional<std::string> save_weights_path;
        std::vector<int> prompt = {0};
        int steps = 32;
        std::string mode = "both";
        unsigned seed = 1337;
    };

    void print_usage(const char* argv0) {
        std::cerr << "Usage: " << argv0 << " [--config hparams.json] [--weights model.npz]\n"
                  << "          [--prompt 1,2,3] [--steps N] [--mode full|cached|both]\n"
                  << "          [--seed S] [--save-weights out.npz]\n";
    }

    std::vector<int> parse_ids(const std::string& raw) {
        std::vector<int> ids;
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (item.empty()) continue;
            ids.push_back(std::stoi(item));
        }
        if (ids.empty()) throw std::invalid_argument("--prompt needs at least one token id");
        return ids;
    }

    CliOptions parse_cli(int argc, char** argv) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--config") options.config_path = value();
            else if (arg == "--weights") options.weights_path = value();
            else if (arg == "--save-weights") options.save_weights_path = value();
            else if (arg == "--prompt") options.prompt = parse_ids(value());
            else if (arg == "--steps") options.steps = std::stoi(value());
            else if (arg == "--mode") options.mode = value();
            else if (arg == "--seed") options.seed = static_cast<unsigned>(std::stoul(value()));
            else throw std::invalid_argument("Unknown argument " + arg);
        }

        if (options.mode != "full" && options.mode != "cached" && options.mode != "both") {
            throw std::invalid_argument("--mode must be full, cached or both");
        }
        return options;
    }

    void print_tokens(const std::vector<int>& tokens) {
        std::cout << "[";
        for (size_t i = 0; i < tokens.size(); ++i) {
            std::cout << tokens[i];
            if (i < tokens.size() - 1) {
                std::cout << ", ";
            }
        }
        std::cout << "]\n";
    }

    std::vector<int> timed_generate(Decoder& decoder, const std::string& name, const std::vector<int>& prompt, int steps) {
        auto start_time = std::chrono::high_resolution_clock::now();
        std::vector<int> tokens = decoder.generate(prompt, steps);
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        std::cout << name << " inference done in " << duration.count() << "ms\n";
        std::cout << "Resulting token array:\n ";
        print_tokens(tokens);
        return tokens;
    }
}

int main(int argc, char** argv) {
    CliOptions options;
    try {
        options = parse_cli(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        ModelConfig config = options.config_path ? load_config(*options.config_path) : ModelConfig{};
        config.validate();
        std::cout << "Initializing model with config:\n" << config.summary() << "\n";

        std::mt19937 rng(options.seed);

        auto start_time = std::chrono::high_resolution_clock::now();
        ModelWeights weights = load_or_init(config, options.weights_path, rng);
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        std::cout << "Weights ready in " << duration.count() << "ms\n\n";

        if (options.save_weights_path) {
            weights.save_weights(*options.save_weights_path);
            std::cout << "Saved weights to: " << *options.save_weights_path << "\n";
        }

        SequenceModel model(std::move(weights));

        std::optional<std::vector<int>> full_tokens, cached_tokens;

        if (options.mode != "cached") {
            FullRecomputeDecoder decoder(model);
            full_tokens = timed_generate(decoder, "Full recompute", options.prompt, options.steps);
        }
        if (options.mode != "full") {
            CachedDecoder decoder(model);
            cached_tokens = timed_generate(decoder, "KV cached", options.prompt, options.steps);
        }

        if (full_tokens && cached_tokens) {
            if (*full_tokens != *cached_tokens) {
                std::cerr << "Error: full recompute and cached decoding disagree\n";
                return 1;
            }
            std::cout << "Both strategies produced the same tokens.\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
