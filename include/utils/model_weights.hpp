#pragma once
#include "utils/config.hpp"
#include "utils/layer_weights.hpp"

#include <filesystem>
#include <random>
#include <vector>

class ModelWeights {
public:
    explicit ModelWeights(const ModelConfig& config);

    // Load everything from a single .npz archive. Throws std::runtime_error
    // naming the offending tensor on anything missing or misshapen.
    void load_weights(const std::filesystem::path& path);

    void save_weights(const std::filesystem::path& path) const;

    // Deterministic for a given rng state; nothing here touches a global generator.
    void init_random(std::mt19937& rng);

    // Throws if any tensor disagrees with config().
    void verify_sizes() const;

    // Getters for different components
    const Eigen::MatrixXf& tok_emb() const { return _tok_emb; }
    const Eigen::MatrixXf& pos_emb() const { return _pos_emb; }
    const std::vector<DecoderLayerWeights>& layers() const { return _layers; }
    const NormWeights& final_norm() const { return _final_norm; }
    const Linear& head() const { return _head; }

    const ModelConfig& config() const { return _config; }

private:
    const ModelConfig _config;

    // Token and position embeddings
    Eigen::MatrixXf _tok_emb;    // [vocab_size, H]
    Eigen::MatrixXf _pos_emb;    // [max_seq_len, H]

    std::vector<DecoderLayerWeights> _layers;

    NormWeights _final_norm;

    // [H, vocab_size], untied from the token embedding
    Linear _head;
};

// Loads from `path` if it exists. A missing file is not fatal: we warn on
// stderr and hand back freshly initialized weights instead, so running an
// untrained model is at least visible. A file that exists but is broken still throws.
ModelWeights load_or_init(const ModelConfig& config, const std::filesystem::path& path, std::mt19937& rng);
