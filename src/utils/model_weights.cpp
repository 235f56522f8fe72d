#include "utils/model_weights.hpp"
#include "utils/weight_utils.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {
    constexpr float MEAN = 0.0f;
    constexpr float STDDEV = 0.02f;

    std::string layer_prefix(int layer_idx) {
        return "layers." + std::to_string(layer_idx) + ".";
    }

    void assert_linear(const Linear& input, int in_dim, int out_dim, const std::string& name) {
        weight_utils::assert_tensor_shape(input.weight, in_dim, out_dim, name + ".weight");
        weight_utils::assert_vector_shape(input.bias, out_dim, name + ".bias");
    }

    void assert_norm(const NormWeights& input, int size, const std::string& name) {
        weight_utils::assert_vector_shape(input.scale, size, name + ".scale");
        weight_utils::assert_vector_shape(input.shift, size, name + ".shift");
    }

    Eigen::MatrixXf random_2d(std::mt19937& rng, int rows, int cols, float mean = MEAN, float stddev = STDDEV) {
        std::normal_distribution<float> nd(mean, stddev);
        Eigen::MatrixXf res(rows, cols);
        for (int i = 0; i < rows; ++i) for (int j = 0; j < cols; ++j) {
            res(i, j) = nd(rng);
        }
        return res;
    }

    Linear random_linear(std::mt19937& rng, int rows, int cols, float stddev = STDDEV) {
        return Linear{
            .weight = random_2d(rng, rows, cols, MEAN, stddev),
            .bias = Eigen::RowVectorXf::Zero(cols)
        };
    }

    NormWeights identity_norm(int size) {
        return NormWeights{
            .scale = Eigen::RowVectorXf::Ones(size),
            .shift = Eigen::RowVectorXf::Zero(size)
        };
    }

    Linear load_linear(const cnpy::npz_t& archive, const std::string& name) {
        return Linear{
            .weight = weight_utils::load_2d_tensor(archive, name + ".weight"),
            .bias = weight_utils::load_1d_tensor(archive, name + ".bias")
        };
    }

    NormWeights load_norm(const cnpy::npz_t& archive, const std::string& name) {
        return NormWeights{
            .scale = weight_utils::load_1d_tensor(archive, name + ".scale"),
            .shift = weight_utils::load_1d_tensor(archive, name + ".shift")
        };
    }

    void save_linear(const fs::path& path, const std::string& name, const Linear& linear) {
        weight_utils::save_2d_tensor(path, name + ".weight", linear.weight);
        weight_utils::save_1d_tensor(path, name + ".bias", linear.bias);
    }

    void save_norm(const fs::path& path, const std::string& name, const NormWeights& norm) {
        weight_utils::save_1d_tensor(path, name + ".scale", norm.scale);
        weight_utils::save_1d_tensor(path, name + ".shift", norm.shift);
    }
}

ModelWeights::ModelWeights(const ModelConfig& config) : _config(config) {
    _config.validate();
    _layers.resize(config.num_hidden_layers);
}

void ModelWeights::verify_sizes() const {
    const int H = config().hidden_size;
    const int F = config().ff_hidden_size;

    weight_utils::assert_tensor_shape(_tok_emb, config().vocab_size, H, "tok_emb");
    weight_utils::assert_tensor_shape(_pos_emb, config().max_seq_len, H, "pos_emb");

    for (int layer_idx = 0; layer_idx < config().num_hidden_layers; ++layer_idx) {
        const auto& layer = _layers[layer_idx];
        const std::string prefix = layer_prefix(layer_idx);

        assert_norm(layer.norm1, H, prefix + "norm1");
        assert_linear(layer.attn.qkv, H, H * 3, prefix + "attn.qkv");
        assert_linear(layer.attn.proj, H, H, prefix + "attn.proj");
        assert_norm(layer.norm2, H, prefix + "norm2");
        assert_linear(layer.ff.up, H, F, prefix + "ff.up");
        assert_linear(layer.ff.down, F, H, prefix + "ff.down");
    }

    assert_norm(_final_norm, H, "final_norm");
    assert_linear(_head, H, config().vocab_size, "head");
}

void ModelWeights::init_random(std::mt19937& rng) {
    const int H = config().hidden_size;
    const int F = config().ff_hidden_size;

    _tok_emb = random_2d(rng, config().vocab_size, H);
    _pos_emb = random_2d(rng, config().max_seq_len, H);

    // Shrink whatever writes into the residual stream so the variance doesn't
    // pile up with depth: 1/sqrt(2 * layers), two residual adds per layer.
    const float cancel = 1.0f / std::sqrt(2.0f * config().num_hidden_layers);

    for (auto& layer : _layers) {
        layer.norm1 = identity_norm(H);
        layer.attn.qkv = random_linear(rng, H, H * 3);
        layer.attn.proj = random_linear(rng, H, H, STDDEV * cancel);
        layer.norm2 = identity_norm(H);
        layer.ff.up = random_linear(rng, H, F);
        layer.ff.down = random_linear(rng, F, H, STDDEV * cancel);
    }

    _final_norm = identity_norm(H);
    _head = random_linear(rng, H, config().vocab_size);
}

void ModelWeights::load_weights(const fs::path& path) {
    cnpy::npz_t archive;
    try {
        archive = cnpy::npz_load(path.string());
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to read weights archive " + path.string() + ": " + e.what());
    }

    try {
        _tok_emb = weight_utils::load_2d_tensor(archive, "tok_emb");
        _pos_emb = weight_utils::load_2d_tensor(archive, "pos_emb");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load embeddings: " + std::string(e.what()));
    }

    for (int layer_idx = 0; layer_idx < config().num_hidden_layers; ++layer_idx) {
        try {
            const std::string prefix = layer_prefix(layer_idx);
            auto& layer = _layers[layer_idx];

            layer.norm1 = load_norm(archive, prefix + "norm1");
            layer.attn.qkv = load_linear(archive, prefix + "attn.qkv");
            layer.attn.proj = load_linear(archive, prefix + "attn.proj");
            layer.norm2 = load_norm(archive, prefix + "norm2");
            layer.ff.up = load_linear(archive, prefix + "ff.up");
            layer.ff.down = load_linear(archive, prefix + "ff.down");
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to load decoder layer " + std::to_string(layer_idx) + ": " + std::string(e.what()));
        }
    }

    try {
        _final_norm = load_norm(archive, "final_norm");
        _head = load_linear(archive, "head");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load output head: " + std::string(e.what()));
    }

    verify_sizes();
}

void ModelWeights::save_weights(const fs::path& path) const {
    // First write truncates, everything after appends to the same archive.
    weight_utils::save_2d_tensor(path, "tok_emb", _tok_emb, "w");
    weight_utils::save_2d_tensor(path, "pos_emb", _pos_emb);

    for (int layer_idx = 0; layer_idx < config().num_hidden_layers; ++layer_idx) {
        const std::string prefix = layer_prefix(layer_idx);
        const auto& layer = _layers[layer_idx];

        save_norm(path, prefix + "norm1", layer.norm1);
        save_linear(path, prefix + "attn.qkv", layer.attn.qkv);
        save_linear(path, prefix + "attn.proj", layer.attn.proj);
        save_norm(path, prefix + "norm2", layer.norm2);
        save_linear(path, prefix + "ff.up", layer.ff.up);
        save_linear(path, prefix + "ff.down", layer.ff.down);
    }

    save_norm(path, "final_norm", _final_norm);
    save_linear(path, "head", _head);
}

ModelWeights load_or_init(const ModelConfig& config, const fs::path& path, std::mt19937& rng) {
    ModelWeights weights(config);

    if (path.empty() || !fs::exists(path)) {
        std::cerr << "Warning: weights file '" << path.string()
                  << "' not found, falling back to randomly initialized (untrained) weights\n";
        weights.init_random(rng);
        return weights;
    }

    std::cout << "Loading weights from: " << path.string() << std::endl;
    weights.load_weights(path);
    return weights;
}
