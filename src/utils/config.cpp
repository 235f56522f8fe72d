#include "utils/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
    void require_positive(int value, const char* name) {
        if (value <= 0) {
            throw std::invalid_argument(std::string("config: ") + name + " must be positive, got " + std::to_string(value));
        }
    }

    template <typename T>
    void read_field(const nlohmann::json& j, const char* key, T& out) {
        if (!j.contains(key)) return;
        try {
            out = j.at(key).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("config: bad value for '") + key + "': " + e.what());
        }
    }
}

void ModelConfig::validate() const {
    require_positive(hidden_size, "hidden_size");
    require_positive(ff_hidden_size, "ff_hidden_size");
    require_positive(num_hidden_layers, "num_hidden_layers");
    require_positive(vocab_size, "vocab_size");
    require_positive(max_seq_len, "max_seq_len");

    if (!(dropout_rate >= 0.0f && dropout_rate < 1.0f)) {
        throw std::invalid_argument("config: dropout_rate must be in [0, 1), got " + std::to_string(dropout_rate));
    }
    if (!(norm_eps > 0.0f)) {
        throw std::invalid_argument("config: norm_eps must be positive, got " + std::to_string(norm_eps));
    }
}

std::string ModelConfig::summary() const {
    std::ostringstream oss;
    oss << "hidden_size: " << hidden_size << "\n"
        << "ff_hidden_size: " << ff_hidden_size << "\n"
        << "num_hidden_layers: " << num_hidden_layers << "\n"
        << "vocab_size: " << vocab_size << "\n"
        << "max_seq_len: " << max_seq_len << "\n"
        << "dropout_rate: " << dropout_rate << " (ignored at inference)\n"
        << "norm_eps: " << norm_eps << "\n";
    return oss.str();
}

ModelConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Could not open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Config " + path.string() + " is not a json object");
    }

    ModelConfig config;
    read_field(j, "hidden_size", config.hidden_size);
    read_field(j, "ff_hidden_size", config.ff_hidden_size);
    read_field(j, "num_hidden_layers", config.num_hidden_layers);
    read_field(j, "vocab_size", config.vocab_size);
    read_field(j, "max_seq_len", config.max_seq_len);
    read_field(j, "dropout_rate", config.dropout_rate);
    read_field(j, "norm_eps", config.norm_eps);

    config.validate();
    return config;
}
