#pragma once
#include <filesystem>
#include <string>

// Every field here decides an array dimension somewhere, so a ModelConfig is
// fixed for the lifetime of whatever model was built from it. Weights loaded
// under one config won't fit another.
struct ModelConfig {
    int hidden_size = 512;
    int ff_hidden_size = 2048;
    int num_hidden_layers = 2;
    int vocab_size = 10000;
    int max_seq_len = 1024;

    // Only meaningful for training; inference treats dropout as identity.
    float dropout_rate = 0.1f;

    // Added to the standard deviation (not the variance) in normalize().
    float norm_eps = 1e-6f;

    // Throws std::invalid_argument on nonsense dims.
    void validate() const;

    std::string summary() const;
};

// Reads an hparams-style json object. Keys we don't know about are ignored,
// keys that are missing keep their defaults.
ModelConfig load_config(const std::filesystem::path& path);
