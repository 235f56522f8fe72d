#pragma once
#include <Eigen/Dense>

#include <vector>

// A batch of per-sequence activations. Each entry is [T, H]: one row per
// position, one matrix per batch row. Together that's the (B, T, H) array.
using Activations = std::vector<Eigen::MatrixXf>;

// Keys and values for every position one layer has seen so far.
// key[b] / value[b] are [total_length, H]. No batch rows means nothing
// has been processed yet.
struct KVEntry {
    Activations key;
    Activations value;

    bool empty() const { return key.empty(); }
    int batch() const { return static_cast<int>(key.size()); }
    int length() const { return empty() ? 0 : static_cast<int>(key.front().rows()); }
    int width() const { return empty() ? 0 : static_cast<int>(key.front().cols()); }

    // Throws std::invalid_argument if key/value rows disagree with each other.
    void check_consistent() const;
};

// One KVEntry per layer, owned by a single generation session.
// Either empty or full (one entry per layer); all entries share length,
// batch and width. The model swaps the whole thing in one go at the end
// of a step, so between steps it's never half updated.
class KVCache {
public:
    KVCache() = default;

    bool empty() const { return _layers.empty(); }
    int num_layers() const { return static_cast<int>(_layers.size()); }

    // Positions processed so far (0 when empty).
    int length() const;
    int batch() const;

    const KVEntry& layer(int idx) const { return _layers.at(idx); }
    const std::vector<KVEntry>& layers() const { return _layers; }

    // Throws std::invalid_argument unless the cache is empty or has exactly
    // `expected_layers` entries agreeing on length, batch and width.
    void check_consistent(int expected_layers) const;

    // Replace every entry at once.
    void commit(std::vector<KVEntry> layers);

    // For starting a new, independent sequence.
    void reset() { _layers.clear(); }

private:
    std::vector<KVEntry> _layers;
};
