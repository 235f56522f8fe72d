#include "kv_cache.hpp"

#include <stdexcept>
#include <string>
#include <utility>

void KVEntry::check_consistent() const {
    if (key.size() != value.size()) {
        throw std::invalid_argument("KV entry has " + std::to_string(key.size()) + " key rows but " +
            std::to_string(value.size()) + " value rows");
    }
    for (size_t b = 0; b < key.size(); ++b) {
        if (key[b].rows() != key.front().rows() || value[b].rows() != key.front().rows() ||
            key[b].cols() != key.front().cols() || value[b].cols() != key.front().cols()) {
            throw std::invalid_argument("KV entry batch row " + std::to_string(b) + " disagrees in shape with row 0");
        }
    }
}

int KVCache::length() const {
    return empty() ? 0 : _layers.front().length();
}

int KVCache::batch() const {
    return empty() ? 0 : _layers.front().batch();
}

void KVCache::check_consistent(int expected_layers) const {
    if (empty()) return;

    if (num_layers() != expected_layers) {
        throw std::invalid_argument("KV cache holds " + std::to_string(num_layers()) +
            " layers, model has " + std::to_string(expected_layers));
    }

    const KVEntry& first = _layers.front();
    for (int l = 0; l < num_layers(); ++l) {
        const KVEntry& entry = _layers[l];
        entry.check_consistent();
        if (entry.length() != first.length() || entry.batch() != first.batch() || entry.width() != first.width()) {
            throw std::invalid_argument("KV cache layer " + std::to_string(l) + " is [" +
                std::to_string(entry.batch()) + ", " + std::to_string(entry.length()) + ", " + std::to_string(entry.width()) +
                "] but layer 0 is [" +
                std::to_string(first.batch()) + ", " + std::to_string(first.length()) + ", " + std::to_string(first.width()) + "]");
        }
    }
}

void KVCache::commit(std::vector<KVEntry> layers) {
    _layers = std::move(layers);
}
