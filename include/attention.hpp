#pragma once
#include <Eigen/Dense>
#include "kv_cache.hpp"
#include "utils/layer_weights.hpp"

#include <variant>

// Plain causal attention over whatever rows x carries.
struct Stateless {};

// x only carries the newest S positions; `past` holds keys/values of the P
// positions before them (possibly none).
struct WithPast {
    const KVEntry& past;
};

using AttentionMode = std::variant<Stateless, WithPast>;

struct LayerOutput {
    Activations out;

    // Keys/values for every position covered after this call: P + S rows.
    // Stateless mode fills this too (P = 0), which is what the cache would
    // have held had the same tokens gone through incrementally.
    KVEntry present;
};

// Single head self attention with a causal mask.
// Throws std::invalid_argument if x (or past) isn't `hidden_size` wide, or
// past's batch doesn't match x.
LayerOutput causal_self_attention(const Activations& x, const AttentionWeights& attn, const AttentionMode& mode);

// Lower triangular (P+S)x(P+S) keep mask, bottom S rows only.
// keep(i, j) is true iff new row i (absolute position P+i) may look at j.
Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic> causal_mask(int past_len, int new_len);
