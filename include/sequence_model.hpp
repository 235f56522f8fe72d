#pragma once
#include <Eigen/Dense>
#include "attention.hpp"
#include "kv_cache.hpp"
#include "utils/model_weights.hpp"

#include <variant>
#include <vector>

// B sequences of token ids, all the same length.
using TokenBatch = std::vector<std::vector<int>>;

// The tokens passed in are the newest ones; everything before them lives in
// `cache`, which gets extended in place once the whole step has succeeded.
struct UsingCache {
    KVCache& cache;
};

using ForwardMode = std::variant<Stateless, UsingCache>;

struct ModelOutput {
    Activations logits;            // [T, vocab_size] per batch row

    // Stateless only: per layer keys/values for the T positions.
    // In cached mode read the cache instead.
    std::vector<KVEntry> present;
};

class SequenceModel {
public:
    // Verifies every tensor against the config before taking ownership.
    explicit SequenceModel(ModelWeights weights);

    // token + position embeddings -> decoder layers -> final norm -> head.
    // Position ids start at the cache length, so cached mode only needs the new tokens.
    //
    // Throws (before touching the cache):
    //   std::invalid_argument  empty/ragged batch, cache inconsistent with the model or input
    //   std::out_of_range      token id outside the vocab, cache length + T > max_seq_len
    ModelOutput forward(const TokenBatch& tokens, const ForwardMode& mode = Stateless{}) const;

    // Same as forward() on a single sequence, but only projects the last position.
    Eigen::RowVectorXf next_token_logits(const std::vector<int>& tokens, const ForwardMode& mode = Stateless{}) const;

    const ModelWeights& weights() const { return _weights; }
    const ModelConfig& config() const { return _weights.config(); }

private:
    const ModelWeights _weights;

    void validate(const TokenBatch& tokens, const KVCache& past) const;

    // Runs the stack on top of `past`, leaving the final normalized hidden
    // states. `present` receives every layer's extended keys/values.
    Activations run(const TokenBatch& tokens, const KVCache& past, std::vector<KVEntry>& present) const;

    // Dispatches on mode; in cached mode commits the new entries to the cache.
    Activations advance(const TokenBatch& tokens, const ForwardMode& mode, std::vector<KVEntry>& present) const;
};
