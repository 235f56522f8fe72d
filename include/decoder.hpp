#pragma once
#include <Eigen/Dense>
#include "kv_cache.hpp"
#include "sequence_model.hpp"

#include <functional>
#include <random>
#include <utility>
#include <vector>

// Picks the next token from last-position logits.
using TokenSelector = std::function<int(const Eigen::RowVectorXf& logits)>;

// Arg max; on ties the lowest id wins so both strategies can't drift apart.
int greedy(const Eigen::RowVectorXf& logits);

// Samples among the k highest-probability tokens. Holds on to `rng`, so the
// generator has to outlive the selector.
TokenSelector top_k_sampler(int k, std::mt19937& rng);

// Autoregressive generation on top of a SequenceModel. Subclasses only differ
// in how much of the sequence they push through the model each step; given
// the same prompt and a deterministic selector they produce the same tokens.
class Decoder {
public:
    explicit Decoder(const SequenceModel& model, TokenSelector select = greedy);

    virtual ~Decoder() = default;

    // Appends exactly `max_new_tokens` tokens (no early stop) and returns the
    // whole sequence, prompt included. Any failure inside the loop propagates;
    // there's no partially generated result.
    //
    // Throws std::invalid_argument on an empty prompt or negative step count,
    // std::out_of_range if prompt + new tokens won't fit in max_seq_len.
    virtual std::vector<int> generate(std::vector<int> prompt, int max_new_tokens) = 0;

    // Called with every token as soon as it's chosen.
    void on_token(std::function<void(int)> callback) { _on_token = std::move(callback); }

    const SequenceModel& model() const { return _model; }

protected:
    void check_budget(const std::vector<int>& prompt, int max_new_tokens) const;

    // Select a token and let the callback know about it.
    int pick(const Eigen::RowVectorXf& logits) const;

private:
    const SequenceModel& _model;
    TokenSelector _select;
    std::function<void(int)> _on_token;
};

// Re-runs the whole sequence every step. O(n^2) per step, O(n^3) overall.
class FullRecomputeDecoder : public Decoder {
public:
    using Decoder::Decoder;

    std::vector<int> generate(std::vector<int> prompt, int max_new_tokens) override;
};

// Prefills the prompt once, then feeds one new token per step against the
// cache. O(n) per step, O(n^2) overall.
class CachedDecoder : public Decoder {
public:
    using Decoder::Decoder;

    // Resets the cache first: each call is an independent sequence.
    std::vector<int> generate(std::vector<int> prompt, int max_new_tokens) override;

    const KVCache& cache() const { return _cache; }

private:
    KVCache _cache;
};
