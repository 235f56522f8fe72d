#include "sequence_model.hpp"
#include "decoder_layer.hpp"
#include "ops.hpp"
#include "utils/overloaded.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {
    const KVCache NO_CACHE{};
}

SequenceModel::SequenceModel(ModelWeights weights) : _weights(std::move(weights)) {
    _weights.verify_sizes();
}

void SequenceModel::validate(const TokenBatch& tokens, const KVCache& past) const {
    if (tokens.empty()) {
        throw std::invalid_argument("Empty batch passed to the model");
    }

    const size_t T = tokens.front().size();
    if (T == 0) {
        throw std::invalid_argument("Sequences must hold at least one token");
    }

    for (size_t b = 0; b < tokens.size(); ++b) {
        if (tokens[b].size() != T) {
            throw std::invalid_argument("Ragged batch: row " + std::to_string(b) + " has " +
                std::to_string(tokens[b].size()) + " tokens, row 0 has " + std::to_string(T));
        }
        for (int id : tokens[b]) {
            if (id < 0 || id >= config().vocab_size) {
                throw std::out_of_range("Token id " + std::to_string(id) + " outside vocab of size " +
                    std::to_string(config().vocab_size));
            }
        }
    }

    past.check_consistent(config().num_hidden_layers);

    if (!past.empty()) {
        if (past.batch() != static_cast<int>(tokens.size())) {
            throw std::invalid_argument("KV cache was built for a batch of " + std::to_string(past.batch()) +
                ", got " + std::to_string(tokens.size()));
        }
        if (past.layer(0).width() != config().hidden_size) {
            throw std::invalid_argument("KV cache hidden size " + std::to_string(past.layer(0).width()) +
                " does not match configured " + std::to_string(config().hidden_size));
        }
    }

    // No position embedding exists past max_seq_len, so this is a hard error
    // rather than something to clamp or wrap.
    if (past.length() + static_cast<long>(T) > config().max_seq_len) {
        throw std::out_of_range("Sequence too long: " + std::to_string(past.length()) + " cached + " +
            std::to_string(T) + " new tokens exceeds max_seq_len=" + std::to_string(config().max_seq_len));
    }
}

Activations SequenceModel::run(const TokenBatch& tokens, const KVCache& past, std::vector<KVEntry>& present) const {
    validate(tokens, past);

    const int P = past.length();
    const int T = static_cast<int>(tokens.front().size());
    const float eps = config().norm_eps;

    Activations x;
    x.reserve(tokens.size());
    for (const auto& seq : tokens) {
        Eigen::MatrixXf xb(T, config().hidden_size);
        for (int t = 0; t < T; ++t) {
            // Position ids continue where the cache left off.
            xb.row(t) = weights().tok_emb().row(seq[t]) + weights().pos_emb().row(P + t);
        }
        x.push_back(std::move(xb));
    }

    present.clear();
    present.reserve(weights().layers().size());

    for (size_t l = 0; l < weights().layers().size(); ++l) {
        AttentionMode mode = past.empty()
            ? AttentionMode{Stateless{}}
            : AttentionMode{WithPast{past.layer(static_cast<int>(l))}};

        LayerOutput layer_out = decoder_layer(x, weights().layers()[l], mode, eps);
        x = std::move(layer_out.out);
        present.push_back(std::move(layer_out.present));
    }

    for (auto& xb : x) xb = normalize(xb, weights().final_norm(), eps);
    return x;
}

Activations SequenceModel::advance(const TokenBatch& tokens, const ForwardMode& mode, std::vector<KVEntry>& present) const {
    return std::visit(overloaded{
        [&](const Stateless&) {
            return run(tokens, NO_CACHE, present);
        },
        [&](const UsingCache& using_cache) {
            std::vector<KVEntry> updated;
            Activations hidden = run(tokens, using_cache.cache, updated);
            // Only now, with every layer done, does the cache move forward.
            using_cache.cache.commit(std::move(updated));
            return hidden;
        },
    }, mode);
}

ModelOutput SequenceModel::forward(const TokenBatch& tokens, const ForwardMode& mode) const {
    ModelOutput output;
    Activations hidden = advance(tokens, mode, output.present);

    output.logits.reserve(hidden.size());
    for (const auto& hb : hidden) {
        output.logits.push_back(forward_linear(hb, weights().head()));
    }
    return output;
}

Eigen::RowVectorXf SequenceModel::next_token_logits(const std::vector<int>& tokens, const ForwardMode& mode) const {
    std::vector<KVEntry> present;
    Activations hidden = advance(TokenBatch{tokens}, mode, present);

    // Each position predicts the one after it, so only the last row matters here.
    const Eigen::MatrixXf& h = hidden.front();
    return forward_linear(h.bottomRows(1), weights().head()).row(0);
}
