#include "attention.hpp"
#include "ops.hpp"
#include "utils/overloaded.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
    // Nothing seen yet. Stateless mode is just incremental mode from here.
    const KVEntry NO_PAST{};

    void check_width(const Eigen::MatrixXf& m, int hidden_size, const std::string& what) {
        if (m.cols() != hidden_size) {
            throw std::invalid_argument(what + " has hidden size " + std::to_string(m.cols()) +
                ", attention is configured for " + std::to_string(hidden_size));
        }
    }

    Eigen::MatrixXf concat_rows(const Eigen::MatrixXf& top, const Eigen::MatrixXf& bottom) {
        Eigen::MatrixXf out(top.rows() + bottom.rows(), bottom.cols());
        out << top, bottom;
        return out;
    }
}

Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic> causal_mask(int past_len, int new_len) {
    const int total = past_len + new_len;
    Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic> keep(new_len, total);
    // recall that keep(i, j) is "may row i attend to position j", and row i sits at P + i
    for (int i = 0; i < new_len; ++i) {
        for (int j = 0; j < total; ++j) {
            keep(i, j) = j <= past_len + i;
        }
    }
    return keep;
}

LayerOutput causal_self_attention(const Activations& x, const AttentionWeights& attn, const AttentionMode& mode) {
    const KVEntry& past = std::visit(overloaded{
        [](const Stateless&) -> const KVEntry& { return NO_PAST; },
        [](const WithPast& with_past) -> const KVEntry& { return with_past.past; },
    }, mode);

    const int H = static_cast<int>(attn.qkv.weight.rows());

    if (!past.empty()) {
        past.check_consistent();
        if (past.batch() != static_cast<int>(x.size())) {
            throw std::invalid_argument("Cached keys/values cover a batch of " + std::to_string(past.batch()) +
                ", input batch is " + std::to_string(x.size()));
        }
        check_width(past.key.front(), H, "Cached key");
    }

    LayerOutput result;
    result.out.reserve(x.size());
    result.present.key.reserve(x.size());
    result.present.value.reserve(x.size());

    const float scale = 1.0f / std::sqrt(static_cast<float>(H));

    for (size_t b = 0; b < x.size(); ++b) {
        check_width(x[b], H, "Attention input");

        const int S = static_cast<int>(x[b].rows());
        const int P = past.length();

        // 1. One projection [S, H] -> [S, 3H], then slice query | key | value.
        Eigen::MatrixXf qkv = forward_linear(x[b], attn.qkv);
        Eigen::MatrixXf q = qkv.leftCols(H);

        // 2. New keys/values go after the P we already have.
        Eigen::MatrixXf k = past.empty() ? Eigen::MatrixXf(qkv.middleCols(H, H)) : concat_rows(past.key[b], qkv.middleCols(H, H));
        Eigen::MatrixXf v = past.empty() ? Eigen::MatrixXf(qkv.rightCols(H)) : concat_rows(past.value[b], qkv.rightCols(H));

        // 3. Scores [S, P + S], scaled by sqrt(H) since there's only the one head.
        Eigen::MatrixXf att = (q * k.transpose()) * scale;

        // 4. Bottom S rows of the (P + S)^2 lower triangle.
        const auto keep = causal_mask(P, S);
        for (int i = 0; i < S; ++i) {
            for (int j = 0; j < P + S; ++j) {
                if (!keep(i, j)) att(i, j) = -std::numeric_limits<float>::infinity();
            }
            att.row(i) = softmax(att.row(i));
        }

        // 5. Weighted sum of values, then mix back through the output projection.
        result.out.push_back(forward_linear(att * v, attn.proj));
        result.present.key.push_back(std::move(k));
        result.present.value.push_back(std::move(v));
    }

    return result;
}
