#include "decoder.hpp"
#include "ops.hpp"

#include <queue>
#include <stdexcept>
#include <string>
#include <utility>

int greedy(const Eigen::RowVectorXf& logits) {
    if (logits.size() == 0) {
        throw std::invalid_argument("greedy: empty logits");
    }
    int argmax = 0;
    for (int token = 1; token < logits.size(); ++token) {
        if (logits[token] > logits[argmax]) argmax = token;
    }
    return argmax;
}

TokenSelector top_k_sampler(int k, std::mt19937& rng) {
    if (k <= 0) {
        throw std::invalid_argument("top_k_sampler: k must be positive, got " + std::to_string(k));
    }

    return [k, &rng](const Eigen::RowVectorXf& logits) {
        Eigen::RowVectorXf probs = softmax(logits);

        // min-heap of (prob, token), capped at k
        std::priority_queue<std::pair<float, int>> lowest;
        for (int i = 0; i < probs.size(); ++i) {
            lowest.emplace(-probs[i], i);
            while (static_cast<int>(lowest.size()) > k) lowest.pop();
        }

        float cumsum = 0;
        std::vector<std::pair<float, int>> highest(lowest.size());
        for (int i = static_cast<int>(highest.size()) - 1; i >= 0; --i) {
            highest[i] = lowest.top(); lowest.pop();
            highest[i].first = -highest[i].first;
            cumsum += highest[i].first;
        }

        std::uniform_real_distribution<float> dist(0.0f, cumsum);
        float rand_value = dist(rng);

        int last = highest.front().second;
        for (auto [prob, token] : highest) {
            last = token;
            if ((rand_value -= prob) < 0) break;
        }
        return last;
    };
}

Decoder::Decoder(const SequenceModel& model, TokenSelector select)
    : _model(model), _select(std::move(select)) {}

void Decoder::check_budget(const std::vector<int>& prompt, int max_new_tokens) const {
    if (prompt.empty()) {
        throw std::invalid_argument("Cannot generate from an empty prompt");
    }
    if (max_new_tokens < 0) {
        throw std::invalid_argument("max_new_tokens must be non-negative, got " + std::to_string(max_new_tokens));
    }
    // We don't slide the window, so the whole result has to fit.
    if (prompt.size() + static_cast<size_t>(max_new_tokens) > static_cast<size_t>(model().config().max_seq_len)) {
        throw std::out_of_range("Prompt of " + std::to_string(prompt.size()) + " tokens plus " +
            std::to_string(max_new_tokens) + " new ones exceeds max_seq_len=" + std::to_string(model().config().max_seq_len));
    }
}

int Decoder::pick(const Eigen::RowVectorXf& logits) const {
    int token = _select(logits);
    if (_on_token) _on_token(token);
    return token;
}

std::vector<int> FullRecomputeDecoder::generate(std::vector<int> prompt, int max_new_tokens) {
    check_budget(prompt, max_new_tokens);

    std::vector<int> tokens = std::move(prompt);
    for (int step = 0; step < max_new_tokens; ++step) {
        tokens.push_back(pick(model().next_token_logits(tokens, Stateless{})));
    }
    return tokens;
}

std::vector<int> CachedDecoder::generate(std::vector<int> prompt, int max_new_tokens) {
    check_budget(prompt, max_new_tokens);
    _cache.reset();

    std::vector<int> tokens = std::move(prompt);
    if (max_new_tokens == 0) return tokens;

    const ForwardMode mode = UsingCache{_cache};

    // Hydrate the cache with the whole prompt in one go, then it's one token per step.
    Eigen::RowVectorXf logits = model().next_token_logits(tokens, mode);

    for (int step = 0; step < max_new_tokens; ++step) {
        tokens.push_back(pick(logits));

        // The last token never needs to go through; nobody reads its logits.
        if (step + 1 < max_new_tokens) {
            logits = model().next_token_logits({tokens.back()}, mode);
        }
    }
    return tokens;
}
