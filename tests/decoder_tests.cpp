#include <doctest/doctest.h>

#include "decoder.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

using test_helpers::make_model;
using test_helpers::small_config;

TEST_CASE("greedy picks the arg max, lowest id on ties")
{
    Eigen::RowVectorXf logits(5);
    logits << 0.1f, 2.0f, -1.0f, 2.0f, 0.5f;
    CHECK(greedy(logits) == 1);

    logits << -3.0f, -2.0f, -5.0f, -4.0f, -2.5f;
    CHECK(greedy(logits) == 1);

    CHECK_THROWS_AS(greedy(Eigen::RowVectorXf()), std::invalid_argument);
}

TEST_CASE("top-k sampling stays inside the top k and follows its rng")
{
    Eigen::RowVectorXf logits(6);
    logits << 5.0f, 4.0f, -10.0f, 4.5f, -10.0f, -10.0f;

    std::mt19937 rng_a(9), rng_b(9);
    TokenSelector a = top_k_sampler(3, rng_a);
    TokenSelector b = top_k_sampler(3, rng_b);

    for (int i = 0; i < 50; ++i) {
        int token = a(logits);
        CHECK((token == 0 || token == 1 || token == 3));
        CHECK(token == b(logits));
    }

    std::mt19937 rng_c(1);
    CHECK(top_k_sampler(1, rng_c)(logits) == greedy(logits));
    CHECK_THROWS_AS(top_k_sampler(0, rng_c), std::invalid_argument);
}

TEST_CASE("both strategies generate the same tokens")
{
    const SequenceModel model = make_model(small_config());
    FullRecomputeDecoder full(model);
    CachedDecoder cached(model);

    const std::vector<int> prompt = {4, 8, 15, 16};
    std::vector<int> a = full.generate(prompt, 20);
    std::vector<int> b = cached.generate(prompt, 20);

    REQUIRE(a.size() == prompt.size() + 20);
    CHECK(std::equal(prompt.begin(), prompt.end(), a.begin()));
    CHECK(a == b);
    CHECK(cached.cache().length() == static_cast<int>(a.size()) - 1);
}

TEST_CASE("cached decoder starts every generate from an empty cache")
{
    const SequenceModel model = make_model(small_config());
    CachedDecoder cached(model);
    FullRecomputeDecoder full(model);

    std::vector<int> first = cached.generate({1, 2, 3}, 5);
    std::vector<int> second = cached.generate({7}, 5);

    CHECK(second == full.generate({7}, 5));
    CHECK(cached.cache().length() == 5);
    CHECK(first == cached.generate({1, 2, 3}, 5));
}

TEST_CASE("decoders report every new token")
{
    const SequenceModel model = make_model(small_config());
    CachedDecoder cached(model);

    std::vector<int> seen;
    cached.on_token([&](int token) { seen.push_back(token); });
    std::vector<int> tokens = cached.generate({2}, 6);

    REQUIRE(seen.size() == 6);
    CHECK(std::equal(seen.begin(), seen.end(), tokens.begin() + 1));
}

TEST_CASE("generation checks its budget up front")
{
    const SequenceModel model = make_model(small_config());
    const int max_len = model.config().max_seq_len;

    FullRecomputeDecoder full(model);
    CachedDecoder cached(model);

    for (Decoder* decoder : {static_cast<Decoder*>(&full), static_cast<Decoder*>(&cached)}) {
        CHECK_THROWS_AS(decoder->generate({}, 3), std::invalid_argument);
        CHECK_THROWS_AS(decoder->generate({1}, -1), std::invalid_argument);
        CHECK_THROWS_AS(decoder->generate({1, 2}, max_len - 1), std::out_of_range);
        CHECK((decoder->generate({1, 2}, 0) == std::vector<int>{1, 2}));
        CHECK(decoder->generate({1}, max_len - 1).size() == static_cast<size_t>(max_len));
    }
}

TEST_CASE("a bad prompt aborts the whole generation")
{
    const SequenceModel model = make_model(small_config());
    CachedDecoder cached(model);
    FullRecomputeDecoder full(model);

    const int bad = model.config().vocab_size + 3;
    CHECK_THROWS_AS(cached.generate({1, bad}, 4), std::out_of_range);
    CHECK(cached.cache().empty());
    CHECK_THROWS_AS(full.generate({bad}, 4), std::out_of_range);
}

TEST_CASE("scenario: greedy decode to 128 tokens from a single start token")
{
    ModelConfig config;
    config.hidden_size = 64;
    config.ff_hidden_size = 256;
    config.num_hidden_layers = 2;
    config.vocab_size = 512;
    config.max_seq_len = 128;

    const SequenceModel model = make_model(config, 77);
    const std::vector<int> bos = {0};
    const int steps = 127;

    FullRecomputeDecoder full(model);
    CachedDecoder cached(model);

    auto t0 = std::chrono::steady_clock::now();
    std::vector<int> a = full.generate(bos, steps);
    auto t1 = std::chrono::steady_clock::now();
    std::vector<int> b = cached.generate(bos, steps);
    auto t2 = std::chrono::steady_clock::now();

    REQUIRE(a.size() == 128);
    CHECK(a == b);

    const auto full_time = t1 - t0;
    const auto cached_time = t2 - t1;
    MESSAGE("full recompute: " << std::chrono::duration_cast<std::chrono::milliseconds>(full_time).count()
            << "ms, cached: " << std::chrono::duration_cast<std::chrono::milliseconds>(cached_time).count() << "ms");
    CHECK(cached_time <= full_time);
}
