#include <doctest/doctest.h>

#include "attention.hpp"
#include "ops.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>

using test_helpers::max_abs_diff;
using test_helpers::random_matrix;

namespace {
    NormWeights unit_norm(int size) {
        return NormWeights{
            .scale = Eigen::RowVectorXf::Ones(size),
            .shift = Eigen::RowVectorXf::Zero(size)
        };
    }
}

TEST_CASE("normalize adds eps to the standard deviation, not the variance")
{
    Eigen::MatrixXf x(1, 4);
    x << 1, 2, 3, 4;

    // mean 2.5, sample std sqrt(5/3)
    Eigen::MatrixXf out = normalize(x, unit_norm(4), 1.0f);
    const float expected_std = std::sqrt(5.0f / 3.0f);

    CHECK(out(0, 0) == doctest::Approx(-1.5f / (expected_std + 1.0f)));
    CHECK(out(0, 3) == doctest::Approx(1.5f / (expected_std + 1.0f)));
    // what you'd get with eps under the sqrt
    CHECK(out(0, 0) != doctest::Approx(-1.5f / std::sqrt(5.0f / 3.0f + 1.0f)));
}

TEST_CASE("normalize applies scale and shift per feature")
{
    Eigen::MatrixXf x(2, 3);
    x << 1, 2, 3,
         -4, 0, 4;

    NormWeights norm{
        .scale = Eigen::RowVectorXf::Constant(3, 2.0f),
        .shift = (Eigen::RowVectorXf(3) << 0.5f, -0.5f, 1.0f).finished()
    };
    Eigen::MatrixXf out = normalize(x, norm, 1e-6f);

    // row 0: mean 2, std 1 -> [-1, 0, 1]; row 1: mean 0, std 4 -> [-1, 0, 1]
    for (int row = 0; row < 2; ++row) {
        CHECK(out(row, 0) == doctest::Approx(-2.0f + 0.5f).epsilon(1e-4));
        CHECK(out(row, 1) == doctest::Approx(-0.5f).epsilon(1e-4));
        CHECK(out(row, 2) == doctest::Approx(2.0f + 1.0f).epsilon(1e-4));
    }
}

TEST_CASE("normalize of a constant row collapses to the shift")
{
    Eigen::MatrixXf x = Eigen::MatrixXf::Constant(1, 5, 3.0f);
    NormWeights norm = unit_norm(5);
    norm.shift.setConstant(0.25f);

    Eigen::MatrixXf out = normalize(x, norm, 1e-6f);
    CHECK(out.isApproxToConstant(0.25f));
}

TEST_CASE("feed_forward treats every position on its own")
{
    std::mt19937 rng(7);
    FeedForwardWeights ff{
        .up = Linear{random_matrix(rng, 8, 16, 0.3f), random_matrix(rng, 1, 16, 0.1f)},
        .down = Linear{random_matrix(rng, 16, 8, 0.3f), random_matrix(rng, 1, 8, 0.1f)}
    };
    Eigen::MatrixXf x = random_matrix(rng, 5, 8);

    Eigen::MatrixXf all = feed_forward(x, ff);
    REQUIRE(all.rows() == 5);
    REQUIRE(all.cols() == 8);

    for (int row = 0; row < 5; ++row) {
        Eigen::MatrixXf single = feed_forward(x.row(row), ff);
        CHECK(max_abs_diff(single, all.row(row)) < 1e-5f);
    }
}

TEST_CASE("feed_forward with zero weights returns the output bias")
{
    FeedForwardWeights ff{
        .up = Linear{Eigen::MatrixXf::Zero(4, 6), Eigen::RowVectorXf::Zero(6)},
        .down = Linear{Eigen::MatrixXf::Zero(6, 4), Eigen::RowVectorXf::LinSpaced(4, 1.0f, 4.0f)}
    };
    Eigen::MatrixXf out = feed_forward(Eigen::MatrixXf::Ones(3, 4), ff);
    for (int row = 0; row < 3; ++row) {
        CHECK(max_abs_diff(out.row(row), Eigen::RowVectorXf::LinSpaced(4, 1.0f, 4.0f)) == 0.0f);
    }
}

TEST_CASE("gelu matches its limits")
{
    Eigen::MatrixXf x(1, 3);
    x << 0.0f, 10.0f, -10.0f;
    Eigen::MatrixXf y = gelu(x);
    CHECK(y(0, 0) == doctest::Approx(0.0f));
    CHECK(y(0, 1) == doctest::Approx(10.0f));
    CHECK(y(0, 2) == doctest::Approx(0.0f).epsilon(1e-6));
}

TEST_CASE("softmax zeroes masked entries")
{
    Eigen::RowVectorXf x(3);
    x << 1.0f, -std::numeric_limits<float>::infinity(), 1.0f;
    Eigen::RowVectorXf p = softmax(x);
    CHECK(p(0) == doctest::Approx(0.5f));
    CHECK(p(1) == 0.0f);
    CHECK(p(2) == doctest::Approx(0.5f));
}

TEST_CASE("causal_mask keeps the bottom rows of the lower triangle")
{
    auto keep = causal_mask(2, 2);
    REQUIRE(keep.rows() == 2);
    REQUIRE(keep.cols() == 4);

    // row 0 sits at absolute position 2
    CHECK(keep(0, 0));
    CHECK(keep(0, 2));
    CHECK_FALSE(keep(0, 3));
    // row 1 sits at position 3 and sees everything
    CHECK(keep.row(1).all());

    auto square = causal_mask(0, 3);
    CHECK(square(0, 0));
    CHECK_FALSE(square(0, 1));
    CHECK(square(2, 1));
}
