#include "ops.hpp"

#include <cmath>

Eigen::MatrixXf forward_linear(Eigen::MatrixXf x, const Linear& linear) {
    Eigen::MatrixXf y = x * linear.weight;
    y.rowwise() += linear.bias;
    return y;
}

Eigen::RowVectorXf softmax(const Eigen::RowVectorXf& x) {
    Eigen::RowVectorXf exp_x = (x.array() - x.maxCoeff()).exp();  // for numerical stability
    return exp_x / exp_x.sum();
}

namespace {
    float _gelu(float x) {
        const float GELU_SCALE = std::sqrt(2.0f / static_cast<float>(M_PI));
        float cube = 0.044715f * x * x * x;
        return 0.5f * x * (1.0f + std::tanh(GELU_SCALE * (x + cube)));
    }
}

Eigen::MatrixXf gelu(Eigen::MatrixXf x) { return x.unaryExpr(&_gelu); }

Eigen::MatrixXf normalize(Eigen::MatrixXf x, const NormWeights& norm, float eps) {
    const Eigen::Index n = x.cols();

    for (Eigen::Index i = 0; i < x.rows(); ++i) { // iterate over all positions
        float mean = x.row(i).mean();
        // Bessel corrected; a single feature has no spread to speak of.
        float variance = n > 1 ? (x.row(i).array() - mean).square().sum() / static_cast<float>(n - 1) : 0.0f;
        float denom = std::sqrt(variance) + eps;
        x.row(i) = ((x.row(i).array() - mean) / denom) * norm.scale.array() + norm.shift.array();
    }
    return x;
}

/*
    Each position goes in and comes out on its own; the up projection just
    gives the nonlinearity more room. Stacking positions as rows means one
    GEMM handles all of them, but nothing leaks between rows.
*/
Eigen::MatrixXf feed_forward(Eigen::MatrixXf x, const FeedForwardWeights& ff) {
    x = forward_linear(x, ff.up);
    x = gelu(x);
    x = forward_linear(x, ff.down);
    return x;
}
