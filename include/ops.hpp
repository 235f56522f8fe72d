#pragma once
#include <Eigen/Dense>
#include "utils/layer_weights.hpp"

// Position-wise building blocks. Every function here treats each row of x
// (one position) independently, so they behave the same whether x holds the
// whole sequence or just the newest token.

// x * W + b, bias broadcast over rows.
Eigen::MatrixXf forward_linear(Eigen::MatrixXf x, const Linear& linear);

// Numerically stable; -inf entries come out as exact zeros.
Eigen::RowVectorXf softmax(const Eigen::RowVectorXf& x);

// tanh approximation
Eigen::MatrixXf gelu(Eigen::MatrixXf x);

// (x - mean) / (std + eps) * scale + shift, per row.
// Note eps goes on the std, not inside the sqrt. std uses the N-1 estimator.
Eigen::MatrixXf normalize(Eigen::MatrixXf x, const NormWeights& norm, float eps);

// H -> ff_hidden_size -> H, gelu in between. No dropout: inference only.
Eigen::MatrixXf feed_forward(Eigen::MatrixXf x, const FeedForwardWeights& ff);
