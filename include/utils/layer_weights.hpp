#pragma once
#include <Eigen/Dense>

// Raw parameter structs. Nothing here knows how to run itself; the forward
// functions take these by const reference.

// Projects [in_dim] => [out_dim], so weight is stored [in_dim, out_dim]
// and we can right-multiply a [T, in_dim] activation block directly.
struct Linear {
    Eigen::MatrixXf weight;
    Eigen::RowVectorXf bias;   // [out_dim], a 1xn row so it broadcasts rowwise
};

struct AttentionWeights {
    // [H, 3H]. Output columns are sliced in the fixed order query | key | value;
    // any saved checkpoint depends on that order.
    Linear qkv;

    // [H, H]
    Linear proj;
};

struct FeedForwardWeights {
    // [H -> ff_hidden_size -> H]
    Linear up;
    Linear down;
};

struct NormWeights {
    Eigen::RowVectorXf scale;   // [H]
    Eigen::RowVectorXf shift;   // [H]
};

struct DecoderLayerWeights {
    NormWeights norm1;
    AttentionWeights attn;
    NormWeights norm2;
    FeedForwardWeights ff;
};
