#include "decoder_layer.hpp"
#include "ops.hpp"

#include <utility>

LayerOutput decoder_layer(const Activations& x, const DecoderLayerWeights& layer, const AttentionMode& mode, float eps) {
    Activations normed;
    normed.reserve(x.size());
    for (const auto& xb : x) normed.push_back(normalize(xb, layer.norm1, eps));

    LayerOutput attended = causal_self_attention(normed, layer.attn, mode);

    LayerOutput result;
    result.out.reserve(x.size());
    for (size_t b = 0; b < x.size(); ++b) {
        Eigen::MatrixXf h = normalize(normed[b] + attended.out[b], layer.norm2, eps);
        result.out.emplace_back(h + feed_forward(h, layer.ff));
    }
    result.present = std::move(attended.present);
    return result;
}
