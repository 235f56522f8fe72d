#pragma once
#include "attention.hpp"
#include "utils/layer_weights.hpp"

// x'   = norm1(x)
// x''  = x' + attn(x')
// x''' = norm2(x'')
// out  = x''' + ff(x''')
//
// Both residuals start from the *normalized* value, not from x. That's not
// the usual pre-norm wiring, and it's deliberate: cached and uncached runs are
// only required to agree with each other, so keep it as is.
LayerOutput decoder_layer(const Activations& x, const DecoderLayerWeights& layer, const AttentionMode& mode, float eps);
