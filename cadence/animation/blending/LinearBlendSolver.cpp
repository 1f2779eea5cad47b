#include "animation/blending/LinearBlendSolver.hpp"
#include <algorithm>
#include <cmath>

namespace Cadence {
namespace LinearBlendSolver {

BlendIndices FindBlendIndices(std::span<const BlendClip1D> clips, float parameter) {
    BlendIndices result;

    if (clips.size() <= 1 || !std::isfinite(parameter)) {
        return result;
    }

    const size_t last = clips.size() - 1;

    // Clamp to ends
    if (parameter <= clips.front().position) {
        return result;
    }
    if (parameter >= clips[last].position) {
        result.lower = result.upper = last;
        return result;
    }

    // Find surrounding samples
    for (size_t i = 0; i < last; ++i) {
        if (parameter >= clips[i].position && parameter <= clips[i + 1].position) {
            result.lower = i;
            result.upper = i + 1;
            const float range = clips[result.upper].position - clips[result.lower].position;
            if (range <= kMinThresholdRange) {
                result.upper = result.lower;
                result.t = 0.0f;
            } else {
                result.t = (parameter - clips[result.lower].position) / range;
            }
            return result;
        }
    }

    // Only reachable for unsorted input
    return result;
}

void ComputeWeights(std::span<const BlendClip1D> clips, float parameter, std::span<float> outWeights) {
    const size_t count = std::min(clips.size(), outWeights.size());
    if (count == 0) {
        return;
    }

    std::fill(outWeights.begin(), outWeights.begin() + static_cast<ptrdiff_t>(count), 0.0f);

    if (count == 1) {
        outWeights[0] = 1.0f;
        return;
    }

    const auto indices = FindBlendIndices(clips.first(count), parameter);

    if (indices.lower == indices.upper) {
        outWeights[indices.lower] = 1.0f;
    } else {
        outWeights[indices.lower] = 1.0f - indices.t;
        outWeights[indices.upper] = indices.t;
    }
}

std::vector<float> ComputeWeights(std::span<const BlendClip1D> clips, float parameter) {
    std::vector<float> weights(clips.size(), 0.0f);
    ComputeWeights(clips, parameter, weights);
    return weights;
}

float NormalizeIntParameter(int value, int min, int max) {
    const long long range = static_cast<long long>(max) - min;
    if (range <= 0) {
        return 0.0f;
    }
    const float t = static_cast<float>(static_cast<long long>(value) - min) / static_cast<float>(range);
    return std::clamp(t, 0.0f, 1.0f);
}

} // namespace LinearBlendSolver
} // namespace Cadence
