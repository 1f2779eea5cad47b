#pragma once

#include "BlendClip.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace Cadence {

/**
 * @brief Weight solver for clips laid out on a single parameter axis
 *
 * Clips must be sorted by position. At most two neighbouring clips receive
 * non-zero weight; parameters outside the covered range clamp to the end clips.
 */
namespace LinearBlendSolver {

/// Bracketing ranges narrower than this resolve to the lower clip
inline constexpr float kMinThresholdRange = 0.0001f;

/**
 * @brief Pair of clips surrounding a parameter value
 */
struct BlendIndices {
    size_t lower = 0;
    size_t upper = 0;
    float t = 0.0f;     // Weight of the upper clip
};

/**
 * @brief Locate the clips bracketing parameter
 *
 * lower is the last clip at or below the parameter, upper the first clip at
 * or above it. Requires a non-empty, sorted clip list.
 */
[[nodiscard]] BlendIndices FindBlendIndices(std::span<const BlendClip1D> clips, float parameter);

/**
 * @brief Compute per-clip weights for parameter
 * @param clips Clips sorted by ascending position
 * @param parameter Blend parameter; non-finite values resolve to the first clip
 * @param outWeights Receives one weight per clip, must hold clips.size() entries
 *
 * Writes nothing for an empty clip list. Never allocates.
 */
void ComputeWeights(std::span<const BlendClip1D> clips, float parameter, std::span<float> outWeights);

/**
 * @brief Allocating convenience overload
 */
[[nodiscard]] std::vector<float> ComputeWeights(std::span<const BlendClip1D> clips, float parameter);

/**
 * @brief Map an integer parameter into [0, 1] over [min, max]
 * @return 0 when the range is empty or inverted
 */
[[nodiscard]] float NormalizeIntParameter(int value, int min, int max);

} // namespace LinearBlendSolver

} // namespace Cadence
