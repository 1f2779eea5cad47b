#pragma once

#include "BlendClip.hpp"
#include <span>
#include <string_view>
#include <optional>
#include <vector>

namespace Cadence {

/**
 * @brief Weighting scheme used by 2D blend spaces
 */
enum class Directional2DAlgorithm {
    SimpleDirectional,          // Angular neighbours plus idle clip, gradient-band style
    InverseDistanceWeighting    // Every clip contributes by 1 / distance^power
};

[[nodiscard]] const char* Directional2DAlgorithmToString(Directional2DAlgorithm algorithm);
[[nodiscard]] std::optional<Directional2DAlgorithm> Directional2DAlgorithmFromString(std::string_view name);

/**
 * @brief Settings for DirectionalBlendSolver
 */
struct DirectionalBlendSettings {
    Directional2DAlgorithm algorithm = Directional2DAlgorithm::SimpleDirectional;
    float idwPower = 2.0f;
};

/**
 * @brief Weight solver for clips placed in a 2D parameter plane
 *
 * Typical use is locomotion: an idle clip at the origin surrounded by
 * directional clips (forward, strafe, backward and diagonals).
 *
 * Weights are always finite, non-negative and sum to 1. When every clip
 * sits on the same point the weight is split evenly regardless of the
 * query or algorithm.
 */
namespace DirectionalBlendSolver {

/// Distance under which positions are treated as coincident, and clips as idle
inline constexpr float kPositionEpsilon = 0.0001f;

/// Angular spans narrower than this split the weight evenly
inline constexpr float kAngleEpsilon = 0.0001f;

/**
 * @brief Compute per-clip weights for a 2D parameter
 * @param clips Clips in any order
 * @param parameter Query position; non-finite components are treated as 0
 * @param settings Algorithm selection and IDW power
 * @param outWeights Receives one weight per clip, must hold clips.size() entries
 *
 * Writes nothing for an empty clip list. Never allocates.
 */
void ComputeWeights(std::span<const BlendClip2D> clips, const glm::vec2& parameter,
                    const DirectionalBlendSettings& settings, std::span<float> outWeights);

/**
 * @brief Allocating convenience overload
 */
[[nodiscard]] std::vector<float> ComputeWeights(std::span<const BlendClip2D> clips,
                                                const glm::vec2& parameter,
                                                const DirectionalBlendSettings& settings = {});

/**
 * @brief Index of the first clip at the origin, or -1
 */
[[nodiscard]] int FindIdleClip(std::span<const BlendClip2D> clips);

} // namespace DirectionalBlendSolver

} // namespace Cadence
