#pragma once

#include "animation/curves/BlendCurve.hpp"
#include <span>
#include <vector>

namespace Cadence {

/**
 * @brief Lifecycle of a crossfade
 */
enum class TransitionPhase {
    Inactive,   // Never started
    Active,     // Blending from-state into to-state
    Complete    // To-state owns the full weight; caller discards the state
};

[[nodiscard]] const char* TransitionPhaseToString(TransitionPhase phase);

/**
 * @brief Caller-owned crossfade state
 *
 * Progress, phase and blend weight are derived from elapsedTime and
 * duration; nothing else is cached.
 */
struct TransitionState {
    float elapsedTime = 0.0f;
    float duration = 0.0f;
    BlendCurve curve;           // Stores to-state weight over normalized progress
    bool active = false;
};

/**
 * @brief Crossfade model between a from-state and a to-state
 *
 * Holds no timers or callbacks. The caller advances the state every frame,
 * reads the blend weight and composes the two weight arrays it owns.
 */
namespace TransitionBlender {

/**
 * @brief Start a transition
 * @param duration Seconds; non-positive or non-finite durations complete immediately
 * @param curve To-state weight curve; empty curves blend linearly
 */
[[nodiscard]] TransitionState Begin(float duration, const BlendCurve& curve = BlendCurve::Linear());

/**
 * @brief Accumulate elapsed time, clamped to [0, duration]
 *
 * Negative or non-finite deltas are ignored. Inactive states are left untouched.
 */
void Advance(TransitionState& state, float deltaTime);

/**
 * @brief Normalized progress in [0, 1]
 *
 * 0 while inactive, 1 once complete or when duration is not positive.
 */
[[nodiscard]] float GetProgress(const TransitionState& state);

/**
 * @brief To-state weight: the curve evaluated at the current progress
 */
[[nodiscard]] float GetBlendWeight(const TransitionState& state);

[[nodiscard]] TransitionPhase GetPhase(const TransitionState& state);
[[nodiscard]] bool IsComplete(const TransitionState& state);

/**
 * @brief Scale both weight arrays into one output buffer
 *
 * Writes (1 - blendWeight) * from[i] followed by blendWeight * to[j]. The
 * output must hold from.size() + to.size() entries; extra inputs are dropped.
 */
void ComposeWeights(std::span<const float> fromWeights, std::span<const float> toWeights,
                    float blendWeight, std::span<float> outWeights);

[[nodiscard]] std::vector<float> ComposeWeights(std::span<const float> fromWeights,
                                                std::span<const float> toWeights,
                                                float blendWeight);

} // namespace TransitionBlender

} // namespace Cadence
