#pragma once

#include "animation/curves/BlendCurve.hpp"
#include <cstdint>

namespace Cadence {

/**
 * @brief Exit time and duration rules shared by the runtime and tooling
 *
 * All times are in seconds unless a name says normalized.
 */
namespace TransitionTiming {

/// Shortest transition accepted, avoids zero-length crossfades
inline constexpr float kMinTransitionDuration = 0.01f;

/// Longest transition accepted
inline constexpr float kMaxTransitionDuration = 10.0f;

/// Clip durations at or below this are treated as empty
inline constexpr float kMinClipDuration = 0.001f;

/// Timeline sections shorter than this (about one frame at 60 FPS) collapse to zero
inline constexpr float kMinSectionDuration = 0.017f;

// ============================================================================
// Timeline Types
// ============================================================================

/**
 * @brief Requested timing for a transition between two states
 */
struct TransitionTimingInput {
    float fromStateDuration = 1.0f;
    float toStateDuration = 1.0f;
    float requestedExitTime = 0.75f;
    float requestedTransitionDuration = 0.25f;
    bool fromIsBlendState = false;
    bool toIsBlendState = false;
};

/**
 * @brief Resolved transition timeline
 *
 * The timeline runs fromBar, then the crossfade, then toBar. A blend state
 * keeps playing through its whole duration, so its fromBar ends where the
 * crossfade must start to finish with the clip rather than at the exit time.
 */
struct TransitionTimingResult {
    float exitTime = 0.0f;
    float minExitTime = 0.0f;
    float transitionDuration = 0.0f;
    float fromBarDuration = 0.0f;
    float toBarDuration = 0.0f;

    [[nodiscard]] float GetTotalDuration() const {
        return fromBarDuration + transitionDuration + toBarDuration;
    }
};

enum class TransitionSection : uint8_t {
    FromBar,
    Transition,
    ToBar
};

/**
 * @brief Everything needed to evaluate a transition at a point on its timeline
 */
struct TransitionStateConfig {
    float fromStateDuration = 1.0f;
    float toStateDuration = 1.0f;
    float transitionOffset = 0.0f;  ///< Normalized start time of the to-state
    TransitionTimingResult timing;
    BlendCurve curve;
};

/**
 * @brief Evaluated transition at one timeline position
 */
struct TransitionStateSnapshot {
    float currentTime = 0.0f;               ///< Seconds from the start of the timeline
    float rawProgress = 0.0f;               ///< Linear progress through the crossfade
    float blendWeight = 0.0f;               ///< To-state weight after the curve
    float fromStateNormalizedTime = 0.0f;
    float toStateNormalizedTime = 0.0f;
    TransitionSection section = TransitionSection::FromBar;

    [[nodiscard]] bool IsBeforeTransition() const { return section == TransitionSection::FromBar; }
    [[nodiscard]] bool IsInTransition() const { return section == TransitionSection::Transition; }
    [[nodiscard]] bool IsComplete() const { return section == TransitionSection::ToBar; }
};

// ============================================================================
// Clamping Rules
// ============================================================================

/**
 * @brief Earliest exit time that still lets the to-state cover the from-state tail
 */
[[nodiscard]] float GetMinExitTime(float fromStateDuration, float toStateDuration);

/**
 * @brief Clamp an exit time to [GetMinExitTime, fromStateDuration]
 */
[[nodiscard]] float ClampExitTime(float requestedExitTime, float fromStateDuration, float toStateDuration);

/**
 * @brief Fit a requested duration into the overlap available after exitTime
 *
 * Result lies in [kMinTransitionDuration, min(kMaxTransitionDuration, overlap, toStateDuration)].
 * Returns kMinTransitionDuration when either state is empty.
 */
[[nodiscard]] float RecalculateTransitionDuration(float fromStateDuration, float toStateDuration,
                                                  float exitTime, float requestedTransitionDuration);

/**
 * @brief Seconds into a looping clip as normalized time in [0, 1)
 */
[[nodiscard]] float NormalizedClipTime(float timeSeconds, float clipDuration);

/**
 * @brief Normalized time of the to-state after elapsedSinceStart seconds
 * @param normalizedOffset Normalized start offset of the to-state
 * @param toStateDuration To-state clip duration
 * @param elapsedSinceStart Seconds since the to-state started; negative returns the offset
 * @param loop Wrap when true, saturate otherwise
 */
[[nodiscard]] float ToStateNormalizedTime(float normalizedOffset, float toStateDuration,
                                          float elapsedSinceStart, bool loop);

// ============================================================================
// Timeline Evaluation
// ============================================================================

/**
 * @brief Resolve exit time, crossfade length and bar sections
 *
 * Exit time is clamped to [minExitTime, fromStateDuration] and the crossfade
 * to [kMinTransitionDuration, toStateDuration]. A bar at or below
 * kMinSectionDuration becomes zero.
 */
[[nodiscard]] TransitionTimingResult CalculateTiming(const TransitionTimingInput& input);

/**
 * @brief Evaluate the transition at a normalized timeline position
 * @param normalizedTime Position over the whole timeline, saturated to [0, 1]
 *
 * Raw progress is 0 before the crossfade starts and 1 once it has ended.
 * The blend weight is the curve evaluated at raw progress. The from-state
 * plays once and holds its last frame, the to-state starts at
 * transitionOffset when the crossfade begins.
 */
[[nodiscard]] TransitionStateSnapshot CalculateState(const TransitionStateConfig& config, float normalizedTime);

/**
 * @brief Evaluate the transition at a given crossfade progress
 * @param transitionProgress 0 at the start of the crossfade, 1 at its end
 */
[[nodiscard]] TransitionStateSnapshot CalculateStateFromProgress(const TransitionStateConfig& config,
                                                                 float transitionProgress);

} // namespace TransitionTiming

} // namespace Cadence
