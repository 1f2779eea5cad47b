#include "animation/transitions/TransitionTiming.hpp"
#include <algorithm>
#include <cmath>

namespace Cadence {
namespace TransitionTiming {

float GetMinExitTime(float fromStateDuration, float toStateDuration) {
    return std::max(0.0f, fromStateDuration - toStateDuration);
}

float ClampExitTime(float requestedExitTime, float fromStateDuration, float toStateDuration) {
    const float minExitTime = GetMinExitTime(fromStateDuration, toStateDuration);
    const float maxExitTime = std::max(minExitTime, fromStateDuration);
    return std::clamp(requestedExitTime, minExitTime, maxExitTime);
}

float RecalculateTransitionDuration(float fromStateDuration, float toStateDuration,
                                    float exitTime, float requestedTransitionDuration) {
    if (fromStateDuration <= kMinClipDuration || toStateDuration <= kMinClipDuration) {
        return kMinTransitionDuration;
    }

    const float fromBarEnd = fromStateDuration;
    const float toBarEnd = exitTime + toStateDuration;
    const float maxPossible = std::max(kMinTransitionDuration, std::min(fromBarEnd, toBarEnd) - exitTime);

    const float upper = std::max(kMinTransitionDuration,
                                 std::min({kMaxTransitionDuration, maxPossible, toStateDuration}));
    return std::clamp(requestedTransitionDuration, kMinTransitionDuration, upper);
}

float NormalizedClipTime(float timeSeconds, float clipDuration) {
    if (clipDuration <= kMinClipDuration || !std::isfinite(timeSeconds)) {
        return 0.0f;
    }

    float normalized = timeSeconds / clipDuration;
    normalized -= std::floor(normalized);
    return normalized < 1.0f ? std::max(normalized, 0.0f) : 0.0f;
}

float ToStateNormalizedTime(float normalizedOffset, float toStateDuration,
                            float elapsedSinceStart, bool loop) {
    if (toStateDuration <= kMinClipDuration) {
        return 0.0f;
    }
    if (elapsedSinceStart < 0.0f) {
        return normalizedOffset;
    }

    const float clipTime = normalizedOffset * toStateDuration + elapsedSinceStart;
    if (loop) {
        return NormalizedClipTime(clipTime, toStateDuration);
    }
    return std::clamp(clipTime / toStateDuration, 0.0f, 1.0f);
}

// ============================================================================
// Timeline Evaluation
// ============================================================================

namespace {

float GetTimelineDuration(const TransitionTimingResult& timing) {
    const float total = timing.GetTotalDuration();
    return total > kMinClipDuration ? total : 1.0f;
}

float GetTransitionProgress(const TransitionTimingResult& timing, float currentTime, float transitionStart) {
    if (currentTime < transitionStart) {
        return 0.0f;
    }
    if (timing.transitionDuration <= kMinClipDuration) {
        return 1.0f;
    }
    return std::clamp((currentTime - transitionStart) / timing.transitionDuration, 0.0f, 1.0f);
}

float GetFromStateNormalizedTime(const TransitionStateConfig& config, float currentTime) {
    if (config.fromStateDuration <= kMinClipDuration) {
        return 0.0f;
    }
    return std::clamp(currentTime / config.fromStateDuration, 0.0f, 1.0f);
}

} // namespace

TransitionTimingResult CalculateTiming(const TransitionTimingInput& input) {
    const float fromDuration = std::max(0.0f, input.fromStateDuration);
    const float toDuration = std::max(0.0f, input.toStateDuration);

    TransitionTimingResult result;
    result.minExitTime = GetMinExitTime(fromDuration, toDuration);
    result.exitTime = ClampExitTime(input.requestedExitTime, fromDuration, toDuration);
    result.transitionDuration = std::clamp(input.requestedTransitionDuration, kMinTransitionDuration,
                                           std::max(kMinTransitionDuration, toDuration));

    if (input.fromIsBlendState || input.toIsBlendState) {
        // Blend states run to the end of the from-state
        const float adaptedExitTime = fromDuration - result.transitionDuration;
        result.fromBarDuration = adaptedExitTime > kMinSectionDuration ? adaptedExitTime : 0.0f;
    } else {
        result.fromBarDuration = result.exitTime;
    }

    result.toBarDuration = toDuration - result.transitionDuration;
    if (result.toBarDuration <= kMinSectionDuration) {
        result.toBarDuration = 0.0f;
    }

    return result;
}

TransitionStateSnapshot CalculateState(const TransitionStateConfig& config, float normalizedTime) {
    const TransitionTimingResult& timing = config.timing;
    const float totalDuration = GetTimelineDuration(timing);
    const float saturated = std::isnan(normalizedTime) ? 0.0f : std::clamp(normalizedTime, 0.0f, 1.0f);

    const float fromBarEnd = timing.fromBarDuration;
    const float transitionEnd = fromBarEnd + timing.transitionDuration;

    TransitionStateSnapshot snapshot;
    snapshot.currentTime = saturated * totalDuration;

    if (snapshot.currentTime < fromBarEnd) {
        snapshot.section = TransitionSection::FromBar;
    } else if (snapshot.currentTime < transitionEnd) {
        snapshot.section = TransitionSection::Transition;
    } else {
        snapshot.section = TransitionSection::ToBar;
    }

    snapshot.rawProgress = GetTransitionProgress(timing, snapshot.currentTime, fromBarEnd);
    snapshot.blendWeight = config.curve.Evaluate(snapshot.rawProgress);
    snapshot.fromStateNormalizedTime = GetFromStateNormalizedTime(config, snapshot.currentTime);
    snapshot.toStateNormalizedTime = ToStateNormalizedTime(config.transitionOffset, config.toStateDuration,
                                                           snapshot.currentTime - fromBarEnd, false);
    return snapshot;
}

TransitionStateSnapshot CalculateStateFromProgress(const TransitionStateConfig& config, float transitionProgress) {
    const TransitionTimingResult& timing = config.timing;
    const float currentTime = timing.fromBarDuration + transitionProgress * timing.transitionDuration;
    return CalculateState(config, currentTime / GetTimelineDuration(timing));
}

} // namespace TransitionTiming
} // namespace Cadence
