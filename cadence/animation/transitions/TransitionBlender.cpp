#include "animation/transitions/TransitionBlender.hpp"
#include "animation/curves/CurveEvaluator.hpp"
#include <algorithm>
#include <cmath>

namespace Cadence {

const char* TransitionPhaseToString(TransitionPhase phase) {
    switch (phase) {
        case TransitionPhase::Inactive: return "Inactive";
        case TransitionPhase::Active: return "Active";
        case TransitionPhase::Complete: return "Complete";
    }
    return "Unknown";
}

namespace TransitionBlender {

TransitionState Begin(float duration, const BlendCurve& curve) {
    TransitionState state;
    state.duration = std::isfinite(duration) && duration > 0.0f ? duration : 0.0f;
    state.elapsedTime = 0.0f;
    state.curve = curve;
    state.active = true;
    return state;
}

void Advance(TransitionState& state, float deltaTime) {
    if (!state.active || !std::isfinite(deltaTime) || deltaTime <= 0.0f) {
        return;
    }

    state.elapsedTime = std::min(state.elapsedTime + deltaTime, std::max(state.duration, 0.0f));
}

float GetProgress(const TransitionState& state) {
    if (!state.active) {
        return 0.0f;
    }
    if (!(state.duration > 0.0f)) {
        return 1.0f;
    }
    return CurveEvaluator::Saturate(state.elapsedTime / state.duration);
}

float GetBlendWeight(const TransitionState& state) {
    if (!state.active) {
        return 0.0f;
    }
    return state.curve.Evaluate(GetProgress(state));
}

TransitionPhase GetPhase(const TransitionState& state) {
    if (!state.active) {
        return TransitionPhase::Inactive;
    }
    return GetProgress(state) >= 1.0f ? TransitionPhase::Complete : TransitionPhase::Active;
}

bool IsComplete(const TransitionState& state) {
    return GetPhase(state) == TransitionPhase::Complete;
}

void ComposeWeights(std::span<const float> fromWeights, std::span<const float> toWeights,
                    float blendWeight, std::span<float> outWeights) {
    const float w = CurveEvaluator::Saturate(blendWeight);
    const float fromScale = 1.0f - w;

    const size_t fromCount = std::min(fromWeights.size(), outWeights.size());
    for (size_t i = 0; i < fromCount; ++i) {
        outWeights[i] = fromScale * fromWeights[i];
    }

    const size_t toCount = std::min(toWeights.size(), outWeights.size() - fromCount);
    for (size_t j = 0; j < toCount; ++j) {
        outWeights[fromCount + j] = w * toWeights[j];
    }
}

std::vector<float> ComposeWeights(std::span<const float> fromWeights, std::span<const float> toWeights,
                                  float blendWeight) {
    std::vector<float> weights(fromWeights.size() + toWeights.size(), 0.0f);
    ComposeWeights(fromWeights, toWeights, blendWeight, weights);
    return weights;
}

} // namespace TransitionBlender
} // namespace Cadence
