#include "animation/blending/BlendSpace.hpp"
#include "animation/blending/LinearBlendSolver.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Cadence {

// =============================================================================
// LinearBlendSpace
// =============================================================================

LinearBlendSpace::LinearBlendSpace(std::vector<BlendClip1D> clips)
    : m_clips(std::move(clips)) {
    auto byPosition = [](const BlendClip1D& a, const BlendClip1D& b) {
        return a.position < b.position;
    };

    if (!std::is_sorted(m_clips.begin(), m_clips.end(), byPosition)) {
        CADENCE_LOG_DEBUG("Sorting {} linear blend clips by position", m_clips.size());
        std::stable_sort(m_clips.begin(), m_clips.end(), byPosition);
    }
}

void LinearBlendSpace::ComputeWeights(float parameter, std::span<float> outWeights) const {
    LinearBlendSolver::ComputeWeights(m_clips, parameter, outWeights);
}

std::vector<float> LinearBlendSpace::ComputeWeights(float parameter) const {
    return LinearBlendSolver::ComputeWeights(m_clips, parameter);
}

// =============================================================================
// DirectionalBlendSpace
// =============================================================================

DirectionalBlendSpace::DirectionalBlendSpace(std::vector<BlendClip2D> clips, DirectionalBlendSettings settings)
    : m_clips(std::move(clips))
    , m_settings(settings) {
}

void DirectionalBlendSpace::ComputeWeights(const glm::vec2& parameter, std::span<float> outWeights) const {
    DirectionalBlendSolver::ComputeWeights(m_clips, parameter, m_settings, outWeights);
}

std::vector<float> DirectionalBlendSpace::ComputeWeights(const glm::vec2& parameter) const {
    return DirectionalBlendSolver::ComputeWeights(m_clips, parameter, m_settings);
}

// =============================================================================
// Variant dispatch
// =============================================================================

BlendKind GetKind(const BlendSpace& space) {
    return std::holds_alternative<LinearBlendSpace>(space) ? BlendKind::Linear : BlendKind::Directional2D;
}

size_t GetClipCount(const BlendSpace& space) {
    return std::visit([](const auto& s) { return s.GetClipCount(); }, space);
}

void ComputeWeights(const BlendSpace& space, const BlendParameter& parameter, std::span<float> outWeights) {
    if (const auto* linear = std::get_if<LinearBlendSpace>(&space)) {
        linear->ComputeWeights(parameter.x, outWeights);
    } else {
        std::get<DirectionalBlendSpace>(space).ComputeWeights(parameter, outWeights);
    }
}

// =============================================================================
// Blend Timing
// =============================================================================

namespace {

float EffectiveSpeed(float speed) {
    return speed > kMinClipSpeed ? speed : 1.0f;
}

template<typename TClip>
float WeightedClipDuration(std::span<const TClip> clips, std::span<const float> weights) {
    float weightedDuration = 0.0f;
    float totalWeight = 0.0f;

    const size_t count = std::min(clips.size(), weights.size());
    for (size_t i = 0; i < count; ++i) {
        if (weights[i] > kTimingWeightThreshold) {
            const float duration = clips[i].clipDurationSeconds / EffectiveSpeed(clips[i].speedMultiplier);
            weightedDuration += weights[i] * duration;
            totalWeight += weights[i];
        }
    }

    return totalWeight > kTimingWeightThreshold ? weightedDuration / totalWeight : 1.0f;
}

template<typename TClip>
float WeightedClipSpeed(std::span<const TClip> clips, std::span<const float> weights) {
    float weightedSpeed = 0.0f;
    float totalWeight = 0.0f;

    const size_t count = std::min(clips.size(), weights.size());
    for (size_t i = 0; i < count; ++i) {
        if (weights[i] > kTimingWeightThreshold) {
            weightedSpeed += weights[i] * EffectiveSpeed(clips[i].speedMultiplier);
            totalWeight += weights[i];
        }
    }

    return totalWeight > kTimingWeightThreshold ? weightedSpeed / totalWeight : 1.0f;
}

} // namespace

float ComputeEffectiveDuration(std::span<const BlendClip1D> clips, std::span<const float> weights) {
    return WeightedClipDuration(clips, weights);
}

float ComputeEffectiveDuration(std::span<const BlendClip2D> clips, std::span<const float> weights) {
    return WeightedClipDuration(clips, weights);
}

float ComputeEffectiveDuration(const BlendSpace& space, std::span<const float> weights) {
    return std::visit([&](const auto& s) { return ComputeEffectiveDuration(s.GetClips(), weights); }, space);
}

float ComputeWeightedSpeed(std::span<const BlendClip1D> clips, std::span<const float> weights) {
    return WeightedClipSpeed(clips, weights);
}

float ComputeWeightedSpeed(std::span<const BlendClip2D> clips, std::span<const float> weights) {
    return WeightedClipSpeed(clips, weights);
}

float ComputeInitialTime(float normalizedOffset, bool loop, float effectiveDuration) {
    if (!std::isfinite(normalizedOffset) || std::abs(normalizedOffset) <= kTimingWeightThreshold) {
        return 0.0f;
    }

    if (loop) {
        normalizedOffset -= std::floor(normalizedOffset);
    } else {
        normalizedOffset = std::clamp(normalizedOffset, 0.0f, 1.0f);
    }

    return normalizedOffset * effectiveDuration;
}

} // namespace Cadence
