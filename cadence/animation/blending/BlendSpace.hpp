#pragma once

#include "BlendClip.hpp"
#include "DirectionalBlendSolver.hpp"
#include <span>
#include <variant>
#include <vector>

namespace Cadence {

/**
 * @brief 1D blend space: clips sorted by position once at construction
 */
class LinearBlendSpace {
public:
    LinearBlendSpace() = default;
    explicit LinearBlendSpace(std::vector<BlendClip1D> clips);

    [[nodiscard]] size_t GetClipCount() const { return m_clips.size(); }
    [[nodiscard]] std::span<const BlendClip1D> GetClips() const { return m_clips; }
    [[nodiscard]] const BlendClip1D& GetClip(size_t index) const { return m_clips[index]; }

    /**
     * @brief Weights in sorted clip order
     */
    void ComputeWeights(float parameter, std::span<float> outWeights) const;
    [[nodiscard]] std::vector<float> ComputeWeights(float parameter) const;

private:
    std::vector<BlendClip1D> m_clips;
};

/**
 * @brief 2D blend space: clips in authoring order plus the solver settings
 */
class DirectionalBlendSpace {
public:
    DirectionalBlendSpace() = default;
    explicit DirectionalBlendSpace(std::vector<BlendClip2D> clips, DirectionalBlendSettings settings = {});

    [[nodiscard]] size_t GetClipCount() const { return m_clips.size(); }
    [[nodiscard]] std::span<const BlendClip2D> GetClips() const { return m_clips; }
    [[nodiscard]] const BlendClip2D& GetClip(size_t index) const { return m_clips[index]; }

    [[nodiscard]] const DirectionalBlendSettings& GetSettings() const { return m_settings; }
    void SetSettings(const DirectionalBlendSettings& settings) { m_settings = settings; }

    void ComputeWeights(const glm::vec2& parameter, std::span<float> outWeights) const;
    [[nodiscard]] std::vector<float> ComputeWeights(const glm::vec2& parameter) const;

private:
    std::vector<BlendClip2D> m_clips;
    DirectionalBlendSettings m_settings;
};

/**
 * @brief Tagged union over the supported blend space kinds
 */
using BlendSpace = std::variant<LinearBlendSpace, DirectionalBlendSpace>;

enum class BlendKind {
    Linear,
    Directional2D
};

/**
 * @brief Blend parameter for either kind; 1D spaces read only x
 */
using BlendParameter = glm::vec2;

[[nodiscard]] BlendKind GetKind(const BlendSpace& space);
[[nodiscard]] size_t GetClipCount(const BlendSpace& space);

/**
 * @brief Dispatch to the solver matching the space
 */
void ComputeWeights(const BlendSpace& space, const BlendParameter& parameter, std::span<float> outWeights);

// =============================================================================
// Blend Timing
// =============================================================================

/// Weights at or below this are ignored by the timing helpers
inline constexpr float kTimingWeightThreshold = 0.001f;

/// Speeds at or below this are treated as 1
inline constexpr float kMinClipSpeed = 0.0001f;

/**
 * @brief Weighted mean of duration / speed over contributing clips
 * @return 1 second when nothing contributes
 */
[[nodiscard]] float ComputeEffectiveDuration(std::span<const BlendClip1D> clips, std::span<const float> weights);
[[nodiscard]] float ComputeEffectiveDuration(std::span<const BlendClip2D> clips, std::span<const float> weights);
[[nodiscard]] float ComputeEffectiveDuration(const BlendSpace& space, std::span<const float> weights);

/**
 * @brief Weighted mean of clip speed over contributing clips
 * @return 1 when nothing contributes
 */
[[nodiscard]] float ComputeWeightedSpeed(std::span<const BlendClip1D> clips, std::span<const float> weights);
[[nodiscard]] float ComputeWeightedSpeed(std::span<const BlendClip2D> clips, std::span<const float> weights);

/**
 * @brief Start time in seconds for a state entered at a normalized offset
 *
 * Looping states wrap the offset into [0, 1), others clamp it. Offsets
 * within 0.001 of zero start at 0.
 */
[[nodiscard]] float ComputeInitialTime(float normalizedOffset, bool loop, float effectiveDuration);

} // namespace Cadence
