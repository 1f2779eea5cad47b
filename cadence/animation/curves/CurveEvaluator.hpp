#pragma once

#include "CurveKeyframe.hpp"
#include <span>

namespace Cadence {

class BlendCurve;

/**
 * @brief Hermite spline evaluation for transition blend curves
 *
 * The same evaluation runs on full precision, quantized and fixed-capacity
 * curves so a preview and the runtime agree exactly. Evaluation is pure and
 * allocation-free. Keyframes must be sorted by time; an unsorted curve still
 * yields a finite value in [0, 1] but its shape is unspecified.
 */
namespace CurveEvaluator {

/// Segments shorter than this return their start value
inline constexpr float kDegenerateSegmentEpsilon = 1e-6f;

/// Tolerance used when recognising the default linear authoring curve
inline constexpr float kLinearCurveEpsilon = 1e-3f;

/**
 * @brief Clamp to [0, 1], mapping NaN to 0
 */
[[nodiscard]] inline float Saturate(float t) {
    return t > 0.0f ? (t < 1.0f ? t : 1.0f) : 0.0f;
}

/**
 * @brief Evaluate one cubic Hermite segment, clamped to [0, 1]
 *
 * Tangents are slopes over normalized curve time; they are scaled by the
 * segment duration before applying the basis functions.
 */
[[nodiscard]] inline float EvaluateHermite(float t0, float v0, float outTangent0,
                                           float t1, float v1, float inTangent1,
                                           float t) {
    const float dt = t1 - t0;
    if (dt < kDegenerateSegmentEpsilon) {
        return Saturate(v0);
    }

    const float s = (t - t0) / dt;
    const float s2 = s * s;
    const float s3 = s2 * s;

    const float h00 = 2.0f * s3 - 3.0f * s2 + 1.0f;
    const float h10 = s3 - 2.0f * s2 + s;
    const float h01 = -2.0f * s3 + 3.0f * s2;
    const float h11 = s3 - s2;

    const float m0 = outTangent0 * dt;
    const float m1 = inTangent1 * dt;

    return Saturate(h00 * v0 + h10 * m0 + h01 * v1 + h11 * m1);
}

namespace detail {

inline float TimeOf(const CurveKeyframe& k) { return k.time; }
inline float ValueOf(const CurveKeyframe& k) { return k.value; }
inline float InOf(const CurveKeyframe& k) { return k.inTangent; }
inline float OutOf(const CurveKeyframe& k) { return k.outTangent; }

inline float TimeOf(const PackedCurveKeyframe& k) { return k.Time(); }
inline float ValueOf(const PackedCurveKeyframe& k) { return k.Value(); }
inline float InOf(const PackedCurveKeyframe& k) { return k.InTangent(); }
inline float OutOf(const PackedCurveKeyframe& k) { return k.OutTangent(); }

template<typename TKeyframe>
float EvaluateKeyframes(std::span<const TKeyframe> keyframes, float t) {
    const size_t count = keyframes.size();
    if (count == 0) {
        return Saturate(t);
    }

    if (count == 1) {
        return Saturate(ValueOf(keyframes[0]));
    }

    t = Saturate(t);

    // Extrapolation holds the edge keyframes
    if (t <= TimeOf(keyframes[0])) {
        return Saturate(ValueOf(keyframes[0]));
    }
    const size_t last = count - 1;
    if (t >= TimeOf(keyframes[last])) {
        return Saturate(ValueOf(keyframes[last]));
    }

    // Linear scan, curves hold at most a handful of keyframes
    size_t segment = last - 1;
    for (size_t i = 0; i < last; ++i) {
        if (t <= TimeOf(keyframes[i + 1])) {
            segment = i;
            break;
        }
    }

    const TKeyframe& k0 = keyframes[segment];
    const TKeyframe& k1 = keyframes[segment + 1];
    return EvaluateHermite(TimeOf(k0), ValueOf(k0), OutOf(k0),
                           TimeOf(k1), ValueOf(k1), InOf(k1), t);
}

} // namespace detail

/**
 * @brief Evaluate a curve at normalized time t
 *
 * Empty keyframes: clamp(t, 0, 1). One keyframe: constant.
 */
[[nodiscard]] inline float Evaluate(std::span<const CurveKeyframe> keyframes, float t) {
    return detail::EvaluateKeyframes(keyframes, t);
}

[[nodiscard]] inline float Evaluate(std::span<const PackedCurveKeyframe> keyframes, float t) {
    return detail::EvaluateKeyframes(keyframes, t);
}

[[nodiscard]] float Evaluate(const BlendCurve& curve, float t);

/**
 * @brief Check for the default authoring curve: from-weight (0,1) to (1,0), tangents -1
 */
[[nodiscard]] bool IsDefaultLinearCurve(std::span<const CurveKeyframe> authored);

/**
 * @brief Bake an authored "from-state weight" curve into a runtime curve
 *
 * Values are inverted (v -> 1 - v) and tangents negated so the result
 * stores "to-state" weight. Missing, single-key and default linear curves
 * bake to the linear fast path.
 */
[[nodiscard]] BlendCurve ConvertAuthoredCurve(std::span<const CurveKeyframe> authored);

} // namespace CurveEvaluator

} // namespace Cadence
