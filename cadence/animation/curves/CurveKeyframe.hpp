#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace Cadence {

/**
 * @brief Maximum number of keyframes a transition curve may carry
 */
inline constexpr size_t kMaxCurveKeyframes = 8;

/**
 * @brief Size in bytes of one keyframe in the packed wire format
 */
inline constexpr size_t kPackedKeyframeBytes = 8;

/**
 * @brief Full precision keyframe of a weight-over-normalized-time curve
 *
 * Time and value live in [0, 1]. Tangents are slopes in value per unit of
 * normalized time.
 */
struct CurveKeyframe {
    float time = 0.0f;
    float value = 0.0f;
    float inTangent = 0.0f;
    float outTangent = 0.0f;
};

/**
 * @brief 16-bit quantized keyframe (8 bytes)
 *
 * Time and value are stored as unsigned fractions of 65535. Tangents are
 * stored as signed fixed point with three decimals, giving an effective
 * range of [-32.768, 32.767].
 */
struct PackedCurveKeyframe {
    static constexpr float kNormScale = 65535.0f;
    static constexpr float kTangentScale = 1000.0f;

    uint16_t timeNorm = 0;
    uint16_t valueNorm = 0;
    int16_t inTangentScaled = 0;
    int16_t outTangentScaled = 0;

    [[nodiscard]] float Time() const { return static_cast<float>(timeNorm) / kNormScale; }
    [[nodiscard]] float Value() const { return static_cast<float>(valueNorm) / kNormScale; }
    [[nodiscard]] float InTangent() const { return static_cast<float>(inTangentScaled) / kTangentScale; }
    [[nodiscard]] float OutTangent() const { return static_cast<float>(outTangentScaled) / kTangentScale; }

    /**
     * @brief Quantize a full precision keyframe
     *
     * Out of range fields saturate; non-finite fields become zero.
     */
    [[nodiscard]] static PackedCurveKeyframe Pack(const CurveKeyframe& keyframe);

    /**
     * @brief Expand back to full precision
     */
    [[nodiscard]] CurveKeyframe Unpack() const;

    bool operator==(const PackedCurveKeyframe&) const = default;
};

static_assert(sizeof(PackedCurveKeyframe) == kPackedKeyframeBytes,
              "PackedCurveKeyframe must stay 8 bytes");

/**
 * @brief Largest absolute error introduced by packing a time or value field
 */
inline constexpr float kNormQuantizationStep = 1.0f / PackedCurveKeyframe::kNormScale;

/**
 * @brief Largest absolute error introduced by packing a tangent field
 */
inline constexpr float kTangentQuantizationStep = 1.0f / PackedCurveKeyframe::kTangentScale;

// =============================================================================
// Bulk conversion
// =============================================================================

[[nodiscard]] std::vector<PackedCurveKeyframe> PackKeyframes(std::span<const CurveKeyframe> keyframes);
[[nodiscard]] std::vector<CurveKeyframe> UnpackKeyframes(std::span<const PackedCurveKeyframe> keyframes);

// =============================================================================
// Wire format
// =============================================================================

/**
 * @brief Encode keyframes as little-endian u16 time, u16 value, i16 in, i16 out
 *
 * An empty curve encodes to an empty buffer.
 */
[[nodiscard]] std::vector<uint8_t> EncodeKeyframes(std::span<const PackedCurveKeyframe> keyframes);

/**
 * @brief Decode a buffer produced by EncodeKeyframes
 * @return Keyframes, or a description of why the buffer was rejected
 */
[[nodiscard]] std::expected<std::vector<PackedCurveKeyframe>, std::string>
DecodeKeyframes(std::span<const uint8_t> bytes);

} // namespace Cadence
