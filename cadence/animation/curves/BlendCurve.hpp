#pragma once

#include "CurveKeyframe.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Cadence {

/**
 * @brief Fixed-capacity transition curve
 *
 * Holds up to kMaxCurveKeyframes keyframes inline so a curve can be copied
 * into per-character transition state without touching the heap. Zero
 * keyframes means linear blend (identity fast path).
 *
 * Keyframe values are "to-state" weights: 0 at the start of a transition,
 * 1 at the end. Curves authored as "from-state" weight must go through
 * CurveEvaluator::ConvertAuthoredCurve first.
 */
class BlendCurve {
public:
    BlendCurve() = default;

    /**
     * @brief Linear curve (no keyframes)
     */
    [[nodiscard]] static BlendCurve Linear() { return BlendCurve{}; }

    /**
     * @brief Build from keyframes sorted by time
     *
     * Keyframes past capacity are dropped with a warning.
     */
    [[nodiscard]] static BlendCurve FromKeyframes(std::span<const CurveKeyframe> keyframes);

    /**
     * @brief Build from quantized keyframes
     */
    [[nodiscard]] static BlendCurve FromPacked(std::span<const PackedCurveKeyframe> keyframes);

    // =========================================================================
    // Keyframes
    // =========================================================================

    /**
     * @brief Append a keyframe
     * @return false if the curve is already full
     */
    bool AddKeyframe(const CurveKeyframe& keyframe);

    void Clear() { m_count = 0; }

    [[nodiscard]] bool IsLinear() const { return m_count == 0; }
    [[nodiscard]] size_t GetKeyframeCount() const { return m_count; }

    [[nodiscard]] const CurveKeyframe& GetKeyframe(size_t index) const { return m_keyframes[index]; }

    [[nodiscard]] std::span<const CurveKeyframe> GetKeyframes() const {
        return {m_keyframes.data(), m_count};
    }

    // =========================================================================
    // Evaluation
    // =========================================================================

    /**
     * @brief Evaluate the curve at normalized time t
     */
    [[nodiscard]] float Evaluate(float t) const;

    // =========================================================================
    // Serialization
    // =========================================================================

    /**
     * @brief Quantize to the 16-bit storage form
     */
    [[nodiscard]] std::vector<PackedCurveKeyframe> Pack() const;

    /**
     * @brief Serialize keyframes to JSON
     */
    [[nodiscard]] nlohmann::json ToJson() const;

    /**
     * @brief Load keyframes from JSON ({"keyframes": [{time, value, inTangent, outTangent}, ...]})
     */
    [[nodiscard]] static std::expected<BlendCurve, std::string> FromJson(const nlohmann::json& j);

    bool operator==(const BlendCurve& other) const;

private:
    std::array<CurveKeyframe, kMaxCurveKeyframes> m_keyframes{};
    uint8_t m_count = 0;
};

} // namespace Cadence
