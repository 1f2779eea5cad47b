#include "animation/curves/BlendCurve.hpp"
#include "animation/curves/CurveEvaluator.hpp"
#include "core/Logger.hpp"

namespace Cadence {

BlendCurve BlendCurve::FromKeyframes(std::span<const CurveKeyframe> keyframes) {
    BlendCurve curve;
    if (keyframes.size() > kMaxCurveKeyframes) {
        CADENCE_LOG_WARN("Blend curve has {} keyframes, keeping the first {}",
                         keyframes.size(), kMaxCurveKeyframes);
    }

    for (const auto& kf : keyframes) {
        if (!curve.AddKeyframe(kf)) {
            break;
        }
    }
    return curve;
}

BlendCurve BlendCurve::FromPacked(std::span<const PackedCurveKeyframe> keyframes) {
    BlendCurve curve;
    if (keyframes.size() > kMaxCurveKeyframes) {
        CADENCE_LOG_WARN("Packed blend curve has {} keyframes, keeping the first {}",
                         keyframes.size(), kMaxCurveKeyframes);
    }

    for (const auto& kf : keyframes) {
        if (!curve.AddKeyframe(kf.Unpack())) {
            break;
        }
    }
    return curve;
}

bool BlendCurve::AddKeyframe(const CurveKeyframe& keyframe) {
    if (m_count >= kMaxCurveKeyframes) {
        return false;
    }
    m_keyframes[m_count++] = keyframe;
    return true;
}

float BlendCurve::Evaluate(float t) const {
    return CurveEvaluator::Evaluate(*this, t);
}

std::vector<PackedCurveKeyframe> BlendCurve::Pack() const {
    return PackKeyframes(GetKeyframes());
}

nlohmann::json BlendCurve::ToJson() const {
    nlohmann::json keys = nlohmann::json::array();
    for (const auto& kf : GetKeyframes()) {
        keys.push_back({
            {"time", kf.time},
            {"value", kf.value},
            {"inTangent", kf.inTangent},
            {"outTangent", kf.outTangent}
        });
    }
    return {{"keyframes", keys}};
}

std::expected<BlendCurve, std::string> BlendCurve::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected("blend curve must be a JSON object");
    }
    if (!j.contains("keyframes")) {
        return Linear();
    }

    const auto& keys = j["keyframes"];
    if (!keys.is_array()) {
        return std::unexpected("'keyframes' must be an array");
    }
    if (keys.size() > kMaxCurveKeyframes) {
        return std::unexpected("curve has " + std::to_string(keys.size()) +
                               " keyframes, maximum is " + std::to_string(kMaxCurveKeyframes));
    }

    BlendCurve curve;
    try {
        for (const auto& k : keys) {
            CurveKeyframe kf;
            kf.time = k.value("time", 0.0f);
            kf.value = k.value("value", 0.0f);
            kf.inTangent = k.value("inTangent", 0.0f);
            kf.outTangent = k.value("outTangent", 0.0f);
            curve.AddKeyframe(kf);
        }
    } catch (const nlohmann::json::exception& e) {
        CADENCE_LOG_ERROR("Failed to parse blend curve: {}", e.what());
        return std::unexpected(std::string("invalid keyframe: ") + e.what());
    }

    return curve;
}

bool BlendCurve::operator==(const BlendCurve& other) const {
    if (m_count != other.m_count) {
        return false;
    }
    for (size_t i = 0; i < m_count; ++i) {
        const auto& a = m_keyframes[i];
        const auto& b = other.m_keyframes[i];
        if (a.time != b.time || a.value != b.value ||
            a.inTangent != b.inTangent || a.outTangent != b.outTangent) {
            return false;
        }
    }
    return true;
}

} // namespace Cadence
