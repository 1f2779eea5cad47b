#include "animation/curves/CurveEvaluator.hpp"
#include "animation/curves/BlendCurve.hpp"
#include <cmath>

namespace Cadence {
namespace CurveEvaluator {

namespace {

bool Near(float a, float b) {
    return std::abs(a - b) < kLinearCurveEpsilon;
}

} // namespace

float Evaluate(const BlendCurve& curve, float t) {
    return detail::EvaluateKeyframes(curve.GetKeyframes(), t);
}

bool IsDefaultLinearCurve(std::span<const CurveKeyframe> authored) {
    if (authored.size() < 2) {
        return true;
    }
    if (authored.size() != 2) {
        return false;
    }

    const CurveKeyframe& k0 = authored[0];
    const CurveKeyframe& k1 = authored[1];

    return Near(k0.time, 0.0f) && Near(k0.value, 1.0f) &&
           Near(k1.time, 1.0f) && Near(k1.value, 0.0f) &&
           Near(k0.outTangent, -1.0f) && Near(k1.inTangent, -1.0f);
}

BlendCurve ConvertAuthoredCurve(std::span<const CurveKeyframe> authored) {
    if (IsDefaultLinearCurve(authored)) {
        return BlendCurve::Linear();
    }

    BlendCurve baked;
    for (const auto& key : authored) {
        CurveKeyframe inverted;
        inverted.time = key.time;
        inverted.value = 1.0f - key.value;
        inverted.inTangent = -key.inTangent;
        inverted.outTangent = -key.outTangent;
        if (!baked.AddKeyframe(inverted)) {
            break;
        }
    }
    return baked;
}

} // namespace CurveEvaluator
} // namespace Cadence
