#include "animation/curves/CurveKeyframe.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Cadence {

namespace {

uint16_t QuantizeUnit(float v) {
    if (!std::isfinite(v)) {
        return 0;
    }
    float scaled = std::clamp(v, 0.0f, 1.0f) * PackedCurveKeyframe::kNormScale;
    return static_cast<uint16_t>(std::lround(scaled));
}

int16_t QuantizeTangent(float v) {
    if (!std::isfinite(v)) {
        return 0;
    }
    float scaled = std::clamp(v * PackedCurveKeyframe::kTangentScale, -32768.0f, 32767.0f);
    return static_cast<int16_t>(std::lround(scaled));
}

void WriteU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

uint16_t ReadU16(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

} // namespace

PackedCurveKeyframe PackedCurveKeyframe::Pack(const CurveKeyframe& keyframe) {
    PackedCurveKeyframe packed;
    packed.timeNorm = QuantizeUnit(keyframe.time);
    packed.valueNorm = QuantizeUnit(keyframe.value);
    packed.inTangentScaled = QuantizeTangent(keyframe.inTangent);
    packed.outTangentScaled = QuantizeTangent(keyframe.outTangent);
    return packed;
}

CurveKeyframe PackedCurveKeyframe::Unpack() const {
    CurveKeyframe kf;
    kf.time = Time();
    kf.value = Value();
    kf.inTangent = InTangent();
    kf.outTangent = OutTangent();
    return kf;
}

std::vector<PackedCurveKeyframe> PackKeyframes(std::span<const CurveKeyframe> keyframes) {
    std::vector<PackedCurveKeyframe> result;
    result.reserve(keyframes.size());
    for (const auto& kf : keyframes) {
        result.push_back(PackedCurveKeyframe::Pack(kf));
    }
    return result;
}

std::vector<CurveKeyframe> UnpackKeyframes(std::span<const PackedCurveKeyframe> keyframes) {
    std::vector<CurveKeyframe> result;
    result.reserve(keyframes.size());
    for (const auto& kf : keyframes) {
        result.push_back(kf.Unpack());
    }
    return result;
}

std::vector<uint8_t> EncodeKeyframes(std::span<const PackedCurveKeyframe> keyframes) {
    std::vector<uint8_t> bytes;
    bytes.reserve(keyframes.size() * kPackedKeyframeBytes);

    for (const auto& kf : keyframes) {
        WriteU16(bytes, kf.timeNorm);
        WriteU16(bytes, kf.valueNorm);
        WriteU16(bytes, static_cast<uint16_t>(kf.inTangentScaled));
        WriteU16(bytes, static_cast<uint16_t>(kf.outTangentScaled));
    }

    return bytes;
}

std::expected<std::vector<PackedCurveKeyframe>, std::string>
DecodeKeyframes(std::span<const uint8_t> bytes) {
    if (bytes.size() % kPackedKeyframeBytes != 0) {
        CADENCE_LOG_WARN("Rejected keyframe buffer of {} bytes (not a multiple of {})",
                         bytes.size(), kPackedKeyframeBytes);
        return std::unexpected("keyframe buffer size " + std::to_string(bytes.size()) +
                               " is not a multiple of " + std::to_string(kPackedKeyframeBytes));
    }

    const size_t count = bytes.size() / kPackedKeyframeBytes;
    if (count > kMaxCurveKeyframes) {
        CADENCE_LOG_WARN("Rejected keyframe buffer with {} keyframes (max {})",
                         count, kMaxCurveKeyframes);
        return std::unexpected("keyframe count " + std::to_string(count) +
                               " exceeds maximum of " + std::to_string(kMaxCurveKeyframes));
    }

    std::vector<PackedCurveKeyframe> keyframes(count);
    for (size_t i = 0; i < count; ++i) {
        const size_t base = i * kPackedKeyframeBytes;
        auto& kf = keyframes[i];
        kf.timeNorm = ReadU16(bytes, base);
        kf.valueNorm = ReadU16(bytes, base + 2);
        kf.inTangentScaled = static_cast<int16_t>(ReadU16(bytes, base + 4));
        kf.outTangentScaled = static_cast<int16_t>(ReadU16(bytes, base + 6));
    }

    return keyframes;
}

} // namespace Cadence
