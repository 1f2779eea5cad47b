#include "animation/blending/DirectionalBlendSolver.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace Cadence {

const char* Directional2DAlgorithmToString(Directional2DAlgorithm algorithm) {
    switch (algorithm) {
        case Directional2DAlgorithm::SimpleDirectional: return "simple_directional";
        case Directional2DAlgorithm::InverseDistanceWeighting: return "inverse_distance";
    }
    return "unknown";
}

std::optional<Directional2DAlgorithm> Directional2DAlgorithmFromString(std::string_view name) {
    if (name == "simple_directional") return Directional2DAlgorithm::SimpleDirectional;
    if (name == "inverse_distance") return Directional2DAlgorithm::InverseDistanceWeighting;
    return std::nullopt;
}

namespace DirectionalBlendSolver {

namespace {

constexpr float kPositionEpsilonSq = kPositionEpsilon * kPositionEpsilon;
constexpr float kDefaultIdwPower = 2.0f;

glm::vec2 SanitizeParameter(const glm::vec2& p) {
    return glm::vec2(std::isfinite(p.x) ? p.x : 0.0f,
                     std::isfinite(p.y) ? p.y : 0.0f);
}

void FillEven(std::span<float> weights) {
    const float even = 1.0f / static_cast<float>(weights.size());
    std::fill(weights.begin(), weights.end(), even);
}

// Rescale to sum 1; fall back to an even split when the sum is unusable
void NormalizeOrEven(std::span<float> weights) {
    float sum = 0.0f;
    for (float w : weights) {
        sum += w;
    }

    if (!std::isfinite(sum) || sum <= std::numeric_limits<float>::epsilon()) {
        FillEven(weights);
        return;
    }

    const float inv = 1.0f / sum;
    for (float& w : weights) {
        w *= inv;
    }
}

bool AllCoincident(std::span<const BlendClip2D> clips) {
    const glm::vec2 first = clips.front().position;
    return std::all_of(clips.begin() + 1, clips.end(), [&](const BlendClip2D& c) {
        const glm::vec2 d = c.position - first;
        return glm::dot(d, d) < kPositionEpsilonSq;
    });
}

size_t FindClosestClip(std::span<const BlendClip2D> clips, const glm::vec2& p) {
    size_t closest = 0;
    float closestDistSq = std::numeric_limits<float>::max();
    for (size_t i = 0; i < clips.size(); ++i) {
        const glm::vec2 d = clips[i].position - p;
        const float distSq = glm::dot(d, d);
        if (distSq < closestDistSq) {
            closestDistSq = distSq;
            closest = i;
        }
    }
    return closest;
}

// Wrap to [0, 2pi)
float NormalizeAngleDelta(float delta) {
    constexpr float twoPi = glm::two_pi<float>();
    delta = std::fmod(delta, twoPi);
    if (delta < 0.0f) {
        delta += twoPi;
    }
    return delta >= twoPi ? 0.0f : delta;
}

struct AngleNeighbors {
    int left = -1;      // Counter-clockwise neighbour
    int right = -1;     // Clockwise neighbour
    float leftAngle = 0.0f;
    float rightAngle = 0.0f;
};

AngleNeighbors FindAngleNeighbors(std::span<const BlendClip2D> clips, float inputAngle, int idleIndex) {
    AngleNeighbors n;
    float bestLeftDelta = std::numeric_limits<float>::max();
    float bestRightDelta = std::numeric_limits<float>::max();

    for (size_t i = 0; i < clips.size(); ++i) {
        const int index = static_cast<int>(i);
        const glm::vec2 pos = clips[i].position;
        if (index == idleIndex || glm::dot(pos, pos) < kPositionEpsilonSq) {
            continue;
        }

        const float clipAngle = std::atan2(pos.y, pos.x);

        const float ccw = NormalizeAngleDelta(clipAngle - inputAngle);
        if (ccw < bestLeftDelta) {
            bestLeftDelta = ccw;
            n.left = index;
            n.leftAngle = clipAngle;
        }

        const float cw = NormalizeAngleDelta(inputAngle - clipAngle);
        if (cw < bestRightDelta) {
            bestRightDelta = cw;
            n.right = index;
            n.rightAngle = clipAngle;
        }
    }

    return n;
}

// 0 at the left (ccw) neighbour, 1 at the right (cw) neighbour
float CalculateAngularT(float inputAngle, float leftAngle, float rightAngle) {
    const float span = NormalizeAngleDelta(leftAngle - rightAngle);
    if (span < kAngleEpsilon) {
        return 0.5f;
    }

    const float fromRight = NormalizeAngleDelta(inputAngle - rightAngle);
    return 1.0f - std::clamp(fromRight / span, 0.0f, 1.0f);
}

void SolveSimpleDirectional(std::span<const BlendClip2D> clips, const glm::vec2& p,
                            std::span<float> weights) {
    const int idle = FindIdleClip(clips);
    const float magnitude = glm::length(p);

    if (magnitude < kPositionEpsilon) {
        const size_t target = idle >= 0 ? static_cast<size_t>(idle) : FindClosestClip(clips, p);
        weights[target] = 1.0f;
        return;
    }

    const float inputAngle = std::atan2(p.y, p.x);
    const AngleNeighbors n = FindAngleNeighbors(clips, inputAngle, idle);

    if (n.left < 0 || n.right < 0) {
        // Every clip is idle; handled as coincident before reaching here
        weights[idle >= 0 ? static_cast<size_t>(idle) : 0] = 1.0f;
        return;
    }

    const size_t left = static_cast<size_t>(n.left);
    const size_t right = static_cast<size_t>(n.right);

    if (left == right) {
        // Single usable direction: ramp from idle by magnitude
        if (idle >= 0) {
            const float reach = std::max(glm::length(clips[left].position), kPositionEpsilon);
            const float t = std::clamp(magnitude / reach, 0.0f, 1.0f);
            weights[static_cast<size_t>(idle)] = 1.0f - t;
            weights[left] = t;
        } else {
            weights[left] = 1.0f;
        }
        return;
    }

    const float angularT = CalculateAngularT(inputAngle, n.leftAngle, n.rightAngle);
    const float leftWeight = 1.0f - angularT;
    const float rightWeight = angularT;

    if (idle < 0) {
        weights[left] = leftWeight;
        weights[right] = rightWeight;
        return;
    }

    const float leftMag = glm::length(clips[left].position);
    const float rightMag = glm::length(clips[right].position);
    const float reach = std::max(leftMag * leftWeight + rightMag * rightWeight, kPositionEpsilon);
    const float radialT = std::clamp(magnitude / reach, 0.0f, 1.0f);

    weights[static_cast<size_t>(idle)] = 1.0f - radialT;
    weights[left] = leftWeight * radialT;
    weights[right] = rightWeight * radialT;
}

void SolveInverseDistance(std::span<const BlendClip2D> clips, const glm::vec2& p,
                          float power, std::span<float> weights) {
    for (size_t i = 0; i < clips.size(); ++i) {
        const glm::vec2 d = clips[i].position - p;
        if (glm::dot(d, d) < kPositionEpsilonSq) {
            weights[i] = 1.0f;
            return;
        }
    }

    if (!std::isfinite(power) || power <= 0.0f) {
        power = kDefaultIdwPower;
    }

    for (size_t i = 0; i < clips.size(); ++i) {
        const float distance = std::max(glm::distance(clips[i].position, p), kPositionEpsilon);
        weights[i] = 1.0f / std::pow(distance, power);
    }
}

} // namespace

int FindIdleClip(std::span<const BlendClip2D> clips) {
    for (size_t i = 0; i < clips.size(); ++i) {
        const glm::vec2 pos = clips[i].position;
        if (glm::dot(pos, pos) < kPositionEpsilonSq) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void ComputeWeights(std::span<const BlendClip2D> clips, const glm::vec2& parameter,
                    const DirectionalBlendSettings& settings, std::span<float> outWeights) {
    const size_t count = std::min(clips.size(), outWeights.size());
    if (count == 0) {
        return;
    }

    clips = clips.first(count);
    std::span<float> weights = outWeights.first(count);
    std::fill(weights.begin(), weights.end(), 0.0f);

    if (count == 1) {
        weights[0] = 1.0f;
        return;
    }

    if (AllCoincident(clips)) {
        FillEven(weights);
        return;
    }

    const glm::vec2 p = SanitizeParameter(parameter);

    switch (settings.algorithm) {
        case Directional2DAlgorithm::SimpleDirectional:
            SolveSimpleDirectional(clips, p, weights);
            break;
        case Directional2DAlgorithm::InverseDistanceWeighting:
            SolveInverseDistance(clips, p, settings.idwPower, weights);
            break;
    }

    NormalizeOrEven(weights);
}

std::vector<float> ComputeWeights(std::span<const BlendClip2D> clips, const glm::vec2& parameter,
                                  const DirectionalBlendSettings& settings) {
    std::vector<float> weights(clips.size(), 0.0f);
    ComputeWeights(clips, parameter, settings, weights);
    return weights;
}

} // namespace DirectionalBlendSolver
} // namespace Cadence
