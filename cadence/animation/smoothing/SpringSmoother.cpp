#include "animation/smoothing/SpringSmoother.hpp"
#include <algorithm>
#include <cmath>

namespace Cadence {
namespace SpringSmoother {

namespace {

struct SpringCoefficients {
    float omega;
    float decay;
};

// Cubic rational approximation of e^-x, accurate for the x range seen per frame
SpringCoefficients ComputeCoefficients(float smoothTime, float deltaTime) {
    const float omega = 2.0f / smoothTime;
    const float x = omega * deltaTime;
    const float decay = 1.0f / (1.0f + x + 0.48f * x * x + 0.235f * x * x * x);
    return {omega, decay};
}

float SanitizeDelta(float deltaTime) {
    return deltaTime > 0.0f ? deltaTime : 0.0f;
}

} // namespace

float SmoothDamp(float current, float target, float& velocity,
                 float smoothTime, float maxSpeed, float deltaTime) {
    smoothTime = std::max(kMinSmoothTime, smoothTime);
    deltaTime = SanitizeDelta(deltaTime);

    const auto [omega, decay] = ComputeCoefficients(smoothTime, deltaTime);

    const float originalTarget = target;
    float change = current - target;

    // Non-positive maxSpeed disables the cap
    if (maxSpeed > 0.0f) {
        const float maxChange = maxSpeed * smoothTime;
        change = std::clamp(change, -maxChange, maxChange);
    }
    target = current - change;

    const float temp = (velocity + omega * change) * deltaTime;
    velocity = (velocity - omega * temp) * decay;

    float result = target + (change + temp) * decay;

    if ((originalTarget - current) * (result - originalTarget) > 0.0f) {
        result = originalTarget;
        velocity = 0.0f;
    }

    return result;
}

glm::vec2 SmoothDamp(const glm::vec2& current, const glm::vec2& target, glm::vec2& velocity,
                     float smoothTime, float maxSpeed, float deltaTime) {
    smoothTime = std::max(kMinSmoothTime, smoothTime);
    deltaTime = SanitizeDelta(deltaTime);

    const auto [omega, decay] = ComputeCoefficients(smoothTime, deltaTime);

    glm::vec2 change = current - target;

    if (maxSpeed > 0.0f) {
        const float maxChange = maxSpeed * smoothTime;
        const float changeLength = glm::length(change);
        if (changeLength > maxChange) {
            change = change / changeLength * maxChange;
        }
    }
    const glm::vec2 clampedTarget = current - change;

    const glm::vec2 temp = (velocity + omega * change) * deltaTime;
    velocity = (velocity - omega * temp) * decay;

    glm::vec2 result = clampedTarget + (change + temp) * decay;

    // Snap if the step carried us past the real target along the travel direction
    if (glm::dot(target - current, result - target) > 0.0f) {
        result = target;
        velocity = glm::vec2(0.0f);
    }

    return result;
}

bool IsTransitioning(const SpringState& state, float target, const SpringSettings& settings) {
    return std::abs(state.position - target) > settings.snapThreshold;
}

bool IsTransitioning(const SpringState2D& state, const glm::vec2& target,
                     const SpringSettings& settings) {
    return glm::distance(state.position, target) > settings.snapThreshold;
}

bool Tick(SpringState& state, float target, const SpringSettings& settings, float deltaTime) {
    if (!IsTransitioning(state, target, settings)) {
        state.velocity = 0.0f;
        return false;
    }

    deltaTime = std::min(SanitizeDelta(deltaTime), settings.maxDeltaTime);

    state.position = SmoothDamp(state.position, target, state.velocity,
                                settings.smoothTime, settings.maxSpeed, deltaTime);

    if (std::abs(state.position - target) <= settings.snapThreshold &&
        std::abs(state.velocity) < settings.snapVelocity) {
        state.position = target;
        state.velocity = 0.0f;
    }

    return IsTransitioning(state, target, settings);
}

bool Tick(SpringState2D& state, const glm::vec2& target, const SpringSettings& settings,
          float deltaTime) {
    if (!IsTransitioning(state, target, settings)) {
        state.velocity = glm::vec2(0.0f);
        return false;
    }

    deltaTime = std::min(SanitizeDelta(deltaTime), settings.maxDeltaTime);

    state.position = SmoothDamp(state.position, target, state.velocity,
                                settings.smoothTime, settings.maxSpeed, deltaTime);

    if (glm::distance(state.position, target) <= settings.snapThreshold &&
        glm::length(state.velocity) < settings.snapVelocity) {
        state.position = target;
        state.velocity = glm::vec2(0.0f);
    }

    return IsTransitioning(state, target, settings);
}

} // namespace SpringSmoother
} // namespace Cadence
