#pragma once

#include <glm/glm.hpp>

namespace Cadence {

/**
 * @brief Tunables for critically damped smoothing of a blend parameter
 */
struct SpringSettings {
    float smoothTime = 0.08f;       // Approximate time to reach the target (seconds)
    float maxSpeed = 50.0f;         // Velocity cap (units per second)
    float snapThreshold = 0.0005f;  // Distance below which the spring is idle
    float snapVelocity = 0.01f;     // Velocity below which Tick() snaps to target
    float maxDeltaTime = 0.1f;      // Frame hitch guard applied by Tick()
};

/**
 * @brief Caller-owned scalar spring state
 */
struct SpringState {
    float position = 0.0f;
    float velocity = 0.0f;
};

/**
 * @brief Caller-owned 2D spring state
 */
struct SpringState2D {
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
};

/**
 * @brief Critically damped spring (SmoothDamp) for blend positions
 *
 * Approaches the target as fast as possible without oscillating. The 2D
 * variant clamps and checks overshoot on the joint vector so motion stays
 * isotropic.
 */
namespace SpringSmoother {

/// Lower bound applied to smoothTime
inline constexpr float kMinSmoothTime = 0.0001f;

/**
 * @brief Advance a scalar toward target
 * @param current Current value
 * @param target Value to approach
 * @param velocity Current velocity, updated in place
 * @param smoothTime Approximate time to reach the target, clamped to kMinSmoothTime
 * @param maxSpeed Maximum speed, limits the change per step to maxSpeed * smoothTime
 * @param deltaTime Step length; callers should clamp frame hitches
 * @return New value. Never passes the target: an overshoot snaps to it with zero velocity.
 *
 * The speed cap scales with the clamped smoothTime. A smoothTime of 0 leaves
 * a cap of maxSpeed * kMinSmoothTime per step (0.005 at the default maxSpeed),
 * so covering 5 units takes about a thousand steps. BlendConfig rejects a
 * non-positive smoothTime.
 */
[[nodiscard]] float SmoothDamp(float current, float target, float& velocity,
                               float smoothTime, float maxSpeed, float deltaTime);

/**
 * @brief Advance a 2D position toward target
 */
[[nodiscard]] glm::vec2 SmoothDamp(const glm::vec2& current, const glm::vec2& target,
                                   glm::vec2& velocity, float smoothTime, float maxSpeed,
                                   float deltaTime);

/**
 * @brief Whether the spring still needs ticking
 *
 * Checks distance only. A spring within snapThreshold is idle whatever its
 * velocity, and Tick() clears that velocity instead of integrating it.
 */
[[nodiscard]] bool IsTransitioning(const SpringState& state, float target,
                                   const SpringSettings& settings);
[[nodiscard]] bool IsTransitioning(const SpringState2D& state, const glm::vec2& target,
                                   const SpringSettings& settings);

/**
 * @brief Per-frame update
 *
 * Clamps deltaTime to settings.maxDeltaTime, advances the spring and snaps
 * to the target once within snapThreshold and slower than snapVelocity.
 * An idle spring has its velocity cleared and is left in place.
 *
 * @return true while still transitioning
 */
bool Tick(SpringState& state, float target, const SpringSettings& settings, float deltaTime);
bool Tick(SpringState2D& state, const glm::vec2& target, const SpringSettings& settings,
          float deltaTime);

} // namespace SpringSmoother

} // namespace Cadence
