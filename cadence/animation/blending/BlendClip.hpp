#pragma once

#include <glm/glm.hpp>

namespace Cadence {

/**
 * @brief Clip placed on a 1D blend axis
 */
struct BlendClip1D {
    float clipDurationSeconds = 1.0f;
    float speedMultiplier = 1.0f;   // Playback speed applied when sampled
    float position = 0.0f;          // Threshold on the parameter axis
};

/**
 * @brief Clip placed in a 2D blend plane
 */
struct BlendClip2D {
    float clipDurationSeconds = 1.0f;
    float speedMultiplier = 1.0f;
    glm::vec2 position{0.0f};
};

} // namespace Cadence
