#pragma once

#include "animation/blending/DirectionalBlendSolver.hpp"
#include "animation/smoothing/SpringSmoother.hpp"
#include "animation/transitions/TransitionTiming.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace Cadence {

/**
 * @brief Configuration error types
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError,
    InvalidValue
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error);

/**
 * @brief Defaults and limits for state transitions
 */
struct TransitionSettings {
    float defaultDuration = 0.2f;
    float minDuration = TransitionTiming::kMinTransitionDuration;
    float maxDuration = TransitionTiming::kMaxTransitionDuration;

    /**
     * @brief Clamp a requested duration into [minDuration, maxDuration]
     */
    [[nodiscard]] float ClampDuration(float duration) const;
};

/**
 * @brief All blending tunables as one value type
 *
 * Loaded from JSON of the form:
 * @code
 * {
 *     "spring":      { "smoothTime": 0.08, "maxSpeed": 50, "snapThreshold": 0.0005,
 *                      "snapVelocity": 0.01, "maxDeltaTime": 0.1 },
 *     "directional": { "algorithm": "simple_directional", "idwPower": 2 },
 *     "transition":  { "defaultDuration": 0.2, "minDuration": 0.01, "maxDuration": 10 }
 * }
 * @endcode
 *
 * Missing keys keep their defaults. Values outside their valid range are
 * replaced with the default and a warning is logged.
 */
struct BlendConfig {
    SpringSettings spring;
    DirectionalBlendSettings directional;
    TransitionSettings transition;

    /**
     * @brief Build from parsed JSON
     * @return ParseError if the root or a section is not an object
     */
    [[nodiscard]] static std::expected<BlendConfig, ConfigError> FromJson(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json ToJson() const;

    /**
     * @brief Load from a JSON file
     */
    [[nodiscard]] static std::expected<BlendConfig, ConfigError> LoadFromFile(const std::filesystem::path& filepath);

    /**
     * @brief Write pretty-printed JSON, creating parent directories
     */
    [[nodiscard]] std::expected<void, ConfigError> Save(const std::filesystem::path& filepath) const;

    /**
     * @brief Check every value is inside its valid range
     */
    [[nodiscard]] std::expected<void, ConfigError> Validate() const;
};

} // namespace Cadence
