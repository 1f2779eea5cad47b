#include "config/BlendConfig.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace Cadence {

const char* ConfigErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError: return "parse error";
        case ConfigError::WriteError: return "write error";
        case ConfigError::InvalidValue: return "invalid value";
    }
    return "unknown error";
}

float TransitionSettings::ClampDuration(float duration) const {
    if (!std::isfinite(duration)) {
        return defaultDuration;
    }
    return std::clamp(duration, minDuration, std::max(minDuration, maxDuration));
}

namespace {

using RangeCheck = bool (*)(float);

bool IsPositive(float v) { return std::isfinite(v) && v > 0.0f; }
bool IsNonNegative(float v) { return std::isfinite(v) && v >= 0.0f; }

void ReadFloat(const nlohmann::json& section, const char* sectionName, const char* key,
               float& target, RangeCheck isValid) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return;
    }

    if (!it->is_number()) {
        CADENCE_LOG_WARN("Config {}.{} is not a number, keeping {}", sectionName, key, target);
        return;
    }

    const float value = it->get<float>();
    if (!isValid(value)) {
        CADENCE_LOG_WARN("Config {}.{} = {} is out of range, keeping {}", sectionName, key, value, target);
        return;
    }
    target = value;
}

// Returns nullptr when absent; error when present but not an object
std::expected<const nlohmann::json*, ConfigError> FindSection(const nlohmann::json& root, const char* name) {
    const auto it = root.find(name);
    if (it == root.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        CADENCE_LOG_ERROR("Config section '{}' must be an object", name);
        return std::unexpected(ConfigError::ParseError);
    }
    return &*it;
}

void ReadSpring(const nlohmann::json& j, SpringSettings& spring) {
    ReadFloat(j, "spring", "smoothTime", spring.smoothTime, IsPositive);
    ReadFloat(j, "spring", "maxSpeed", spring.maxSpeed, IsPositive);
    ReadFloat(j, "spring", "snapThreshold", spring.snapThreshold, IsNonNegative);
    ReadFloat(j, "spring", "snapVelocity", spring.snapVelocity, IsNonNegative);
    ReadFloat(j, "spring", "maxDeltaTime", spring.maxDeltaTime, IsPositive);
}

void ReadDirectional(const nlohmann::json& j, DirectionalBlendSettings& directional) {
    if (const auto it = j.find("algorithm"); it != j.end()) {
        std::optional<Directional2DAlgorithm> algorithm;
        if (it->is_string()) {
            algorithm = Directional2DAlgorithmFromString(it->get<std::string>());
        }
        if (algorithm) {
            directional.algorithm = *algorithm;
        } else {
            CADENCE_LOG_WARN("Config directional.algorithm {} is not recognised, keeping '{}'",
                             it->dump(), Directional2DAlgorithmToString(directional.algorithm));
        }
    }
    ReadFloat(j, "directional", "idwPower", directional.idwPower, IsPositive);
}

void ReadTransition(const nlohmann::json& j, TransitionSettings& transition) {
    ReadFloat(j, "transition", "minDuration", transition.minDuration, IsPositive);
    ReadFloat(j, "transition", "maxDuration", transition.maxDuration, IsPositive);

    if (transition.maxDuration < transition.minDuration) {
        CADENCE_LOG_WARN("Config transition.maxDuration {} is below minDuration {}, restoring defaults",
                         transition.maxDuration, transition.minDuration);
        transition.minDuration = TransitionTiming::kMinTransitionDuration;
        transition.maxDuration = TransitionTiming::kMaxTransitionDuration;
    }

    ReadFloat(j, "transition", "defaultDuration", transition.defaultDuration, IsNonNegative);

    const float clamped = std::clamp(transition.defaultDuration, transition.minDuration, transition.maxDuration);
    if (clamped != transition.defaultDuration) {
        CADENCE_LOG_WARN("Config transition.defaultDuration {} clamped to {}", transition.defaultDuration, clamped);
        transition.defaultDuration = clamped;
    }
}

} // namespace

std::expected<BlendConfig, ConfigError> BlendConfig::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        CADENCE_LOG_ERROR("Blend config root must be a JSON object");
        return std::unexpected(ConfigError::ParseError);
    }

    BlendConfig config;

    const auto spring = FindSection(j, "spring");
    if (!spring) return std::unexpected(spring.error());
    if (*spring) ReadSpring(**spring, config.spring);

    const auto directional = FindSection(j, "directional");
    if (!directional) return std::unexpected(directional.error());
    if (*directional) ReadDirectional(**directional, config.directional);

    const auto transition = FindSection(j, "transition");
    if (!transition) return std::unexpected(transition.error());
    if (*transition) ReadTransition(**transition, config.transition);

    return config;
}

nlohmann::json BlendConfig::ToJson() const {
    nlohmann::json j;

    j["spring"]["smoothTime"] = spring.smoothTime;
    j["spring"]["maxSpeed"] = spring.maxSpeed;
    j["spring"]["snapThreshold"] = spring.snapThreshold;
    j["spring"]["snapVelocity"] = spring.snapVelocity;
    j["spring"]["maxDeltaTime"] = spring.maxDeltaTime;

    j["directional"]["algorithm"] = Directional2DAlgorithmToString(directional.algorithm);
    j["directional"]["idwPower"] = directional.idwPower;

    j["transition"]["defaultDuration"] = transition.defaultDuration;
    j["transition"]["minDuration"] = transition.minDuration;
    j["transition"]["maxDuration"] = transition.maxDuration;

    return j;
}

std::expected<BlendConfig, ConfigError> BlendConfig::LoadFromFile(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        CADENCE_LOG_ERROR("Blend config not found: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            CADENCE_LOG_ERROR("Failed to open blend config: {}", filepath.string());
            return std::unexpected(ConfigError::FileNotFound);
        }

        const nlohmann::json data = nlohmann::json::parse(file);
        auto config = FromJson(data);
        if (config) {
            CADENCE_LOG_INFO("Loaded blend config from: {}", filepath.string());
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        CADENCE_LOG_ERROR("Failed to parse blend config {}: {}", filepath.string(), e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> BlendConfig::Save(const std::filesystem::path& filepath) const {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            CADENCE_LOG_ERROR("Failed to open blend config for writing: {}", filepath.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << ToJson() << std::endl;
        CADENCE_LOG_INFO("Saved blend config to: {}", filepath.string());
        return {};
    } catch (const std::exception& e) {
        CADENCE_LOG_ERROR("Failed to save blend config: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> BlendConfig::Validate() const {
    const bool springValid = IsPositive(spring.smoothTime) && IsPositive(spring.maxSpeed) &&
                             IsNonNegative(spring.snapThreshold) && IsNonNegative(spring.snapVelocity) &&
                             IsPositive(spring.maxDeltaTime);
    const bool directionalValid = IsPositive(directional.idwPower);
    const bool transitionValid = IsPositive(transition.minDuration) &&
                                 IsPositive(transition.maxDuration) &&
                                 transition.minDuration <= transition.maxDuration &&
                                 transition.defaultDuration >= transition.minDuration &&
                                 transition.defaultDuration <= transition.maxDuration;

    if (!springValid || !directionalValid || !transitionValid) {
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

} // namespace Cadence
