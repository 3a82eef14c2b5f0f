#pragma once

#include <string>
#include <glm/glm.hpp>

#include "avr/animation/clip_selector.h"
#include "avr/input/key_bindings.h"
#include "avr/movement/movement_integrator.h"

namespace Json { class Value; }

namespace avr {
namespace avatar {

// Tunables for one avatar pipeline. Defaults match the shipped behavior.
struct AvatarConfig {
    // Movement
    float baseSpeed = 0.2f;
    float runMultiplier = 1.8f;
    float defaultDeltaTime = 0.016f;
    float referenceTickRate = 60.0f;
    glm::vec3 initialPosition{0.0f};

    // Normalization
    float targetHeight = 1.8f;        // <= 0 disables scaling
    bool centerToGround = true;
    float worldScale = 1.0f;          // applied on top of the normalized scale

    // Animation
    float crossfadeSeconds = 0.2f;
    animation::ClipSelectionTable clipSelection;

    // Diagnostics
    float diagnosticIntervalSeconds = 0.1f;

    input::KeyBindings keys = input::KeyBindings::defaults();

    movement::MovementParams movementParams() const {
        movement::MovementParams params;
        params.baseSpeed = baseSpeed;
        params.runMultiplier = runMultiplier;
        params.defaultDeltaTime = defaultDeltaTime;
        params.referenceTickRate = referenceTickRate;
        return params;
    }
};

class AvatarConfigLoader {
public:
    // Load config from JSON file
    // Returns true on success, false on failure (fields parsed so far are kept)
    static bool loadFromFile(const std::string& filepath, AvatarConfig& config);

    static bool loadFromString(const std::string& text, AvatarConfig& config);

    // Reads the "avatar" section of an already parsed document
    static bool loadFromJson(const Json::Value& root, AvatarConfig& config);

    // Load config with fallback chain:
    // 1. Command line specified path
    // 2. Avatar-specific: data/config/avatars/<avatarId>.json
    // 3. Default: data/config/avatar.json
    // 4. Built-in defaults
    static bool loadConfig(AvatarConfig& config,
                           const std::string& cmdLinePath = "",
                           const std::string& avatarId = "");

    // Save config to JSON file (for generating default config)
    static bool saveToFile(const std::string& filepath, const AvatarConfig& config);

    static Json::Value toJson(const AvatarConfig& config);

private:
    static std::string findConfigFile(const std::string& cmdLinePath,
                                      const std::string& avatarId);
};

} // namespace avatar
} // namespace avr
