#include "avr/avatar/avatar_config.h"
#include <json/json.h>
#include "avr/common/logging.h"

#include <fstream>
#include <memory>
#include <sstream>

namespace avr {
namespace avatar {

namespace {

void readFloat(const Json::Value& section, const char* key, float& out) {
    if (section.isMember(key) && section[key].isNumeric()) {
        out = section[key].asFloat();
    }
}

void readStringList(const Json::Value& section, const char* key, std::vector<std::string>& out) {
    if (!section.isMember(key) || !section[key].isArray()) {
        return;
    }
    out.clear();
    for (const auto& item : section[key]) {
        if (item.isString()) {
            out.push_back(item.asString());
        }
    }
}

Json::Value stringList(const std::vector<std::string>& values) {
    Json::Value list(Json::arrayValue);
    for (const auto& value : values) {
        list.append(value);
    }
    return list;
}

} // namespace

bool AvatarConfigLoader::loadFromJson(const Json::Value& root, AvatarConfig& config) {
    if (!root.isObject() || !root["avatar"].isObject()) {
        LOG_ERROR(MOD_CONFIG, "AvatarConfigLoader: Missing 'avatar' section");
        return false;
    }
    const Json::Value& avatar = root["avatar"];

    readFloat(avatar, "base_speed", config.baseSpeed);
    readFloat(avatar, "run_multiplier", config.runMultiplier);
    readFloat(avatar, "default_delta_time", config.defaultDeltaTime);
    readFloat(avatar, "reference_tick_rate", config.referenceTickRate);
    readFloat(avatar, "target_height", config.targetHeight);
    readFloat(avatar, "world_scale", config.worldScale);
    readFloat(avatar, "crossfade_seconds", config.crossfadeSeconds);
    readFloat(avatar, "diagnostic_interval_seconds", config.diagnosticIntervalSeconds);

    if (avatar.isMember("center_to_ground")) {
        if (avatar["center_to_ground"].isBool()) {
            config.centerToGround = avatar["center_to_ground"].asBool();
        } else {
            LOG_WARN(MOD_CONFIG, "AvatarConfigLoader: 'center_to_ground' is not a bool, keeping {}",
                     config.centerToGround);
        }
    }

    const Json::Value& initial = avatar["initial_position"];
    if (initial.isArray() && initial.size() == 3 &&
        initial[0].isNumeric() && initial[1].isNumeric() && initial[2].isNumeric()) {
        config.initialPosition = glm::vec3(initial[0].asFloat(), initial[1].asFloat(), initial[2].asFloat());
    } else if (!initial.isNull()) {
        LOG_WARN(MOD_CONFIG, "AvatarConfigLoader: 'initial_position' must be three numbers, ignoring");
    }

    const Json::Value& keys = avatar["keys"];
    if (keys.isObject()) {
        readStringList(keys, "forward", config.keys.forward);
        readStringList(keys, "backward", config.keys.backward);
        readStringList(keys, "left", config.keys.left);
        readStringList(keys, "right", config.keys.right);
        readStringList(keys, "run", config.keys.run);
    }

    const Json::Value& selection = avatar["clip_selection"];
    if (selection.isObject()) {
        readStringList(selection, "running", config.clipSelection.running);
        readStringList(selection, "moving", config.clipSelection.moving);
        readStringList(selection, "idle", config.clipSelection.idle);
        readStringList(selection, "idle_like", config.clipSelection.idleLike);
        if (selection.isMember("preferred_idle") && selection["preferred_idle"].isString()) {
            config.clipSelection.preferredIdle = selection["preferred_idle"].asString();
        }
    }

    LOG_DEBUG(MOD_CONFIG, "AvatarConfigLoader: baseSpeed={}, runMultiplier={}, targetHeight={}, crossfade={}",
              config.baseSpeed, config.runMultiplier, config.targetHeight, config.crossfadeSeconds);
    return true;
}

bool AvatarConfigLoader::loadFromString(const std::string& text, AvatarConfig& config) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        LOG_ERROR(MOD_CONFIG, "AvatarConfigLoader: JSON parse error: {}", errors);
        return false;
    }
    return loadFromJson(root, config);
}

bool AvatarConfigLoader::loadFromFile(const std::string& filepath, AvatarConfig& config) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        LOG_DEBUG(MOD_CONFIG, "AvatarConfigLoader: Could not open {}", filepath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!loadFromString(buffer.str(), config)) {
        LOG_ERROR(MOD_CONFIG, "AvatarConfigLoader: Failed to load {}", filepath);
        return false;
    }

    LOG_INFO(MOD_CONFIG, "AvatarConfigLoader: Loaded config from {}", filepath);
    return true;
}

std::string AvatarConfigLoader::findConfigFile(const std::string& cmdLinePath,
                                               const std::string& avatarId) {
    if (!cmdLinePath.empty()) {
        std::ifstream test(cmdLinePath);
        if (test.good()) {
            return cmdLinePath;
        }
        LOG_WARN(MOD_CONFIG, "AvatarConfigLoader: Command line config not found: {}", cmdLinePath);
    }

    if (!avatarId.empty()) {
        std::string avatarPath = "data/config/avatars/" + avatarId + ".json";
        std::ifstream test(avatarPath);
        if (test.good()) {
            return avatarPath;
        }
    }

    std::string defaultPath = "data/config/avatar.json";
    std::ifstream test(defaultPath);
    if (test.good()) {
        return defaultPath;
    }

    return "";
}

bool AvatarConfigLoader::loadConfig(AvatarConfig& config,
                                    const std::string& cmdLinePath,
                                    const std::string& avatarId) {
    config = AvatarConfig{};

    std::string configPath = findConfigFile(cmdLinePath, avatarId);
    if (configPath.empty()) {
        LOG_INFO(MOD_CONFIG, "AvatarConfigLoader: No config file found, using built-in defaults");
        return true;
    }

    return loadFromFile(configPath, config);
}

Json::Value AvatarConfigLoader::toJson(const AvatarConfig& config) {
    Json::Value root;
    Json::Value& avatar = root["avatar"];

    avatar["base_speed"] = config.baseSpeed;
    avatar["run_multiplier"] = config.runMultiplier;
    avatar["default_delta_time"] = config.defaultDeltaTime;
    avatar["reference_tick_rate"] = config.referenceTickRate;
    avatar["target_height"] = config.targetHeight;
    avatar["center_to_ground"] = config.centerToGround;
    avatar["world_scale"] = config.worldScale;
    avatar["crossfade_seconds"] = config.crossfadeSeconds;
    avatar["diagnostic_interval_seconds"] = config.diagnosticIntervalSeconds;

    Json::Value initial(Json::arrayValue);
    initial.append(config.initialPosition.x);
    initial.append(config.initialPosition.y);
    initial.append(config.initialPosition.z);
    avatar["initial_position"] = initial;

    Json::Value& keys = avatar["keys"];
    keys["forward"] = stringList(config.keys.forward);
    keys["backward"] = stringList(config.keys.backward);
    keys["left"] = stringList(config.keys.left);
    keys["right"] = stringList(config.keys.right);
    keys["run"] = stringList(config.keys.run);

    Json::Value& selection = avatar["clip_selection"];
    selection["running"] = stringList(config.clipSelection.running);
    selection["moving"] = stringList(config.clipSelection.moving);
    selection["idle"] = stringList(config.clipSelection.idle);
    selection["preferred_idle"] = config.clipSelection.preferredIdle;
    selection["idle_like"] = stringList(config.clipSelection.idleLike);

    return root;
}

bool AvatarConfigLoader::saveToFile(const std::string& filepath, const AvatarConfig& config) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_ERROR(MOD_CONFIG, "AvatarConfigLoader: Could not open {} for writing", filepath);
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(toJson(config), &file);
    file << std::endl;

    LOG_INFO(MOD_CONFIG, "AvatarConfigLoader: Saved config to {}", filepath);
    return true;
}

} // namespace avatar
} // namespace avr
