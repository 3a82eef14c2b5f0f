#include "avr/animation/clip_json_loader.h"
#include <json/json.h>
#include "avr/common/logging.h"

#include <fstream>
#include <sstream>

namespace avr {
namespace animation {

namespace {

// Fails on the first non-numeric item so the caller can drop the track.
bool floatArray(const Json::Value& value, std::vector<float>& out) {
    out.clear();
    if (!value.isArray()) {
        return false;
    }
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.isNumeric()) {
            return false;
        }
        out.push_back(item.asFloat());
    }
    return true;
}

} // namespace

bool ClipJsonLoader::parse(const Json::Value& root, ClipList& clips) {
    if (!root.isObject() || !root["clips"].isArray()) {
        LOG_ERROR(MOD_ASSET, "ClipJsonLoader: Missing 'clips' array");
        return false;
    }

    for (const auto& entry : root["clips"]) {
        if (!entry.isObject() || !entry["name"].isString()) {
            LOG_WARN(MOD_ASSET, "ClipJsonLoader: Skipping clip without a name");
            continue;
        }

        auto clip = std::make_shared<AnimationClip>();
        clip->name = entry["name"].asString();

        const Json::Value& tracks = entry["tracks"];
        if (!tracks.isNull() && !tracks.isArray()) {
            LOG_WARN(MOD_ASSET, "ClipJsonLoader: 'tracks' of '{}' is not an array, skipping clip", clip->name);
            continue;
        }

        for (const auto& trackJson : tracks) {
            if (!trackJson.isObject() || !trackJson["name"].isString()) {
                LOG_WARN(MOD_ASSET, "ClipJsonLoader: Skipping malformed track in '{}'", clip->name);
                continue;
            }
            std::string trackName = trackJson["name"].asString();
            std::vector<float> times;
            std::vector<float> values;
            if (!floatArray(trackJson["times"], times) || !floatArray(trackJson["values"], values)) {
                LOG_WARN(MOD_ASSET, "ClipJsonLoader: Track '{}' in '{}' has non-numeric keys, skipping",
                    trackName, clip->name);
                continue;
            }
            if (trackName.empty() || times.empty()) {
                LOG_WARN(MOD_ASSET, "ClipJsonLoader: Skipping empty track in '{}'", clip->name);
                continue;
            }
            auto track = std::make_shared<KeyframeTrack>(trackName, std::move(times), std::move(values));
            if (track->property() != TrackProperty::Other &&
                track->values().size() != track->keyCount() * track->valueSize()) {
                LOG_WARN(MOD_ASSET, "ClipJsonLoader: Track '{}' in '{}' has {} values for {} keys, skipping",
                    trackName, clip->name, track->values().size(), track->keyCount());
                continue;
            }
            clip->tracks.push_back(track);
        }

        if (entry["duration"].isNumeric()) {
            clip->duration = entry["duration"].asFloat();
        } else {
            clip->duration = AnimationClip::computeDuration(clip->tracks);
        }

        LOG_TRACE(MOD_ASSET, "ClipJsonLoader: '{}' {:.3f}s, {} tracks", clip->name, clip->duration, clip->tracks.size());
        clips.push_back(clip);
    }
    return true;
}

bool ClipJsonLoader::loadFromString(const std::string& text, ClipList& clips) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        LOG_ERROR(MOD_ASSET, "ClipJsonLoader: JSON parse error: {}", errors);
        return false;
    }
    return parse(root, clips);
}

bool ClipJsonLoader::loadFromFile(const std::string& filepath, ClipList& clips) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        LOG_DEBUG(MOD_ASSET, "ClipJsonLoader: Could not open {}", filepath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!loadFromString(buffer.str(), clips)) {
        LOG_ERROR(MOD_ASSET, "ClipJsonLoader: Failed to load {}", filepath);
        return false;
    }

    LOG_INFO(MOD_ASSET, "ClipJsonLoader: Loaded {} clips from {}", clips.size(), filepath);
    return true;
}

} // namespace animation
} // namespace avr
