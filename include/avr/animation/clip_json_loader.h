#pragma once

#include <string>

#include "avr/animation/animation_clip.h"

namespace Json { class Value; }

namespace avr {
namespace animation {

// Reads clip sidecar files:
// {
//   "clips": [
//     { "name": "Walk", "duration": 1.0,
//       "tracks": [ { "name": "Hips.quaternion", "times": [...], "values": [...] } ] }
//   ]
// }
// A clip without "duration" gets the longest track end time.
class ClipJsonLoader {
public:
    static bool loadFromFile(const std::string& filepath, ClipList& clips);
    static bool loadFromString(const std::string& text, ClipList& clips);
    static bool parse(const Json::Value& root, ClipList& clips);
};

} // namespace animation
} // namespace avr
