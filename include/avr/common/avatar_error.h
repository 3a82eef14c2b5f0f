#pragma once

#include <string>

namespace avr {

// Failure kinds surfaced by the avatar pipeline. None of them is fatal to
// the frame loop; see the call sites for the recovery each one gets.
enum class AvatarError {
    None,
    MissingSceneNode,       // synchronizer/attach before the scene node exists
    MissingModel,           // normalizer given no model
    DuplicateInstance,      // instance guard rejected a second owner
    ClipNotFound,           // no clip for the preferred tag, fallback used
    DegenerateBoundingBox   // zero-height model, scaling skipped
};

inline const char* avatarErrorName(AvatarError error) {
    switch (error) {
        case AvatarError::None:                  return "none";
        case AvatarError::MissingSceneNode:      return "missing_scene_node";
        case AvatarError::MissingModel:          return "missing_model";
        case AvatarError::DuplicateInstance:     return "duplicate_instance";
        case AvatarError::ClipNotFound:          return "clip_not_found";
        case AvatarError::DegenerateBoundingBox: return "degenerate_bounding_box";
    }
    return "unknown";
}

} // namespace avr
