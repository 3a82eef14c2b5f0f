#ifndef AVR_GRAPHICS_AVATAR_LOADER_H
#define AVR_GRAPHICS_AVATAR_LOADER_H

#include <irrlicht.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "avr/animation/animation_clip.h"

namespace avr {
namespace graphics {

// Loaded avatar: a hidden template model and its clips. Read-only to
// controllers, which clone the model for their own use.
struct AvatarAsset {
    std::string id;
    irr::scene::ISceneNode* model = nullptr;
    animation::ClipList clips;
    std::string sourcePath;
};

using AvatarAssetPtr = std::shared_ptr<const AvatarAsset>;

/**
 * AvatarLoader - Loads avatar meshes through the Irrlicht scene manager.
 *
 * For each supported extension tries <dir>/<name>-optimized, -ultra, then
 * the plain name. Clips come from <dir>/<name>.clips.json when present.
 * Assets are cached by name and their template nodes removed by clear().
 */
class AvatarLoader {
public:
    AvatarLoader(irr::scene::ISceneManager* smgr, std::string assetDir);
    ~AvatarLoader();

    AvatarLoader(const AvatarLoader&) = delete;
    AvatarLoader& operator=(const AvatarLoader&) = delete;

    // nullptr when no model file could be loaded
    AvatarAssetPtr load(const std::string& name);

    std::vector<std::string> candidatePaths(const std::string& name) const;
    std::string clipSidecarPath(const std::string& name) const;

    void clear();
    size_t cacheSize() const { return cache_.size(); }

private:
    irr::scene::ISceneNode* createTemplateNode(irr::scene::IAnimatedMesh* mesh, const std::string& name);

    irr::scene::ISceneManager* smgr_;
    std::string assetDir_;
    std::map<std::string, AvatarAssetPtr> cache_;
};

} // namespace graphics
} // namespace avr

#endif // AVR_GRAPHICS_AVATAR_LOADER_H
