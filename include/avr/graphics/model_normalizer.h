#ifndef AVR_GRAPHICS_MODEL_NORMALIZER_H
#define AVR_GRAPHICS_MODEL_NORMALIZER_H

#include <irrlicht.h>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "avr/common/avatar_error.h"

namespace avr {
namespace state { class EventBus; }

namespace graphics {

struct NormalizeOptions {
    float targetHeight = 0.0f;   // <= 0 keeps native scale
    bool centerToGround = true;
};

// Summary of a raw model hierarchy, in the model's own space
struct ModelAnalysis {
    int meshCount = 0;               // nodes carrying geometry
    int skinnedMeshCount = 0;
    int materialCount = 0;
    unsigned int triangleCount = 0;
    bool hasGeometry = false;
    irr::core::aabbox3df boundingBox{0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
    irr::core::vector3df size;
    irr::core::vector3df center;
    std::vector<std::string> names;  // every node, depth first
};

// Wrapper pair produced for one model: container (scale) -> pivot (offset) -> model
struct NormalizedContainer {
    irr::scene::ISceneNode* container = nullptr;
    irr::scene::ISceneNode* pivot = nullptr;
    irr::scene::ISceneNode* model = nullptr;

    irr::core::vector3df pivotOffset;
    float scaleFactor = 1.0f;
    irr::core::aabbox3df boundingBox{0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
    ModelAnalysis analysis;
    AvatarError warning = AvatarError::None;  // DegenerateBoundingBox when scaling was skipped
};

/**
 * ModelNormalizer - Wraps an imported model of unknown scale and pivot in a
 * container/pivot pair so it stands on the container origin at a known height.
 *
 * The pivot carries the centering offset (-center.x, -min.y, -center.z) in
 * unscaled model units; the container carries the uniform scale
 * targetHeight / boundingBoxHeight. Keeping them on separate nodes lets the
 * offset stay independent of the scale.
 *
 * Results are cached per (avatar id, target height, center-to-ground) until
 * evict(). The scene graph owns the created nodes.
 */
class ModelNormalizer {
public:
    explicit ModelNormalizer(irr::scene::ISceneManager* smgr, state::EventBus* eventBus = nullptr);

    // Bounding box of all geometry under model, including model's own transform
    static ModelAnalysis analyze(irr::scene::ISceneNode* model);

    // Returns nullptr when model is null or has no geometry (MissingModel).
    // The container is created under parent (scene root when null).
    const NormalizedContainer* normalize(const std::string& avatarId,
                                         irr::scene::ISceneNode* model,
                                         const NormalizeOptions& options,
                                         irr::scene::ISceneNode* parent = nullptr);

    const NormalizedContainer* cached(const std::string& avatarId,
                                      const NormalizeOptions& options) const;

    // Drops every cache entry for the avatar. Nodes are left to the caller.
    void evict(const std::string& avatarId);
    size_t cacheSize() const { return cache_.size(); }

    static constexpr const char* CONTAINER_NAME = "AvatarContainer";
    static constexpr const char* PIVOT_NAME = "AvatarPivot";

private:
    using CacheKey = std::tuple<std::string, float, bool>;

    static void collect(irr::scene::ISceneNode* node,
                        const irr::core::matrix4& parentTransform,
                        ModelAnalysis& analysis);
    static bool hasGeometry(irr::scene::ISceneNode* node);

    irr::scene::ISceneManager* smgr_;
    state::EventBus* eventBus_;
    std::map<CacheKey, NormalizedContainer> cache_;
};

} // namespace graphics
} // namespace avr

#endif // AVR_GRAPHICS_MODEL_NORMALIZER_H
