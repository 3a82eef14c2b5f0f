#include "avr/graphics/model_normalizer.h"
#include "avr/common/logging.h"
#include "avr/graphics/conversions.h"
#include "avr/state/event_bus.h"

namespace avr {
namespace graphics {

ModelNormalizer::ModelNormalizer(irr::scene::ISceneManager* smgr, state::EventBus* eventBus)
    : smgr_(smgr)
    , eventBus_(eventBus)
{
}

bool ModelNormalizer::hasGeometry(irr::scene::ISceneNode* node) {
    switch (node->getType()) {
        case irr::scene::ESNT_MESH:
        case irr::scene::ESNT_ANIMATED_MESH:
        case irr::scene::ESNT_CUBE:
        case irr::scene::ESNT_SPHERE:
        case irr::scene::ESNT_OCTREE:
            return true;
        default:
            return false;
    }
}

void ModelNormalizer::collect(irr::scene::ISceneNode* node,
                              const irr::core::matrix4& parentTransform,
                              ModelAnalysis& analysis) {
    irr::core::matrix4 transform = parentTransform * node->getRelativeTransformation();

    const char* name = node->getName();
    analysis.names.push_back((name && name[0]) ? name : "node");

    if (hasGeometry(node)) {
        irr::core::aabbox3df box = node->getBoundingBox();
        transform.transformBoxEx(box);
        if (!analysis.hasGeometry) {
            analysis.boundingBox = box;
            analysis.hasGeometry = true;
        } else {
            analysis.boundingBox.addInternalBox(box);
        }

        analysis.meshCount++;
        analysis.materialCount += static_cast<int>(node->getMaterialCount());

        irr::scene::IMesh* mesh = nullptr;
        if (node->getType() == irr::scene::ESNT_MESH) {
            mesh = static_cast<irr::scene::IMeshSceneNode*>(node)->getMesh();
        } else if (node->getType() == irr::scene::ESNT_ANIMATED_MESH) {
            irr::scene::IAnimatedMesh* animated = static_cast<irr::scene::IAnimatedMeshSceneNode*>(node)->getMesh();
            if (animated && animated->getMeshType() == irr::scene::EAMT_SKINNED) {
                analysis.skinnedMeshCount++;
            }
            mesh = animated;
        }
        if (mesh) {
            for (irr::u32 i = 0; i < mesh->getMeshBufferCount(); ++i) {
                analysis.triangleCount += mesh->getMeshBuffer(i)->getIndexCount() / 3;
            }
        }
    }

    const irr::core::list<irr::scene::ISceneNode*>& children = node->getChildren();
    for (auto it = children.begin(); it != children.end(); ++it) {
        collect(*it, transform, analysis);
    }
}

ModelAnalysis ModelNormalizer::analyze(irr::scene::ISceneNode* model) {
    ModelAnalysis analysis;
    if (!model) {
        return analysis;
    }

    irr::core::matrix4 identity;
    collect(model, identity, analysis);

    analysis.size = analysis.boundingBox.getExtent();
    analysis.center = analysis.boundingBox.getCenter();
    return analysis;
}

const NormalizedContainer* ModelNormalizer::cached(const std::string& avatarId,
                                                   const NormalizeOptions& options) const {
    auto it = cache_.find(CacheKey(avatarId, options.targetHeight, options.centerToGround));
    return it != cache_.end() ? &it->second : nullptr;
}

const NormalizedContainer* ModelNormalizer::normalize(const std::string& avatarId,
                                                      irr::scene::ISceneNode* model,
                                                      const NormalizeOptions& options,
                                                      irr::scene::ISceneNode* parent) {
    if (!smgr_) {
        LOG_ERROR(MOD_NORMALIZE, "No scene manager, cannot normalize '{}'", avatarId);
        return nullptr;
    }
    if (!model) {
        LOG_WARN(MOD_NORMALIZE, "No model for '{}', skipping normalization", avatarId);
        return nullptr;
    }

    CacheKey key(avatarId, options.targetHeight, options.centerToGround);
    auto existing = cache_.find(key);
    if (existing != cache_.end() && existing->second.model == model) {
        LOG_TRACE(MOD_NORMALIZE, "Reusing normalized container for '{}'", avatarId);
        return &existing->second;
    }

    NormalizedContainer result;
    result.model = model;
    result.analysis = analyze(model);
    if (!result.analysis.hasGeometry) {
        LOG_WARN(MOD_NORMALIZE, "Model for '{}' has no geometry, skipping normalization", avatarId);
        return nullptr;
    }
    result.boundingBox = result.analysis.boundingBox;

    const irr::core::aabbox3df& bbox = result.boundingBox;
    const irr::core::vector3df& center = result.analysis.center;
    const float height = result.analysis.size.Y;

    if (options.centerToGround) {
        // Feet on the pivot origin, centered on the horizontal plane
        result.pivotOffset = irr::core::vector3df(-center.X, -bbox.MinEdge.Y, -center.Z);
    }

    if (height <= 0.0f) {
        result.warning = AvatarError::DegenerateBoundingBox;
        LOG_WARN(MOD_NORMALIZE, "'{}' has zero height, rendering at native scale", avatarId);
    } else if (options.targetHeight > 0.0f) {
        result.scaleFactor = options.targetHeight / height;
    }

    result.container = smgr_->addEmptySceneNode(parent);
    result.container->setName(CONTAINER_NAME);
    result.pivot = smgr_->addEmptySceneNode(result.container);
    result.pivot->setName(PIVOT_NAME);
    result.pivot->setPosition(result.pivotOffset);
    model->setParent(result.pivot);
    result.container->setScale(irr::core::vector3df(result.scaleFactor));
    result.container->updateAbsolutePosition();
    result.pivot->updateAbsolutePosition();

    LOG_DEBUG(MOD_NORMALIZE, "'{}': meshes={} skinned={} materials={} triangles={} nodes={}",
        avatarId, result.analysis.meshCount, result.analysis.skinnedMeshCount,
        result.analysis.materialCount, result.analysis.triangleCount, result.analysis.names.size());
    LOG_DEBUG(MOD_NORMALIZE, "'{}': bbox=({:.3f}, {:.3f}, {:.3f})-({:.3f}, {:.3f}, {:.3f}) height={:.3f} scale={:.4f} pivot=({:.3f}, {:.3f}, {:.3f})",
        avatarId, bbox.MinEdge.X, bbox.MinEdge.Y, bbox.MinEdge.Z,
        bbox.MaxEdge.X, bbox.MaxEdge.Y, bbox.MaxEdge.Z, height, result.scaleFactor,
        result.pivotOffset.X, result.pivotOffset.Y, result.pivotOffset.Z);

    if (existing != cache_.end()) {
        LOG_DEBUG(MOD_NORMALIZE, "Replacing cached container for '{}' (new model)", avatarId);
        existing->second = result;
    } else {
        existing = cache_.emplace(key, result).first;
    }

    if (eventBus_) {
        state::ContainerCreatedData data;
        data.avatarId = avatarId;
        data.height = height;
        data.bboxMin = toGlm(bbox.MinEdge);
        data.bboxMax = toGlm(bbox.MaxEdge);
        data.containerScale = toGlm(result.container->getScale());
        data.pivotLocal = toGlm(result.pivotOffset);
        eventBus_->publish(state::AvatarEventType::ContainerCreated, std::move(data));
    }

    return &existing->second;
}

void ModelNormalizer::evict(const std::string& avatarId) {
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (std::get<0>(it->first) == avatarId) {
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace graphics
} // namespace avr
