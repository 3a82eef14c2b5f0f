#include "avr/graphics/avatar_loader.h"
#include "avr/animation/clip_json_loader.h"
#include "avr/common/logging.h"

namespace avr {
namespace graphics {

namespace {
const char* const MESH_EXTENSIONS[] = {"b3d", "x", "ms3d", "obj"};
const char* const VARIANT_SUFFIXES[] = {"-optimized", "-ultra", ""};
}

AvatarLoader::AvatarLoader(irr::scene::ISceneManager* smgr, std::string assetDir)
    : smgr_(smgr)
    , assetDir_(std::move(assetDir))
{
    if (!assetDir_.empty() && assetDir_.back() != '/') {
        assetDir_ += '/';
    }
}

AvatarLoader::~AvatarLoader() {
    clear();
}

std::vector<std::string> AvatarLoader::candidatePaths(const std::string& name) const {
    std::vector<std::string> paths;
    for (const char* suffix : VARIANT_SUFFIXES) {
        for (const char* ext : MESH_EXTENSIONS) {
            paths.push_back(assetDir_ + name + suffix + "." + ext);
        }
    }
    return paths;
}

std::string AvatarLoader::clipSidecarPath(const std::string& name) const {
    return assetDir_ + name + ".clips.json";
}

irr::scene::ISceneNode* AvatarLoader::createTemplateNode(irr::scene::IAnimatedMesh* mesh, const std::string& name) {
    irr::scene::ISceneNode* node = nullptr;
    if (mesh->getMeshType() == irr::scene::EAMT_SKINNED || mesh->getFrameCount() > 1) {
        node = smgr_->addAnimatedMeshSceneNode(mesh);
    } else {
        node = smgr_->addMeshSceneNode(mesh->getMesh(0));
    }
    if (node) {
        node->setName(name.c_str());
        node->setVisible(false);
    }
    return node;
}

AvatarAssetPtr AvatarLoader::load(const std::string& name) {
    auto cached = cache_.find(name);
    if (cached != cache_.end()) {
        LOG_DEBUG(MOD_ASSET, "Using cached avatar '{}'", name);
        return cached->second;
    }

    if (!smgr_) {
        LOG_ERROR(MOD_ASSET, "No scene manager, cannot load avatar '{}'", name);
        return nullptr;
    }

    irr::io::IFileSystem* fs = smgr_->getFileSystem();
    auto asset = std::make_shared<AvatarAsset>();
    asset->id = name;

    for (const auto& path : candidatePaths(name)) {
        if (!fs->existFile(path.c_str())) {
            continue;
        }
        irr::scene::IAnimatedMesh* mesh = smgr_->getMesh(path.c_str());
        if (!mesh) {
            LOG_WARN(MOD_ASSET, "Failed to parse avatar mesh {}, trying next candidate", path);
            continue;
        }
        asset->model = createTemplateNode(mesh, name);
        if (asset->model) {
            asset->sourcePath = path;
            break;
        }
    }

    if (!asset->model) {
        LOG_ERROR(MOD_ASSET, "No loadable model for avatar '{}' in {}", name, assetDir_);
        return nullptr;
    }

    const std::string sidecar = clipSidecarPath(name);
    if (fs->existFile(sidecar.c_str())) {
        if (!animation::ClipJsonLoader::loadFromFile(sidecar, asset->clips)) {
            LOG_WARN(MOD_ASSET, "Avatar '{}' clips unreadable, continuing without animation", name);
            asset->clips.clear();
        }
    } else {
        LOG_DEBUG(MOD_ASSET, "Avatar '{}' has no clip sidecar {}", name, sidecar);
    }

    LOG_INFO(MOD_ASSET, "Loaded avatar '{}' from {} ({} clips)", name, asset->sourcePath, asset->clips.size());
    cache_.emplace(name, asset);
    return asset;
}

void AvatarLoader::clear() {
    for (auto& entry : cache_) {
        if (entry.second->model) {
            entry.second->model->remove();
        }
    }
    cache_.clear();
}

} // namespace graphics
} // namespace avr
