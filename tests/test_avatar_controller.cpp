/**
 * Tests for the avatar controller lifecycle
 *
 * The template model is an empty "Armature" node with a 1x9x1 cube child,
 * so a 1.8 target height gives a container scale of 0.2.
 */

#include <gtest/gtest.h>
#include <irrlicht.h>

#include <functional>
#include <memory>

#include "avr/animation/root_motion_stripper.h"
#include "avr/avatar/instance_registry.h"
#include "avr/graphics/avatar_controller.h"
#include "avr/graphics/model_normalizer.h"
#include "avr/state/event_bus.h"

using namespace avr::graphics;
using namespace avr::state;
using avr::AvatarError;
using avr::animation::AnimationClip;
using avr::animation::KeyframeTrack;
using avr::avatar::AvatarConfig;
using avr::avatar::InstanceRegistry;

class AvatarControllerTest : public ::testing::Test {
protected:
    irr::IrrlichtDevice* device_ = nullptr;
    irr::scene::ISceneManager* smgr_ = nullptr;
    irr::scene::ISceneNode* world_ = nullptr;

    EventBus bus_;
    std::vector<AvatarEvent> events_;
    std::unique_ptr<InstanceRegistry> registry_;
    std::unique_ptr<ModelNormalizer> normalizer_;
    std::unique_ptr<avr::animation::RootMotionStripper> stripper_;
    AvatarConfig config_;
    ControllerContext context_;
    std::shared_ptr<AvatarAsset> asset_;

    void SetUp() override {
        irr::SIrrlichtCreationParameters params;
        params.DriverType = irr::video::EDT_NULL;
        params.WindowSize = irr::core::dimension2d<irr::u32>(100, 100);

        device_ = irr::createDeviceEx(params);
        if (!device_) {
            GTEST_SKIP() << "Failed to create Irrlicht device";
        }
        smgr_ = device_->getSceneManager();
        world_ = smgr_->addEmptySceneNode();
        world_->setName("World");

        bus_.subscribe([this](const AvatarEvent& event) { events_.push_back(event); });
        registry_ = std::make_unique<InstanceRegistry>(&bus_);
        normalizer_ = std::make_unique<ModelNormalizer>(smgr_, &bus_);
        stripper_ = std::make_unique<avr::animation::RootMotionStripper>(&bus_);

        context_.smgr = smgr_;
        context_.registry = registry_.get();
        context_.normalizer = normalizer_.get();
        context_.stripper = stripper_.get();
        context_.eventBus = &bus_;

        asset_ = makeAsset();
    }

    void TearDown() override {
        if (device_) {
            device_->drop();
            device_ = nullptr;
        }
    }

    std::shared_ptr<AvatarAsset> makeAsset() {
        auto asset = std::make_shared<AvatarAsset>();
        asset->id = "hero";
        asset->model = smgr_->addEmptySceneNode();
        asset->model->setName("Armature");
        irr::scene::ISceneNode* body = smgr_->addCubeSceneNode(1.0f, asset->model, -1,
            irr::core::vector3df(0.0f), irr::core::vector3df(0.0f), irr::core::vector3df(1.0f, 9.0f, 1.0f));
        body->setName("Hips");
        asset->model->setVisible(false);

        asset->clips.push_back(clip("Idle"));
        asset->clips.push_back(clip("Walk"));
        asset->clips.push_back(clip("Run"));
        return asset;
    }

    // Root-motion clip: Hips drifts forward and has a rotation track
    static avr::animation::ClipPtr clip(const std::string& name) {
        auto result = std::make_shared<AnimationClip>();
        result->name = name;
        result->duration = 1.0f;
        result->tracks.push_back(std::make_shared<KeyframeTrack>("Hips.position",
            std::vector<float>{0.0f, 1.0f}, std::vector<float>{0, 0, 0, 0, 0, -5}));
        result->tracks.push_back(std::make_shared<KeyframeTrack>("Hips.quaternion",
            std::vector<float>{0.0f}, std::vector<float>{0, 0, 0, 1}));
        return result;
    }

    size_t countEvents(AvatarEventType type) const {
        size_t count = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                ++count;
            }
        }
        return count;
    }

    std::unique_ptr<AvatarController> makeController() {
        return std::make_unique<AvatarController>("hero", asset_, config_, context_);
    }
};

// =============================================================================
// Construction / Ownership
// =============================================================================

TEST_F(AvatarControllerTest, FirstController_OwnsAvatar) {
    auto controller = makeController();
    EXPECT_TRUE(controller->isOwner());
    EXPECT_EQ(controller->getState(), ControllerState::Unattached);
    EXPECT_EQ(registry_->ownerOf("hero"), controller->instanceId());
}

TEST_F(AvatarControllerTest, Duplicate_StaysInert) {
    auto primary = makeController();
    auto duplicate = makeController();

    EXPECT_FALSE(duplicate->isOwner());
    EXPECT_EQ(duplicate->lastError(), AvatarError::DuplicateInstance);
    EXPECT_NE(primary->instanceId(), duplicate->instanceId());

    EXPECT_FALSE(duplicate->attach(world_));
    EXPECT_EQ(duplicate->container(), nullptr);
    EXPECT_FALSE(duplicate->onKeyDown("KeyW"));
    MovementState state = duplicate->tick(0.016f);
    EXPECT_FALSE(state.isMoving);
    EXPECT_EQ(state.position, glm::vec3(0.0f));

    // The duplicate's teardown must not free the primary's slot
    duplicate.reset();
    EXPECT_EQ(registry_->ownerOf("hero"), primary->instanceId());
}

TEST_F(AvatarControllerTest, Teardown_ReleasesForNextInstance) {
    auto first = makeController();
    ASSERT_TRUE(first->attach(world_));
    first->teardown();
    EXPECT_EQ(first->getState(), ControllerState::TornDown);
    EXPECT_FALSE(registry_->isOwned("hero"));
    EXPECT_EQ(first->container(), nullptr);
    EXPECT_EQ(normalizer_->cacheSize(), 0u);

    // idempotent
    first->teardown();
    EXPECT_FALSE(first->attach(world_));

    auto second = makeController();
    EXPECT_TRUE(second->isOwner());
    EXPECT_TRUE(second->attach(world_));
}

TEST_F(AvatarControllerTest, Teardown_EvictsStrippedClips) {
    auto first = makeController();
    ASSERT_TRUE(first->attach(world_));
    EXPECT_TRUE(stripper_->hasCached("hero"));
    first->teardown();
    EXPECT_FALSE(stripper_->hasCached("hero"));

    // Remount the same avatar id with a new clip set
    auto replacement = makeAsset();
    replacement->clips.clear();
    replacement->clips.push_back(clip("Breathe_Idle"));
    replacement->clips.push_back(clip("Jog"));

    auto second = std::make_unique<AvatarController>("hero", nullptr, config_, context_);
    second->setAsset(replacement);
    ASSERT_TRUE(second->attach(world_));

    const auto& clips = second->selector().clips();
    ASSERT_EQ(clips.size(), 2u);
    EXPECT_EQ(clips[0]->name, "Breathe_Idle");
    EXPECT_EQ(clips[1]->name, "Jog");
    EXPECT_EQ(clips[1]->countTracks(avr::animation::TrackProperty::Translation), 0u);
}

// =============================================================================
// Attach
// =============================================================================

TEST_F(AvatarControllerTest, AttachWithoutSceneNode_CanRetry) {
    auto controller = makeController();
    EXPECT_FALSE(controller->attach(nullptr));
    EXPECT_EQ(controller->lastError(), AvatarError::MissingSceneNode);
    EXPECT_EQ(controller->getState(), ControllerState::Unattached);

    EXPECT_TRUE(controller->attach(world_));
    EXPECT_EQ(controller->getState(), ControllerState::Attached);
}

TEST_F(AvatarControllerTest, Attach_NormalizesAndStartsIdle) {
    auto controller = makeController();
    ASSERT_TRUE(controller->attach(world_));

    irr::scene::ISceneNode* container = controller->container();
    ASSERT_NE(container, nullptr);
    EXPECT_EQ(container->getParent(), world_);
    EXPECT_NEAR(container->getScale().Y, 0.2f, 1e-5f);
    EXPECT_EQ(controller->selector().currentClip(), "Idle");
    EXPECT_EQ(controller->selector().clips().size(), 3u);

    // The template stays hidden and untouched
    EXPECT_FALSE(asset_->model->isVisible());
    EXPECT_EQ(asset_->model->getParent(), smgr_->getRootSceneNode());

    EXPECT_EQ(countEvents(AvatarEventType::ContainerCreated), 1u);
    EXPECT_EQ(countEvents(AvatarEventType::ClipsStripped), 1u);
    EXPECT_EQ(countEvents(AvatarEventType::AnimationChanged), 1u);
}

TEST_F(AvatarControllerTest, Attach_StripsRootMotion) {
    auto controller = makeController();
    ASSERT_TRUE(controller->attach(world_));

    for (const auto& clip : controller->selector().clips()) {
        EXPECT_EQ(clip->countTracks(avr::animation::TrackProperty::Translation), 0u);
        EXPECT_EQ(clip->countTracks(avr::animation::TrackProperty::Rotation), 1u);
    }
    EXPECT_EQ(asset_->clips[0]->countTracks(avr::animation::TrackProperty::Translation), 1u);
}

TEST_F(AvatarControllerTest, Attach_IsIdempotent) {
    auto controller = makeController();
    ASSERT_TRUE(controller->attach(world_));
    irr::scene::ISceneNode* container = controller->container();

    EXPECT_TRUE(controller->attach(world_));
    EXPECT_EQ(controller->container(), container);
    EXPECT_EQ(countEvents(AvatarEventType::ContainerCreated), 1u);

    irr::scene::ISceneNode* other = smgr_->addEmptySceneNode();
    EXPECT_TRUE(controller->attach(other));
    EXPECT_EQ(container->getParent(), other);
}

TEST_F(AvatarControllerTest, WorldScale_MultipliesNormalizedScale) {
    config_.worldScale = 10.0f;
    auto controller = makeController();
    ASSERT_TRUE(controller->attach(world_));
    EXPECT_NEAR(controller->container()->getScale().X, 2.0f, 1e-4f);
}

TEST_F(AvatarControllerTest, MissingModel_ReportsAndRecovers) {
    auto controller = std::make_unique<AvatarController>("hero", nullptr, config_, context_);
    EXPECT_FALSE(controller->attach(world_));
    EXPECT_EQ(controller->lastError(), AvatarError::MissingModel);

    ASSERT_EQ(countEvents(AvatarEventType::SetupFailed), 1u);
    for (const auto& event : events_) {
        if (event.type == AvatarEventType::SetupFailed) {
            EXPECT_EQ(std::get<SetupFailedData>(event.data).reason, "no_avatar_model");
        }
    }

    controller->setAsset(asset_);
    EXPECT_TRUE(controller->attach(world_));
}

// =============================================================================
// Tick
// =============================================================================

TEST_F(AvatarControllerTest, Tick_MovesContainerAndSwitchesClip) {
    auto controller = makeController();
    ASSERT_TRUE(controller->attach(world_));

    EXPECT_TRUE(controller->onKeyDown("KeyW"));
    MovementState state = controller->tick(0.016f);

    EXPECT_NEAR(state.position.z, -0.192f, 1e-5f);
    EXPECT_NEAR(controller->container()->getPosition().Z, -0.192f, 1e-5f);
    EXPECT_EQ(controller->selector().currentClip(), "Walk");

    controller->onKeyDown("ShiftLeft");
    controller->tick(0.016f);
    EXPECT_EQ(controller->selector().currentClip(), "Run");

    controller->onKeyUp("KeyW");
    controller->tick(0.016f);
    EXPECT_EQ(controller->selector().currentClip(), "Idle");
}

TEST_F(AvatarControllerTest, Tick_StrippedClipsDoNotDriftTheModel) {
    auto controller = makeController();
    ASSERT_TRUE(controller->attach(world_));

    irr::scene::ISceneNode* hips = nullptr;
    std::function<void(irr::scene::ISceneNode*)> find = [&](irr::scene::ISceneNode* node) {
        if (std::string(node->getName()) == "Hips") {
            hips = node;
        }
        const irr::core::list<irr::scene::ISceneNode*>& children = node->getChildren();
        for (auto it = children.begin(); it != children.end(); ++it) {
            find(*it);
        }
    };
    find(controller->container());
    ASSERT_NE(hips, nullptr);
    irr::core::vector3df rest = hips->getPosition();

    controller->onKeyDown("KeyW");
    for (int i = 0; i < 30; ++i) {
        controller->tick(0.016f);
    }
    EXPECT_EQ(hips->getPosition(), rest);
}

TEST_F(AvatarControllerTest, Tick_BeforeAttachStillIntegrates) {
    auto controller = makeController();
    controller->onKeyDown("KeyD");
    MovementState state = controller->tick(0.016f);
    EXPECT_TRUE(state.isMoving);
    EXPECT_GT(state.position.x, 0.0f);
    EXPECT_TRUE(controller->synchronizer().retryPending());

    ASSERT_TRUE(controller->attach(world_));
    EXPECT_NEAR(controller->container()->getPosition().X, state.position.x, 1e-5f);
}

TEST_F(AvatarControllerTest, MovementEvents_OnlyOnChange) {
    auto controller = makeController();
    ASSERT_TRUE(controller->attach(world_));

    controller->tick(0.016f);
    controller->tick(0.016f);
    controller->tick(0.016f);
    EXPECT_EQ(countEvents(AvatarEventType::MovementUpdated), 1u);

    controller->onKeyDown("KeyW");
    controller->tick(0.016f);
    controller->tick(0.016f);
    EXPECT_EQ(countEvents(AvatarEventType::MovementUpdated), 3u);
    EXPECT_EQ(countEvents(AvatarEventType::KeyStateChanged), 1u);
}

TEST_F(AvatarControllerTest, ClearKeys_StopsMovement) {
    auto controller = makeController();
    controller->onKeyDown("KeyW");
    controller->clearKeys();
    EXPECT_FALSE(controller->tick(0.016f).isMoving);
}

TEST_F(AvatarControllerTest, Destructor_TearsDown) {
    {
        auto controller = makeController();
        ASSERT_TRUE(controller->attach(world_));
    }
    EXPECT_FALSE(registry_->isOwned("hero"));
    // Cloned nodes went with the container
    EXPECT_TRUE(world_->getChildren().empty());
}

TEST(ControllerStateTest, Names) {
    EXPECT_STREQ(controllerStateName(ControllerState::Unattached), "unattached");
    EXPECT_STREQ(controllerStateName(ControllerState::Attached), "attached");
    EXPECT_STREQ(controllerStateName(ControllerState::TornDown), "torn_down");
}
