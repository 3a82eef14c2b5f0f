#include <gtest/gtest.h>
#include <irrlicht.h>

#include "avr/graphics/transform_synchronizer.h"
#include "avr/state/event_bus.h"

using namespace avr::graphics;
using namespace avr::state;
using Clock = TransformSynchronizer::Clock;

class TransformSynchronizerTest : public ::testing::Test {
protected:
    irr::IrrlichtDevice* device_ = nullptr;
    irr::scene::ISceneManager* smgr_ = nullptr;
    EventBus bus_;
    std::vector<TransformSnapshotData> snapshots_;

    void SetUp() override {
        irr::SIrrlichtCreationParameters params;
        params.DriverType = irr::video::EDT_NULL;
        params.WindowSize = irr::core::dimension2d<irr::u32>(100, 100);

        device_ = irr::createDeviceEx(params);
        if (!device_) {
            GTEST_SKIP() << "Failed to create Irrlicht device";
        }
        smgr_ = device_->getSceneManager();

        bus_.subscribe(AvatarEventType::TransformSnapshot, [this](const AvatarEvent& event) {
            snapshots_.push_back(std::get<TransformSnapshotData>(event.data));
        });
    }

    void TearDown() override {
        if (device_) {
            device_->drop();
            device_ = nullptr;
        }
    }

    static MovementState at(float x, float z, float yaw) {
        MovementState state;
        state.position = glm::vec3(x, 0.0f, z);
        state.rotation = glm::vec3(0.0f, yaw, 0.0f);
        state.isMoving = true;
        return state;
    }
};

TEST_F(TransformSynchronizerTest, NoTarget_Defers) {
    TransformSynchronizer sync("hero", 0.1f, &bus_);
    EXPECT_EQ(sync.sync(at(1.0f, 2.0f, 0.0f)), SyncResult::Deferred);
    EXPECT_TRUE(sync.retryPending());
    EXPECT_EQ(sync.appliedCount(), 0u);
    EXPECT_TRUE(snapshots_.empty());
}

TEST_F(TransformSynchronizerTest, Deferred_RecoversWhenTargetAppears) {
    TransformSynchronizer sync("hero", 0.1f, &bus_);
    sync.sync(at(1.0f, 2.0f, 0.0f));

    irr::scene::ISceneNode* node = smgr_->addEmptySceneNode();
    sync.setTarget(node);
    EXPECT_EQ(sync.sync(at(1.0f, 2.0f, 0.0f)), SyncResult::Applied);
    EXPECT_FALSE(sync.retryPending());
    EXPECT_EQ(node->getPosition(), irr::core::vector3df(1.0f, 0.0f, 2.0f));
}

TEST_F(TransformSynchronizerTest, WritesPositionAndYawDegrees) {
    irr::scene::ISceneNode* node = smgr_->addEmptySceneNode();
    TransformSynchronizer sync("hero");
    sync.setTarget(node);

    sync.sync(at(-3.0f, 4.5f, irr::core::PI / 2.0f));
    EXPECT_NEAR(node->getPosition().X, -3.0f, 1e-5f);
    EXPECT_NEAR(node->getPosition().Z, 4.5f, 1e-5f);
    EXPECT_NEAR(node->getRotation().Y, 90.0f, 1e-3f);
    EXPECT_NEAR(node->getAbsolutePosition().X, -3.0f, 1e-5f);
}

TEST_F(TransformSynchronizerTest, OverwritesExternalEdits) {
    irr::scene::ISceneNode* node = smgr_->addEmptySceneNode();
    TransformSynchronizer sync("hero");
    sync.setTarget(node);

    node->setPosition(irr::core::vector3df(100.0f, 0.0f, 100.0f));
    sync.sync(at(1.0f, 1.0f, 0.0f));
    EXPECT_EQ(node->getPosition(), irr::core::vector3df(1.0f, 0.0f, 1.0f));
    EXPECT_EQ(sync.appliedCount(), 1u);
}

TEST_F(TransformSynchronizerTest, Snapshots_AreThrottled) {
    irr::scene::ISceneNode* node = smgr_->addEmptySceneNode();
    TransformSynchronizer sync("hero", 0.1f, &bus_);
    sync.setTarget(node);
    sync.setAvatarHeight(1.8f);

    Clock::time_point start = Clock::now();
    sync.sync(at(0.0f, 0.0f, 0.0f), start);
    sync.sync(at(0.0f, -0.1f, 0.0f), start + std::chrono::milliseconds(50));
    sync.sync(at(0.0f, -0.2f, 0.0f), start + std::chrono::milliseconds(100));
    sync.sync(at(0.0f, -0.3f, 0.0f), start + std::chrono::milliseconds(101));

    EXPECT_EQ(sync.appliedCount(), 4u);
    ASSERT_EQ(snapshots_.size(), 2u);
    EXPECT_EQ(sync.snapshotCount(), 2u);
    EXPECT_NEAR(snapshots_[0].clock, 0.0, 1e-9);
    EXPECT_NEAR(snapshots_[1].clock, 0.101, 1e-6);
    EXPECT_NEAR(snapshots_[1].localPosition.z, -0.3f, 1e-5f);
    EXPECT_FLOAT_EQ(snapshots_[1].avatarHeight, 1.8f);
    EXPECT_EQ(snapshots_[1].avatarId, "hero");
}

TEST_F(TransformSynchronizerTest, Snapshot_ReportsWorldPosition) {
    irr::scene::ISceneNode* world = smgr_->addEmptySceneNode();
    world->setPosition(irr::core::vector3df(10.0f, 0.0f, 0.0f));
    world->updateAbsolutePosition();
    irr::scene::ISceneNode* node = smgr_->addEmptySceneNode(world);

    TransformSynchronizer sync("hero", 0.1f, &bus_);
    sync.setTarget(node);
    sync.sync(at(1.0f, 0.0f, 0.0f));

    ASSERT_EQ(snapshots_.size(), 1u);
    EXPECT_NEAR(snapshots_[0].localPosition.x, 1.0f, 1e-5f);
    EXPECT_NEAR(snapshots_[0].worldPosition.x, 11.0f, 1e-5f);
    EXPECT_LT(snapshots_[0].avatarHeight, 0.0f);
}

TEST_F(TransformSynchronizerTest, ClearTarget_StopsWrites) {
    irr::scene::ISceneNode* node = smgr_->addEmptySceneNode();
    TransformSynchronizer sync("hero");
    sync.setTarget(node);
    sync.sync(at(1.0f, 0.0f, 0.0f));

    sync.clearTarget();
    EXPECT_EQ(sync.target(), nullptr);
    EXPECT_EQ(sync.sync(at(5.0f, 0.0f, 0.0f)), SyncResult::Deferred);
    EXPECT_NEAR(node->getPosition().X, 1.0f, 1e-5f);
}
