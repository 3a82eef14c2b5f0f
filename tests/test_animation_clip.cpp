#include <gtest/gtest.h>
#include "avr/animation/animation_clip.h"
#include "avr/animation/clip_json_loader.h"

#include <cmath>
#include <cstdio>
#include <fstream>

using namespace avr::animation;

class AnimationClipTest : public ::testing::Test {
protected:
    static TrackPtr positionTrack() {
        return std::make_shared<KeyframeTrack>("Hips.position",
            std::vector<float>{0.0f, 1.0f},
            std::vector<float>{0.0f, 0.0f, 0.0f, 2.0f, 4.0f, -6.0f});
    }

    static TrackPtr rotationTrack() {
        // identity to 90 degrees about Y, stored x, y, z, w
        const float s = std::sqrt(0.5f);
        return std::make_shared<KeyframeTrack>("Spine.quaternion",
            std::vector<float>{0.0f, 2.0f},
            std::vector<float>{0.0f, 0.0f, 0.0f, 1.0f, 0.0f, s, 0.0f, s});
    }
};

// =============================================================================
// Track Tests
// =============================================================================

TEST_F(AnimationClipTest, PropertyFromName) {
    EXPECT_EQ(KeyframeTrack::propertyFromName("Hips.position"), TrackProperty::Translation);
    EXPECT_EQ(KeyframeTrack::propertyFromName("mixamorig:Hips.quaternion"), TrackProperty::Rotation);
    EXPECT_EQ(KeyframeTrack::propertyFromName("Hips.scale"), TrackProperty::Scale);
    EXPECT_EQ(KeyframeTrack::propertyFromName("Face.morphTargetInfluences"), TrackProperty::Other);
    EXPECT_EQ(KeyframeTrack::propertyFromName("position"), TrackProperty::Other);
}

TEST_F(AnimationClipTest, Track_SplitsNodeName) {
    TrackPtr track = positionTrack();
    EXPECT_EQ(track->nodeName(), "Hips");
    EXPECT_EQ(track->keyCount(), 2u);
    EXPECT_EQ(track->valueSize(), 3u);
    EXPECT_FLOAT_EQ(track->endTime(), 1.0f);
}

TEST_F(AnimationClipTest, SampleVec3_InterpolatesAndClamps) {
    TrackPtr track = positionTrack();

    glm::vec3 mid = track->sampleVec3(0.5f);
    EXPECT_FLOAT_EQ(mid.x, 1.0f);
    EXPECT_FLOAT_EQ(mid.y, 2.0f);
    EXPECT_FLOAT_EQ(mid.z, -3.0f);

    EXPECT_FLOAT_EQ(track->sampleVec3(-1.0f).x, 0.0f);
    EXPECT_FLOAT_EQ(track->sampleVec3(5.0f).x, 2.0f);
}

TEST_F(AnimationClipTest, SampleQuat_Slerps) {
    TrackPtr track = rotationTrack();

    glm::quat start = track->sampleQuat(0.0f);
    EXPECT_NEAR(start.w, 1.0f, 1e-5f);

    // halfway is 45 degrees about Y
    glm::quat mid = track->sampleQuat(1.0f);
    EXPECT_NEAR(mid.w, std::cos(glm::radians(22.5f)), 1e-4f);
    EXPECT_NEAR(mid.y, std::sin(glm::radians(22.5f)), 1e-4f);
    EXPECT_NEAR(mid.x, 0.0f, 1e-5f);
}

TEST_F(AnimationClipTest, Clip_CountsTracksAndDuration) {
    AnimationClip clip;
    clip.name = "Walk";
    clip.tracks = {positionTrack(), rotationTrack()};

    EXPECT_EQ(clip.countTracks(TrackProperty::Translation), 1u);
    EXPECT_EQ(clip.countTracks(TrackProperty::Rotation), 1u);
    EXPECT_EQ(clip.countTracks(TrackProperty::Scale), 0u);
    EXPECT_FLOAT_EQ(AnimationClip::computeDuration(clip.tracks), 2.0f);
    EXPECT_FLOAT_EQ(AnimationClip::computeDuration({}), 0.0f);
}

// =============================================================================
// JSON Loader Tests
// =============================================================================

TEST_F(AnimationClipTest, LoadFromString_ParsesClips) {
    const char* json = R"({
        "clips": [
            { "name": "Idle", "duration": 3.0,
              "tracks": [ { "name": "Hips.quaternion", "times": [0, 1],
                            "values": [0, 0, 0, 1, 0, 0, 0, 1] } ] },
            { "name": "Walk",
              "tracks": [ { "name": "Hips.position", "times": [0, 0.5, 1.25],
                            "values": [0, 0, 0, 0, 0, 1, 0, 0, 2] } ] }
        ]
    })";

    ClipList clips;
    ASSERT_TRUE(ClipJsonLoader::loadFromString(json, clips));
    ASSERT_EQ(clips.size(), 2u);
    EXPECT_EQ(clips[0]->name, "Idle");
    EXPECT_FLOAT_EQ(clips[0]->duration, 3.0f);
    EXPECT_EQ(clips[1]->name, "Walk");
    EXPECT_FLOAT_EQ(clips[1]->duration, 1.25f);  // from the track end
    EXPECT_EQ(clips[1]->countTracks(TrackProperty::Translation), 1u);
}

TEST_F(AnimationClipTest, LoadFromString_SkipsBadEntries) {
    const char* json = R"({
        "clips": [
            { "duration": 1.0 },
            { "name": "Run",
              "tracks": [ { "name": "Hips.position", "times": [0, 1], "values": [0, 0] },
                          { "name": "", "times": [0], "values": [0, 0, 0] },
                          { "name": "Spine.scale", "times": [0], "values": [1, 1, 1] } ] }
        ]
    })";

    ClipList clips;
    ASSERT_TRUE(ClipJsonLoader::loadFromString(json, clips));
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0]->name, "Run");
    ASSERT_EQ(clips[0]->tracks.size(), 1u);
    EXPECT_EQ(clips[0]->tracks[0]->name(), "Spine.scale");
}

TEST_F(AnimationClipTest, LoadFromString_SkipsWrongTypedTracks) {
    const char* json = R"({
        "clips": [
            "Loose",
            { "name": "Idle",
              "tracks": [ "Hips.quaternion",
                          { "name": "Hips.scale", "times": ["0", "1"], "values": [1, 1, 1, 1, 1, 1] },
                          { "name": "Spine.scale", "times": [0], "values": [1, "one", 1] },
                          { "name": 7, "times": [0], "values": [1, 1, 1] },
                          { "name": "Head.scale", "times": [0], "values": [1, 1, 1] } ] },
            { "name": "Walk", "tracks": { "name": "Hips.position" } }
        ]
    })";

    ClipList clips;
    ASSERT_TRUE(ClipJsonLoader::loadFromString(json, clips));
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0]->name, "Idle");
    ASSERT_EQ(clips[0]->tracks.size(), 1u);
    EXPECT_EQ(clips[0]->tracks[0]->name(), "Head.scale");
}

TEST_F(AnimationClipTest, LoadFromString_NonObjectRoot) {
    ClipList clips;
    EXPECT_FALSE(ClipJsonLoader::loadFromString("[1, 2, 3]", clips));
    EXPECT_FALSE(ClipJsonLoader::loadFromString("\"clips\"", clips));
    EXPECT_FALSE(ClipJsonLoader::loadFromString(R"({"clips": {"name": "Idle"}})", clips));
    EXPECT_TRUE(clips.empty());
}

TEST_F(AnimationClipTest, LoadFromString_RejectsMalformed) {
    ClipList clips;
    EXPECT_FALSE(ClipJsonLoader::loadFromString("{ not json", clips));
    EXPECT_FALSE(ClipJsonLoader::loadFromString(R"({"animations": []})", clips));
    EXPECT_TRUE(clips.empty());
}

TEST_F(AnimationClipTest, LoadFromFile) {
    const std::string path = "test_clips_sidecar.clips.json";
    {
        std::ofstream out(path);
        out << R"({"clips": [{"name": "TPose", "tracks": []}]})";
    }

    ClipList clips;
    EXPECT_TRUE(ClipJsonLoader::loadFromFile(path, clips));
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0]->name, "TPose");
    EXPECT_FLOAT_EQ(clips[0]->duration, 0.0f);
    std::remove(path.c_str());

    ClipList missing;
    EXPECT_FALSE(ClipJsonLoader::loadFromFile("does_not_exist.clips.json", missing));
}
