#include <gtest/gtest.h>
#include "avr/common/util/strings.h"

using avr::Strings;

class StringsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StringsTest, ToLower) {
    EXPECT_EQ(Strings::ToLower("HELLO"), "hello");
    EXPECT_EQ(Strings::ToLower("Walk_Forward"), "walk_forward");
    EXPECT_EQ(Strings::ToLower(""), "");
    EXPECT_EQ(Strings::ToLower("123"), "123");
}

TEST_F(StringsTest, ContainsLower_IgnoresCase) {
    EXPECT_TRUE(Strings::ContainsLower("Armature|RUN", "run"));
    EXPECT_TRUE(Strings::ContainsLower("idle", "IDLE"));
    EXPECT_FALSE(Strings::ContainsLower("Walk", "run"));
}

TEST_F(StringsTest, ContainsAnyLower) {
    std::vector<std::string> tags = {"walk", "move", "locomotion"};
    EXPECT_TRUE(Strings::ContainsAnyLower("Slow_Locomotion", tags));
    EXPECT_TRUE(Strings::ContainsAnyLower("WALK", tags));
    EXPECT_FALSE(Strings::ContainsAnyLower("Idle", tags));
    EXPECT_FALSE(Strings::ContainsAnyLower("Idle", {}));
}

TEST_F(StringsTest, ContainsAnyLower_SkipsEmptyTags) {
    EXPECT_FALSE(Strings::ContainsAnyLower("Idle", {""}));
}

TEST_F(StringsTest, EndsWith) {
    EXPECT_TRUE(Strings::EndsWith("hero.clips.json", ".clips.json"));
    EXPECT_TRUE(Strings::EndsWith("test", "test"));
    EXPECT_TRUE(Strings::EndsWith("abc", ""));
    EXPECT_FALSE(Strings::EndsWith("hero.b3d", ".x"));
    EXPECT_FALSE(Strings::EndsWith("", "test"));
}
