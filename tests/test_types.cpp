#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "class_names.hpp"
#include "inference_scheduler.hpp"
#include "types.hpp"

TEST(BoxTest, Geometry) {
    Box b{10, 20, 50, 80};
    EXPECT_FLOAT_EQ(b.width(), 40.0f);
    EXPECT_FLOAT_EQ(b.height(), 60.0f);
    EXPECT_FLOAT_EQ(b.area(), 2400.0f);
    EXPECT_TRUE(b.valid());
    EXPECT_FALSE((Box{10, 20, 10, 80}).valid());
    EXPECT_FALSE((Box{10, 80, 50, 20}).valid());
}

TEST(DetectionSetTest, DefaultsEmpty) {
    DetectionSet set;
    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set.image_width, 0);
    EXPECT_EQ(set.frame_id, 0u);
}

TEST(RgbImageTest, EmptyUntilFilled) {
    RgbImage img;
    EXPECT_TRUE(img.empty());
    img.width = 2;
    img.height = 2;
    img.pixels.assign(12, 0);
    EXPECT_FALSE(img.empty());
}

TEST(FrameBoundaryTest, MatchesMultipartMarker) {
    EXPECT_STREQ(kFrameBoundary, "--frame\r\nContent-Type: image/jpeg\r\n\r\n");
    EXPECT_EQ(kMinPayloadBytes, 500u);
    EXPECT_EQ(kMaxStreamBufferBytes, 3u * 1024u * 1024u);
}

class LabelMapTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path.empty()) std::filesystem::remove(path);
    }

    std::filesystem::path path;
};

TEST_F(LabelMapTest, CocoDefaults) {
    LabelMap labels;
    EXPECT_EQ(labels.size(), 80u);
    EXPECT_EQ(labels.label(0), "person");
    EXPECT_EQ(labels.label(2), "car");
    EXPECT_EQ(labels.label(79), "toothbrush");
    EXPECT_EQ(labels.label(80), "ClassID 80");
    EXPECT_EQ(labels.label(-1), "ClassID -1");
    EXPECT_FALSE(labels.contains(80));
}

TEST_F(LabelMapTest, FromFile) {
    path = std::filesystem::temp_directory_path() / "rovereye_labels.txt";
    {
        std::ofstream f(path);
        f << "cone\r\n\nrover\n";
    }
    LabelMap labels = LabelMap::fromFile(path.string());
    EXPECT_EQ(labels.size(), 3u);
    EXPECT_EQ(labels.label(0), "cone");
    // Blank lines keep their id but have no name
    EXPECT_EQ(labels.label(1), "ClassID 1");
    EXPECT_EQ(labels.label(2), "rover");
}

TEST_F(LabelMapTest, MissingFileThrows) {
    EXPECT_THROW(LabelMap::fromFile("/nonexistent/labels.txt"), std::runtime_error);
}

TEST(SchedulerStateTest, Names) {
    EXPECT_STREQ(to_string(SchedulerState::Idle), "idle");
    EXPECT_STREQ(to_string(SchedulerState::Busy), "busy");
    EXPECT_STREQ(to_string(SchedulerState::Cooling), "cooling");
}
