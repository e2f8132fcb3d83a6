#include <gtest/gtest.h>
#include "nms.hpp"

namespace {

Detection det(float l, float t, float r, float b, float conf, int cls = 0) {
    Detection d;
    d.box = {l, t, r, b};
    d.confidence = conf;
    d.class_id = cls;
    d.label = "c" + std::to_string(cls);
    return d;
}

}  // namespace

TEST(IouTest, IdenticalBoxesIsOne) {
    Box a{10, 10, 50, 40};
    EXPECT_FLOAT_EQ(iou(a, a), 1.0f);
}

TEST(IouTest, DisjointBoxesIsZero) {
    EXPECT_FLOAT_EQ(iou(Box{0, 0, 10, 10}, Box{20, 20, 30, 30}), 0.0f);
    // Touching edges share no area
    EXPECT_FLOAT_EQ(iou(Box{0, 0, 10, 10}, Box{10, 0, 20, 10}), 0.0f);
}

TEST(IouTest, IsSymmetric) {
    Box a{0, 0, 10, 10};
    Box b{5, 5, 15, 20};
    EXPECT_FLOAT_EQ(iou(a, b), iou(b, a));
}

TEST(IouTest, PartialOverlap) {
    // Intersection 5x10 = 50, union 100 + 100 - 50 = 150
    EXPECT_NEAR(iou(Box{0, 0, 10, 10}, Box{5, 0, 15, 10}), 50.0f / 150.0f, 1e-6);
}

TEST(IouTest, ZeroAreaBoxes) {
    EXPECT_FLOAT_EQ(iou(Box{5, 5, 5, 5}, Box{5, 5, 5, 5}), 0.0f);
}

TEST(NmsTest, EmptyInput) {
    EXPECT_TRUE(apply_nms({}).empty());
}

TEST(NmsTest, SuppressesOverlappingLowerConfidence) {
    std::vector<Detection> in = {
        det(0, 0, 100, 100, 0.7f),
        det(5, 5, 105, 105, 0.9f),
        det(300, 300, 350, 350, 0.5f),
    };
    auto out = apply_nms(in, 0.4f);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0].confidence, 0.9f);
    EXPECT_FLOAT_EQ(out[1].confidence, 0.5f);
}

TEST(NmsTest, SuppressionIgnoresClass) {
    std::vector<Detection> in = {
        det(0, 0, 100, 100, 0.8f, 0),
        det(2, 2, 100, 100, 0.6f, 2),
    };
    auto out = apply_nms(in, 0.4f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].class_id, 0);
}

TEST(NmsTest, OverlapAtThresholdIsKept) {
    // IoU exactly 50/150 stays when the threshold equals it
    std::vector<Detection> in = {
        det(0, 0, 10, 10, 0.9f),
        det(5, 0, 15, 10, 0.8f),
    };
    EXPECT_EQ(apply_nms(in, 50.0f / 150.0f + 1e-4f).size(), 2u);
    EXPECT_EQ(apply_nms(in, 0.3f).size(), 1u);
}

TEST(NmsTest, OutputSortedByConfidence) {
    std::vector<Detection> in = {
        det(0, 0, 10, 10, 0.5f),
        det(100, 0, 110, 10, 0.9f),
        det(200, 0, 210, 10, 0.7f),
    };
    auto out = apply_nms(in);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0].confidence, 0.9f);
    EXPECT_FLOAT_EQ(out[1].confidence, 0.7f);
    EXPECT_FLOAT_EQ(out[2].confidence, 0.5f);
}

TEST(NmsTest, Idempotent) {
    std::vector<Detection> in = {
        det(0, 0, 100, 100, 0.9f),
        det(10, 10, 110, 110, 0.9f),
        det(50, 50, 150, 150, 0.6f),
        det(60, 0, 160, 90, 0.6f),
        det(400, 400, 420, 420, 0.55f),
        det(405, 405, 425, 425, 0.8f),
    };
    auto once = apply_nms(in);
    auto twice = apply_nms(once);
    EXPECT_EQ(once, twice);
}
