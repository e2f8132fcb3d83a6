#include <gtest/gtest.h>
#include "detector.hpp"
#include "test_fakes.hpp"

class ObjectDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto invoker = std::make_unique<FakeInvoker>(10);
        fake = invoker.get();
        fake->result.boxes = {0.1f, 0.1f, 0.5f, 0.5f,     // person
                              0.12f, 0.12f, 0.5f, 0.5f,   // overlaps the person box
                              0.6f, 0.6f, 0.9f, 0.9f};    // car
        fake->result.classes = {0.0f, 0.0f, 2.0f};
        fake->result.scores = {0.8f, 0.7f, 0.6f};
        fake->result.count = 3.0f;
        invoker_ = std::move(invoker);
    }

    std::unique_ptr<ObjectDetector> build() {
        return std::make_unique<ObjectDetector>(std::move(invoker_),
                                                std::make_unique<FakeCodec>(640, 480), config);
    }

    FakeInvoker* fake{nullptr};
    std::unique_ptr<FakeInvoker> invoker_;
    DetectorConfig config;
};

TEST_F(ObjectDetectorTest, ResolvesSchemaAtConstruction) {
    auto detector = build();
    EXPECT_EQ(detector->schemaMatch(), SchemaMatch::ByName);
    EXPECT_EQ(detector->schema().max_detections, 10);
    EXPECT_EQ(detector->inputSpec().width, 300);
    EXPECT_EQ(detector->modelName(), "fake-ssd");
}

TEST_F(ObjectDetectorTest, DetectDecodesAndSuppresses) {
    auto detector = build();
    DetectionSet out;
    DetectTimings timings;
    ASSERT_EQ(detector->detect(ImagePayload(600, 0xFF), out, &timings), DetectStatus::Ok);

    EXPECT_EQ(out.image_width, 640);
    EXPECT_EQ(out.image_height, 480);
    ASSERT_EQ(out.detections.size(), 2u);
    EXPECT_EQ(out.detections[0].label, "person");
    EXPECT_FLOAT_EQ(out.detections[0].confidence, 0.8f);
    EXPECT_EQ(out.detections[1].label, "car");
    EXPECT_EQ(timings.raw_count, 3);
    EXPECT_EQ(fake->last_input_size, 300u * 300u * 3u);
}

TEST_F(ObjectDetectorTest, ConfidenceThresholdFromConfig) {
    config.confidence_threshold = 0.75f;
    auto detector = build();
    DetectionSet out;
    ASSERT_EQ(detector->detect(ImagePayload(600, 0xFF), out), DetectStatus::Ok);
    ASSERT_EQ(out.detections.size(), 1u);
    EXPECT_EQ(out.detections[0].label, "person");
}

TEST_F(ObjectDetectorTest, CorruptPayloadReportsDecodeFailure) {
    auto detector = build();
    DetectionSet out;
    EXPECT_EQ(detector->detect(ImagePayload(600, 'X'), out), DetectStatus::DecodeFailed);
    EXPECT_EQ(fake->calls.load(), 0);
}

TEST_F(ObjectDetectorTest, InvokerFailureReported) {
    fake->fail = true;
    auto detector = build();
    DetectionSet out;
    EXPECT_EQ(detector->detect(ImagePayload(600, 0xFF), out), DetectStatus::InferenceFailed);
}

TEST_F(ObjectDetectorTest, StaleOutputsAreClearedBetweenCalls) {
    auto detector = build();
    DetectionSet out;
    ASSERT_EQ(detector->detect(ImagePayload(600, 0xFF), out), DetectStatus::Ok);
    ASSERT_FALSE(out.detections.empty());

    fake->result = FakeInvoker::Result{};
    DetectionSet second;
    ASSERT_EQ(detector->detect(ImagePayload(600, 0xFF), second), DetectStatus::Ok);
    EXPECT_TRUE(second.detections.empty());
}

TEST_F(ObjectDetectorTest, TooFewOutputsIsModelLoadError) {
    fake->outputs_.pop_back();
    EXPECT_THROW(build(), ModelLoadError);
}

TEST_F(ObjectDetectorTest, BadInputGeometryIsModelLoadError) {
    fake->spec_.channels = 1;
    EXPECT_THROW(build(), ModelLoadError);
}

TEST_F(ObjectDetectorTest, MissingCodecIsModelLoadError) {
    EXPECT_THROW((ObjectDetector(std::move(invoker_), nullptr, config)), ModelLoadError);
}

TEST(DetectStatusTest, Names) {
    EXPECT_STREQ(to_string(DetectStatus::Ok), "ok");
    EXPECT_STREQ(to_string(DetectStatus::DecodeFailed), "decode_failed");
    EXPECT_STREQ(to_string(DetectStatus::InferenceFailed), "inference_failed");
}
