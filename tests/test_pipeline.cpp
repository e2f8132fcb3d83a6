#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <stdexcept>
#include "pipeline.hpp"
#include "test_fakes.hpp"

using namespace std::chrono;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto t = std::make_unique<FakeTransport>();
        transport = t.get();
        transport_owner = std::move(t);
    }

    void TearDown() override {
        if (pipeline) pipeline->stop();
    }

    void buildDetector(milliseconds delay = milliseconds(0)) {
        auto invoker = std::make_unique<FakeInvoker>(10);
        fake = invoker.get();
        fake->result.boxes = {0.1f, 0.1f, 0.5f, 0.5f};
        fake->result.classes = {0.0f};
        fake->result.scores = {0.9f};
        fake->result.count = 1.0f;
        fake->delay = delay;
        detector = std::make_unique<ObjectDetector>(std::move(invoker),
                                                    std::make_unique<FakeCodec>(640, 480),
                                                    DetectorConfig{});
    }

    void buildPipeline(PipelineConfig cfg = PipelineConfig{}) {
        pipeline = std::make_unique<Pipeline>(cfg, std::move(transport_owner), detector.get(),
                                              metrics, store);
    }

    // Keeps feeding 600-byte frames until pred holds or the timeout expires.
    template <typename Pred>
    bool feedUntil(Pred pred, milliseconds timeout = milliseconds(3000), uint8_t fill = 0xFF) {
        const auto deadline = steady_clock::now() + timeout;
        while (steady_clock::now() < deadline) {
            if (pred()) return true;
            transport->push(make_part(600, fill));
            std::this_thread::sleep_for(milliseconds(10));
        }
        return pred();
    }

    template <typename Pred>
    bool waitFor(Pred pred, milliseconds timeout = milliseconds(3000)) {
        const auto deadline = steady_clock::now() + timeout;
        while (steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(milliseconds(5));
        }
        return pred();
    }

    FakeTransport* transport{nullptr};
    std::unique_ptr<FakeTransport> transport_owner;
    FakeInvoker* fake{nullptr};
    std::unique_ptr<ObjectDetector> detector;
    MetricsRegistry metrics;
    FrameStore store;
    std::unique_ptr<Pipeline> pipeline;
};

TEST_F(PipelineTest, RequiresTransport) {
    EXPECT_THROW(Pipeline(PipelineConfig{}, nullptr, nullptr, metrics, store), std::invalid_argument);
}

TEST_F(PipelineTest, FramesPublishedWithoutDetector) {
    buildPipeline();
    EXPECT_FALSE(pipeline->detection_available());
    EXPECT_FALSE(pipeline->detection_enabled());
    ASSERT_TRUE(pipeline->start());
    EXPECT_FALSE(pipeline->start());

    ASSERT_TRUE(feedUntil([&] { return metrics.frames_total() >= 3; }));
    auto snap = store.snapshot();
    ASSERT_TRUE(snap.frame);
    EXPECT_EQ(snap.frame->size(), 600u);
    EXPECT_GT(snap.frame_id, 0u);
    EXPECT_EQ(snap.status.state, StreamState::Active);
    EXPECT_TRUE(snap.detections.empty());
}

TEST_F(PipelineTest, DetectionsPublishedForFrames) {
    buildDetector();
    buildPipeline();
    EXPECT_TRUE(pipeline->detection_enabled());
    ASSERT_TRUE(pipeline->start());

    ASSERT_TRUE(feedUntil([&] { return !store.snapshot().detections.empty(); }));
    auto snap = store.snapshot();
    ASSERT_EQ(snap.detections.detections.size(), 1u);
    EXPECT_EQ(snap.detections.detections[0].label, "person");
    EXPECT_EQ(snap.detections.image_width, 640);
    EXPECT_GT(snap.detections.frame_id, 0u);
    EXPECT_GE(metrics.inferences_total(), 1u);
}

TEST_F(PipelineTest, DetectionsPublishedWhileStreamStalls) {
    buildDetector(milliseconds(50));
    buildPipeline();
    ASSERT_TRUE(pipeline->start());

    // Two parts complete exactly one frame; then the stream goes quiet
    transport->push(make_part(600, 0xFF));
    transport->push(make_part(600, 0xFF));

    ASSERT_TRUE(waitFor([&] { return !store.snapshot().detections.empty(); }));
    EXPECT_EQ(metrics.frames_total(), 1u);
    EXPECT_EQ(store.snapshot().detections.frame_id, 1u);
    EXPECT_EQ(metrics.inferences_total(), 1u);
}

TEST_F(PipelineTest, InferenceIsSingleFlightAndThrottled) {
    buildDetector(milliseconds(30));
    buildPipeline();
    ASSERT_TRUE(pipeline->start());

    const auto t0 = steady_clock::now();
    feedUntil([] { return false; }, milliseconds(1000));
    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - t0).count();

    EXPECT_EQ(fake->max_in_flight.load(), 1);
    EXPECT_GE(fake->calls.load(), 1);
    // Each run takes 30 ms and is followed by a 150 ms cooldown
    EXPECT_LE(fake->calls.load(), static_cast<int>(elapsed / 180) + 1);
    EXPECT_GT(metrics.frames_total(), static_cast<uint64_t>(fake->calls.load()));
}

TEST_F(PipelineTest, DisablingDetectionClearsAndStopsInference) {
    buildDetector();
    buildPipeline();
    ASSERT_TRUE(pipeline->start());
    ASSERT_TRUE(feedUntil([&] { return !store.snapshot().detections.empty(); }));

    pipeline->set_detection_enabled(false);

    // Allow an already admitted run to drain, then no new runs start
    feedUntil([] { return false; }, milliseconds(300));
    const int calls = fake->calls.load();
    feedUntil([] { return false; }, milliseconds(400));
    EXPECT_EQ(fake->calls.load(), calls);
    EXPECT_TRUE(store.snapshot().detections.empty());

    pipeline->set_detection_enabled(true);
    EXPECT_TRUE(feedUntil([&] { return fake->calls.load() > calls; }));
}

TEST_F(PipelineTest, CannotEnableDetectionWithoutModel) {
    buildPipeline();
    pipeline->set_detection_enabled(true);
    EXPECT_FALSE(pipeline->detection_enabled());
}

TEST_F(PipelineTest, UndecodableFramesAreCounted) {
    buildDetector();
    buildPipeline();
    ASSERT_TRUE(pipeline->start());

    ASSERT_TRUE(feedUntil([&] { return metrics.decode_failures_total() >= 1; },
                          milliseconds(3000), 'X'));
    EXPECT_TRUE(store.snapshot().detections.empty());
    EXPECT_EQ(fake->calls.load(), 0);
}

TEST_F(PipelineTest, StreamEndTearsDown) {
    buildDetector();
    buildPipeline();
    ASSERT_TRUE(pipeline->start());
    ASSERT_TRUE(feedUntil([&] { return metrics.frames_total() >= 2; }));

    transport->finish();
    ASSERT_TRUE(waitFor([&] { return !pipeline->running(); }));

    auto snap = store.snapshot();
    EXPECT_EQ(snap.status.state, StreamState::Inactive);
    EXPECT_EQ(snap.status.message, "Video stream ended.");
    EXPECT_FALSE(snap.frame);
    EXPECT_TRUE(snap.detections.empty());
}

TEST_F(PipelineTest, TransportErrorCarriesReason) {
    buildPipeline();
    ASSERT_TRUE(pipeline->start());
    transport->finish(TransportEnd::Failed, "Connection refused");
    ASSERT_TRUE(waitFor([&] { return !pipeline->running(); }));

    auto status = store.status();
    EXPECT_EQ(status.state, StreamState::Inactive);
    EXPECT_EQ(status.message, "Video stream error: Connection refused");
}

TEST_F(PipelineTest, StopDisconnects) {
    buildDetector(milliseconds(50));
    buildPipeline();
    ASSERT_TRUE(pipeline->start());
    ASSERT_TRUE(feedUntil([&] { return fake->calls.load() >= 1; }));

    pipeline->stop();
    EXPECT_FALSE(pipeline->running());
    auto snap = store.snapshot();
    EXPECT_EQ(snap.status.state, StreamState::Inactive);
    EXPECT_EQ(snap.status.message, "Disconnected.");
    EXPECT_FALSE(snap.frame);
}

TEST_F(PipelineTest, RestartsAfterStreamEnds) {
    buildDetector();
    buildPipeline();
    ASSERT_TRUE(pipeline->start());
    transport->finish();
    ASSERT_TRUE(waitFor([&] { return !pipeline->running(); }));

    ASSERT_TRUE(pipeline->start());
    EXPECT_TRUE(feedUntil([&] { return !store.snapshot().detections.empty(); }));
}

TEST(FrameStoreTest, LatestValueWins) {
    FrameStore store;
    EXPECT_FALSE(store.has_frame());
    store.publish_frame(std::make_shared<const ImagePayload>(ImagePayload(10, 1)), 1);
    store.publish_frame(std::make_shared<const ImagePayload>(ImagePayload(20, 2)), 2);

    DetectionSet set;
    set.frame_id = 1;
    set.detections.push_back(Detection{});
    store.publish_detections(set);

    auto snap = store.snapshot();
    EXPECT_EQ(snap.frame_id, 2u);
    EXPECT_EQ(snap.frame->size(), 20u);
    EXPECT_EQ(snap.detections.frame_id, 1u);

    store.clear_detections();
    EXPECT_TRUE(store.snapshot().detections.empty());
    EXPECT_TRUE(store.has_frame());

    store.set_status(StreamState::Inactive, "Disconnected.");
    store.clear();
    EXPECT_FALSE(store.has_frame());
    EXPECT_EQ(store.status().message, "Disconnected.");
    EXPECT_STREQ(to_string(store.status().state), "inactive");
}

TEST(ChannelTest, PushPopAndClose) {
    Channel<int> ch;
    EXPECT_TRUE(ch.push(1));
    EXPECT_TRUE(ch.push(2));
    int v = 0;
    ASSERT_TRUE(ch.try_pop(v));
    EXPECT_EQ(v, 1);

    ch.close();
    EXPECT_FALSE(ch.push(3));
    ASSERT_TRUE(ch.try_pop(v));
    EXPECT_EQ(v, 2);
    EXPECT_FALSE(ch.pop_for(v, milliseconds(5)));

    ch.reopen();
    EXPECT_TRUE(ch.push(4));
    EXPECT_TRUE(ch.pop_for(v, milliseconds(5)));
    EXPECT_EQ(v, 4);
}

TEST(ChannelTest, BoundedChannelKeepsNewest) {
    Channel<int> ch(1);
    for (int i = 1; i <= 5; ++i) {
        EXPECT_TRUE(ch.push(i));
    }
    EXPECT_EQ(ch.size(), 1u);
    EXPECT_EQ(ch.evicted(), 4u);

    int v = 0;
    ASSERT_TRUE(ch.try_pop(v));
    EXPECT_EQ(v, 5);
    EXPECT_FALSE(ch.try_pop(v));
}
