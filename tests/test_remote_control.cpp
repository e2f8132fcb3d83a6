#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include "remote_control.hpp"

using namespace std::chrono;

class RemoteControlTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Nothing listens on port 1; every request fails fast
        RemoteEndpoint ep;
        ep.host = "127.0.0.1";
        ep.port = 1;
        ep.poll_interval_s = 5;
        remote = std::make_unique<RemoteControl>(ep);
    }

    std::unique_ptr<RemoteControl> remote;
};

TEST_F(RemoteControlTest, RecognizesDriveDirections) {
    for (const char* d : {"forward", "backward", "left", "right", "stop"}) {
        EXPECT_TRUE(is_drive_direction(d)) << d;
    }
    EXPECT_FALSE(is_drive_direction("jump"));
    EXPECT_FALSE(is_drive_direction(""));
    EXPECT_FALSE(remote->send_command("jump"));
    EXPECT_EQ(remote->pending_commands(), 0u);
}

TEST_F(RemoteControlTest, BurstLeavesOnlyNewestCommandPending) {
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(remote->send_command(i % 2 ? "left" : "forward"));
    }
    EXPECT_LE(remote->pending_commands(), 1u);
    EXPECT_EQ(remote->superseded_commands(), 19u);
}

TEST_F(RemoteControlTest, StopWakesPollerPromptly) {
    remote->start();
    std::this_thread::sleep_for(milliseconds(100));

    const auto t0 = steady_clock::now();
    remote->stop();
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - t0).count(), 2000);
    EXPECT_FALSE(remote->status_ok());
    EXPECT_FALSE(remote->send_command("forward"));
}

TEST_F(RemoteControlTest, StatusCheckFailsWhenServerIsDown) {
    nlohmann::json status;
    EXPECT_FALSE(remote->probe(status, 1));
    EXPECT_FALSE(remote->status_ok());
}
