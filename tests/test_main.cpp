#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <iostream>

// Test categories can be run individually using:
// ./unit_tests --gtest_filter="FrameDemuxerTest*"
// ./unit_tests --gtest_filter="PipelineTest*"
// etc.

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Banner goes to stderr so test discovery only sees the test list
    std::cerr << "Running RoverEye-RT Test Suite" << std::endl;
    std::cerr << "==============================" << std::endl;

    // Trim and decode warnings are expected in several tests
    spdlog::set_level(spdlog::level::err);

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cerr << "\nAll tests passed!" << std::endl;
    } else {
        std::cerr << "\nTests failed!" << std::endl;
    }

    return result;
}
