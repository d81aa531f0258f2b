#include <gtest/gtest.h>

#include "CameraErrors.hpp"
#include "ContinuousCapture.hpp"
#include "ImageAssembler.hpp"
#include "SimulatedDevice.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace andes;

namespace {

DeviceProfile tiny_profile() {
    DeviceProfile profile = DeviceProfile::defaults();
    profile.sensor.width = 16;
    profile.sensor.height = 8;
    profile.timing.poll_interval_ms = 5;
    profile.timing.readout_margin_ms = 100;
    profile.timing.chunk_timeout_ms = 20;
    return profile;
}

Frame blank_frame(int marker) {
    std::vector<uint16_t> pixels(4, (uint16_t) marker);
    return Frame(std::move(pixels), 2, 2, 16, std::chrono::system_clock::now(), CameraConfig());
}

}

TEST(FrameQueueTest, PopInArrivalOrder) {
    FrameQueue queue(3);
    queue.push(blank_frame(1));
    queue.push(blank_frame(2));

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.pop(std::chrono::milliseconds(0))->at(0, 0), 1);
    EXPECT_EQ(queue.pop(std::chrono::milliseconds(0))->at(0, 0), 2);
    EXPECT_FALSE(queue.pop(std::chrono::milliseconds(1)).has_value());
}

TEST(FrameQueueTest, FullQueueDropsOldest) {
    FrameQueue queue(2);
    queue.push(blank_frame(1));
    queue.push(blank_frame(2));
    queue.push(blank_frame(3));

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dropped(), 1u);
    EXPECT_EQ(queue.pop(std::chrono::milliseconds(0))->at(0, 0), 2);
    EXPECT_EQ(queue.pop(std::chrono::milliseconds(0))->at(0, 0), 3);
}

TEST(FrameQueueTest, CloseWakesWaitingConsumer) {
    FrameQueue queue(1);
    std::thread closer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.close();
    });

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(std::chrono::seconds(10)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    closer.join();
    EXPECT_TRUE(queue.is_closed());
}

TEST(FrameQueueTest, ZeroCapacityRejected) {
    EXPECT_THROW(FrameQueue(0), std::invalid_argument);
}

class ContinuousCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        device.open(profile.vendor_id, profile.product_id);
        pipeline.mark_opened();
        config.set_exposure_time(0);
        pipeline.configure(config);
    }

    DeviceProfile profile = tiny_profile();
    SimulatedDevice device{profile.sensor};
    AcquisitionPipeline pipeline{device, profile};
    CameraConfig config{profile.sensor};
};

TEST_F(ContinuousCaptureTest, CapturesRequestedFrameCount) {
    ContinuousCapture stream(pipeline, 8);
    stream.start(5);

    int received = 0;
    while (std::optional<Frame> frame = stream.frames().pop(std::chrono::seconds(5))) {
        EXPECT_EQ(frame->width(), 16);
        ++received;
    }
    stream.stop();

    EXPECT_EQ(received, 5);
    EXPECT_EQ(stream.captured(), 5u);
    EXPECT_FALSE(stream.is_running());
    EXPECT_FALSE(stream.last_error());
    EXPECT_EQ(pipeline.state().kind, StateKind::Idle);
}

TEST_F(ContinuousCaptureTest, StagedConfigAppliedBetweenCaptures) {
    ContinuousCapture stream(pipeline, 64);
    stream.start();

    ASSERT_TRUE(stream.frames().pop(std::chrono::seconds(5)).has_value());

    CameraConfig binned = config;
    binned.set_binning(2, 2);
    stream.stage_config(binned);

    bool saw_binned = false;
    for (int i = 0; i < 200 && !saw_binned; ++i) {
        std::optional<Frame> frame = stream.frames().pop(std::chrono::seconds(5));
        ASSERT_TRUE(frame.has_value());
        if (frame->config().binning().x == 2) {
            saw_binned = true;
            EXPECT_EQ(frame->width(), 8);
            EXPECT_EQ(frame->height(), 4);
        } else {
            EXPECT_EQ(frame->width(), 16);
        }
    }
    stream.stop();

    EXPECT_TRUE(saw_binned);
    ASSERT_TRUE(pipeline.active_config().has_value());
    EXPECT_EQ(pipeline.active_config()->binning().x, 2);
}

TEST_F(ContinuousCaptureTest, ErrorEndsLoopAndIsKept) {
    device.never_finish = true;
    ContinuousCapture stream(pipeline);
    stream.start();

    EXPECT_FALSE(stream.frames().pop(std::chrono::seconds(5)).has_value());
    stream.stop();

    std::exception_ptr error = stream.last_error();
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), CaptureTimeout);
    EXPECT_EQ(pipeline.state().kind, StateKind::Error);
}

TEST_F(ContinuousCaptureTest, StopCancelsRunningLoop) {
    ContinuousCapture stream(pipeline, 2);
    stream.start();
    ASSERT_TRUE(stream.frames().pop(std::chrono::seconds(5)).has_value());

    stream.stop();
    EXPECT_FALSE(stream.is_running());
    EXPECT_FALSE(stream.last_error());
    EXPECT_GE(stream.captured(), 1u);
}

TEST_F(ContinuousCaptureTest, StartWhileRunning_DeviceBusy) {
    device.hold_exposure = true;
    ContinuousCapture stream(pipeline);
    stream.start();

    ASSERT_TRUE(stream.is_running());
    EXPECT_THROW(stream.start(), DeviceBusy);

    // Unplugging frees the blocked exposure and ends the loop.
    device.unplug();
    stream.stop();
    EXPECT_FALSE(stream.is_running());
}

TEST_F(ContinuousCaptureTest, DisconnectEndsLoop) {
    device.disconnect_during_readout = true;
    ContinuousCapture stream(pipeline);
    stream.start();

    EXPECT_FALSE(stream.frames().pop(std::chrono::seconds(5)).has_value());
    stream.stop();
    EXPECT_THROW(std::rethrow_exception(stream.last_error()), Disconnected);
    EXPECT_EQ(pipeline.state().kind, StateKind::Disconnected);
}
