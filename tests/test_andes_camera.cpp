#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "AndesCamera.hpp"
#include "CameraErrors.hpp"
#include "MockUsbTransport.hpp"
#include "SimulatedDevice.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <optional>
#include <thread>

using namespace andes;
using namespace testing;

namespace {

template <typename Pred>
bool eventually(Pred pred) {
    for (int i = 0; i < 2000; ++i) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

}

class AndesCameraTest : public Test {
protected:
    void SetUp() override {
        profile = DeviceProfile::defaults();
        profile.sensor.width = 32;
        profile.sensor.height = 24;
        profile.timing.poll_interval_ms = 5;
        profile.timing.readout_margin_ms = 100;
        profile.timing.chunk_timeout_ms = 20;

        auto simulated = std::make_unique<SimulatedDevice>(profile.sensor);
        device = simulated.get();
        camera = std::make_unique<AndesCamera>(profile, std::move(simulated));
    }

    DeviceProfile profile;
    SimulatedDevice* device = nullptr;
    std::unique_ptr<AndesCamera> camera;
    ByteCode formatter;
};

TEST_F(AndesCameraTest, OpenClose_StateFollows) {
    EXPECT_EQ(camera->state().kind, StateKind::Disconnected);
    camera->open();
    EXPECT_TRUE(camera->is_open());
    EXPECT_EQ(camera->state().kind, StateKind::Idle);

    std::vector<SimulatedDevice::Call> calls = device->recorded_calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].opcode, (0x04B4u << 16) | 0x00F1u);

    camera->close();
    EXPECT_FALSE(camera->is_open());
    EXPECT_EQ(camera->state().kind, StateKind::Disconnected);
    EXPECT_THROW(camera->configure(), Disconnected);
}

TEST_F(AndesCameraTest, Setters_ValidateWithoutTransfers) {
    camera->open();
    EXPECT_THROW(camera->set_binning(5, 1), InvalidParameter);
    EXPECT_THROW(camera->set_gain(99), InvalidParameter);
    EXPECT_THROW(camera->set_roi(0, 0, 33, 1), InvalidParameter);
    EXPECT_THROW(camera->set_exposure_time(-5), InvalidParameter);
    EXPECT_EQ(device->transfer_count(), 0u);

    camera->set_binning(2, 2);
    camera->set_roi(1, 1, 4, 4);
    EXPECT_EQ(camera->pending_config().image_width(), 4);
    EXPECT_EQ(device->transfer_count(), 0u);
}

TEST_F(AndesCameraTest, ConfigureCapture_EndToEnd) {
    camera->open();
    camera->set_binning(4, 2);
    camera->set_exposure_time(0);
    camera->set_shutter(false);
    camera->configure();

    Frame frame = camera->capture();
    EXPECT_EQ(frame.width(), 8);
    EXPECT_EQ(frame.height(), 12);
    EXPECT_FALSE(frame.config().shutter().open);
    EXPECT_EQ(frame.at(3, 5), device->pattern(3, 5));
}

TEST_F(AndesCameraTest, Reopen_AfterDisconnect) {
    camera->open();
    camera->set_exposure_time(0);
    camera->configure();
    device->unplug();

    EXPECT_THROW(camera->capture(), Disconnected);
    EXPECT_EQ(camera->state().kind, StateKind::Disconnected);

    camera->open();
    EXPECT_EQ(camera->state().kind, StateKind::Idle);
    EXPECT_THROW(camera->capture(), NotConfigured);
    camera->configure();
    EXPECT_NO_THROW(camera->capture());
}

TEST_F(AndesCameraTest, PowerOn_SendsPowerEnable) {
    camera->open();
    camera->power_on(true);
    EXPECT_EQ(device->sent_opcodes(), std::vector<uint32_t>{formatter.power_on(true).opcode});
    EXPECT_EQ(camera->state().kind, StateKind::Idle);
}

TEST_F(AndesCameraTest, PowerOn_NackIsDeviceError) {
    camera->open();
    device->nack_codes[formatter.power_on(true).opcode] = 0xDEAD0001;
    EXPECT_THROW(camera->power_on(true), DeviceError);
    EXPECT_EQ(camera->state().kind, StateKind::Error);
}

TEST_F(AndesCameraTest, ConfigureTemperature_SendsProfileSequence) {
    camera->open();
    TemperatureControl control;
    control.manual = false;
    control.setpoint = -10;
    control.k = {3, 1, 0};
    camera->configure_temperature(control);

    std::vector<uint32_t> expected;
    for (const Command& cmd : control.configuration_bytecode(formatter)) {
        expected.push_back(cmd.opcode);
    }
    EXPECT_EQ(device->sent_opcodes(), expected);
    EXPECT_EQ(device->sent_opcodes().size(), 6u);
}

TEST_F(AndesCameraTest, GetTemperature_DecodesKelvinTenths) {
    camera->open();
    device->temperature_code = 2531;
    EXPECT_NEAR(camera->get_temperature(), -20.05, 1e-9);

    device->temperature_code = (int32_t) ByteCode::STATUS_DEFAULT_ERROR;
    EXPECT_THROW(camera->get_temperature(), DeviceError);
}

TEST_F(AndesCameraTest, UploadSequencer_WrappedInDisableEnable) {
    camera->open();
    camera->upload_sequencer({{1, 2, 3}, {4, 5, 6}}, 0x40);

    std::vector<SimulatedDevice::Call> sends;
    for (const SimulatedDevice::Call& call : device->recorded_calls()) {
        if (call.kind == SimulatedDevice::Call::Kind::Send) sends.push_back(call);
    }
    ASSERT_EQ(sends.size(), 4u);
    EXPECT_EQ(sends[0].opcode, formatter.disable_sequencer().opcode);
    EXPECT_EQ(sends[3].opcode, formatter.enable_sequencer().opcode);

    EXPECT_EQ(sends[1].payload, formatter.write_sequencer_memory(0x40, 1, 2, 3).bytes);
    EXPECT_EQ(sends[2].payload, formatter.write_sequencer_memory(0x41, 4, 5, 6).bytes);
}

TEST_F(AndesCameraTest, CloseDuringCapture_DeviceBusy) {
    camera->open();
    camera->set_exposure_time(0);
    camera->configure();
    device->hold_exposure = true;

    std::optional<Frame> frame;
    std::exception_ptr failure;
    std::thread worker([&]() {
        try {
            frame = camera->capture();
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
    });
    ASSERT_TRUE(eventually([&]() { return device->waiting_at_gate(); }));

    EXPECT_THROW(camera->close(), DeviceBusy);
    EXPECT_TRUE(camera->is_open());
    EXPECT_EQ(camera->state().kind, StateKind::Exposing);
    EXPECT_THROW(camera->power_on(true), DeviceBusy);

    device->release();
    worker.join();
    EXPECT_FALSE(failure);
    EXPECT_TRUE(frame.has_value());
    EXPECT_EQ(camera->state().kind, StateKind::Idle);

    camera->close();
    EXPECT_FALSE(camera->is_open());
    EXPECT_EQ(camera->state().kind, StateKind::Disconnected);
}

TEST_F(AndesCameraTest, Hotplug_UnplugDisconnectsAndNotifies) {
    std::atomic<int> connects{0};
    std::atomic<int> disconnects{0};
    camera->set_on_connect([&]() { ++connects; });
    camera->set_on_disconnect([&]() { ++disconnects; });
    ASSERT_TRUE(camera->watch_hotplug());

    camera->open();
    camera->set_exposure_time(0);
    camera->configure();

    device->unplug();
    ASSERT_TRUE(device->announce(false));
    EXPECT_EQ(disconnects, 1);
    EXPECT_EQ(camera->state().kind, StateKind::Disconnected);

    device->clear_calls();
    EXPECT_THROW(camera->capture(), Disconnected);
    EXPECT_EQ(device->transfer_count(), 0u);

    ASSERT_TRUE(device->announce(true));
    EXPECT_EQ(connects, 1);
    EXPECT_EQ(camera->state().kind, StateKind::Disconnected);

    camera->open();
    EXPECT_EQ(camera->state().kind, StateKind::Idle);
    camera->configure();
    EXPECT_NO_THROW(camera->capture());
}

TEST_F(AndesCameraTest, Hotplug_UnplugDuringCapture_ReopenWaitsForIt) {
    ASSERT_TRUE(camera->watch_hotplug());
    camera->open();
    camera->set_exposure_time(0);
    camera->configure();
    device->hold_exposure = true;

    std::exception_ptr failure;
    std::thread worker([&]() {
        try {
            camera->capture();
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
    });
    ASSERT_TRUE(eventually([&]() { return device->waiting_at_gate(); }));

    ASSERT_TRUE(device->announce(false));
    EXPECT_EQ(camera->state().kind, StateKind::Disconnected);
    EXPECT_THROW(camera->open(), DeviceBusy);

    device->unplug();
    worker.join();
    ASSERT_TRUE(failure);
    EXPECT_THROW(std::rethrow_exception(failure), Disconnected);

    camera->open();
    EXPECT_EQ(camera->state().kind, StateKind::Idle);
}

TEST(AndesCameraOpenTest, Destructor_StopsHotplugWatch) {
    auto transport = std::make_unique<NiceMock<MockUsbTransport>>();
    EXPECT_CALL(*transport, is_open()).WillRepeatedly(Return(false));
    EXPECT_CALL(*transport, watch_hotplug(0x04B4, 0x00F1, _)).WillOnce(Return(false));
    EXPECT_CALL(*transport, unwatch_hotplug()).Times(1);

    AndesCamera camera(DeviceProfile::defaults(), std::move(transport));
    EXPECT_FALSE(camera.watch_hotplug());
}

TEST(AndesCameraOpenTest, DeviceNotFoundPropagates) {
    auto transport = std::make_unique<NiceMock<MockUsbTransport>>();
    EXPECT_CALL(*transport, is_open()).WillRepeatedly(Return(false));
    EXPECT_CALL(*transport, open(0x04B4, 0x00F1)).WillOnce(Throw(DeviceNotFound(0x04B4, 0x00F1)));

    AndesCamera camera(DeviceProfile::defaults(), std::move(transport));
    EXPECT_THROW(camera.open(), DeviceNotFound);
    EXPECT_EQ(camera.state().kind, StateKind::Disconnected);
}

TEST(AndesCameraOpenTest, PermissionDeniedCarriesUdevHint) {
    auto transport = std::make_unique<NiceMock<MockUsbTransport>>();
    EXPECT_CALL(*transport, is_open()).WillRepeatedly(Return(false));
    EXPECT_CALL(*transport, open(_, _)).WillOnce(Throw(PermissionDenied(0x04B4, 0x00F1)));

    AndesCamera camera(DeviceProfile::defaults(), std::move(transport));
    try {
        camera.open();
        FAIL() << "expected PermissionDenied";
    } catch (const PermissionDenied& e) {
        EXPECT_THAT(e.what(), HasSubstr("udev"));
        EXPECT_THAT(e.what(), HasSubstr("04b4"));
    }
}

TEST(AndesCameraOpenTest, InvalidExposure_NoTransportCalls) {
    auto transport = std::make_unique<NiceMock<MockUsbTransport>>();
    EXPECT_CALL(*transport, is_open()).WillRepeatedly(Return(false));
    EXPECT_CALL(*transport, open(_, _)).Times(0);
    EXPECT_CALL(*transport, send_control(_, _, _)).Times(0);
    EXPECT_CALL(*transport, bulk_read(_, _)).Times(0);
    DeviceProfile profile = DeviceProfile::defaults();
    profile.sensor.min_expose_ms = 10;

    AndesCamera camera(profile, std::move(transport));
    EXPECT_THROW(camera.set_exposure_time(5), InvalidParameter);
}
