#ifndef ANDES_CAMERA_HPP
#define ANDES_CAMERA_HPP

#include "AcquisitionPipeline.hpp"
#include "CameraConfig.hpp"
#include "DeviceProfile.hpp"
#include "UsbTransport.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace andes {

// One 96-bit sequencer memory word, most significant part first.
struct SequencerWord {
    uint32_t hi = 0;
    uint32_t mid = 0;
    uint32_t lo = 0;
};

class AndesCamera {
public:
    explicit AndesCamera(const DeviceProfile& profile = DeviceProfile::defaults());
    // For tests and alternative transports.
    AndesCamera(const DeviceProfile& profile, std::unique_ptr<UsbTransport> transport);
    ~AndesCamera();

    AndesCamera(const AndesCamera&) = delete;
    AndesCamera& operator=(const AndesCamera&) = delete;

    // Both throw DeviceBusy while a configure/capture/command exchange is running.
    void open();
    void close();
    bool is_open() const;

    // Run on the transport's event thread. An unplug moves the camera to Disconnected
    // before on_disconnect runs; an arrival only notifies, open() reconnects.
    void set_on_connect(std::function<void()> fn);
    void set_on_disconnect(std::function<void()> fn);
    // Returns false when the platform cannot report hotplug events.
    bool watch_hotplug();

    // Staged locally; validated here, sent by configure().
    void set_binning(int x, int y);
    void set_shutter(bool open);
    void set_exposure_time(int expose_time_ms);
    void set_roi(int x, int y, int width, int height);
    void clear_roi();
    void set_gain(int gain);
    const CameraConfig& pending_config() const { return pending; }

    void configure();
    Frame capture(const std::atomic<bool>* cancel = nullptr);

    void power_on(bool state = true);

    void configure_temperature();
    void configure_temperature(const TemperatureControl& control);
    // Degrees Celsius.
    double get_temperature();

    // Writes program to consecutive addresses with the sequencer stopped, then restarts it.
    void upload_sequencer(const std::vector<SequencerWord>& program, uint32_t start_address = 0);

    DeviceState state() const;
    AcquisitionPipeline& pipeline() { return acquisition; }
    const DeviceProfile& profile() const { return device; }

private:
    void handle_hotplug(bool arrived);

    DeviceProfile device;
    std::unique_ptr<UsbTransport> transport;
    AcquisitionPipeline acquisition;
    ByteCode formatter;
    CameraConfig pending;

    std::mutex callback_mutex;
    std::function<void()> on_connect;
    std::function<void()> on_disconnect;
};

}

#endif
