#ifndef ANDES_ACQUISITION_PIPELINE_HPP
#define ANDES_ACQUISITION_PIPELINE_HPP

#include "ByteCode.hpp"
#include "DeviceProfile.hpp"
#include "DeviceState.hpp"
#include "Frame.hpp"
#include "UsbTransport.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <vector>

namespace andes {

// Drives one camera through configure/expose/readout. The transport is borrowed, the
// caller keeps it open for as long as the pipeline is used.
//
// Only one configure/capture/command exchange runs at a time. A second caller fails with
// DeviceBusy instead of waiting; the mutex only protects the state, never a transfer.
class AcquisitionPipeline {
public:
    AcquisitionPipeline(UsbTransport& transport, const DeviceProfile& profile);

    // Applies the fields of config that differ from the active configuration.
    // From Error everything is re-sent.
    void configure(const CameraConfig& config);

    // Exposes and reads one frame with the active configuration. cancel may be null.
    Frame capture(const std::atomic<bool>* cancel = nullptr);

    // Sends commands outside the acquisition cycle (power, cooler, sequencer).
    // Every one of them must be acknowledged.
    void execute(const std::vector<Command>& commands);

    // Sends one command and returns the raw response packet without interpreting it.
    std::vector<uint8_t> query(const Command& command);

    DeviceState state() const;
    std::optional<CameraConfig> active_config() const;

    // The facade calls these around opening and closing the transport.
    // mark_opened() throws DeviceBusy while an exchange is still unwinding.
    void mark_opened();
    // Moves to Disconnected so that no new exchange can start, then hands the transport
    // back to the caller for closing. Throws DeviceBusy while an exchange is running.
    void detach();
    // The device is gone. An exchange still running keeps its slot and fails with
    // Disconnected at its next step.
    void mark_disconnected();

private:
    // Claims the single in-flight slot; throws if the state does not allow `operation`.
    DeviceState begin(const char* operation, bool allow_error);
    // Moves to `next` while keeping the slot. Throws Disconnected when the device was
    // lost meanwhile.
    void transition(const DeviceState& next);
    // Moves to `next` and releases the slot. A Disconnected state is never overwritten;
    // release() reports it with false, finish() with a Disconnected exception.
    bool release(const DeviceState& next);
    void finish(const DeviceState& next);
    void fail(const std::string& reason);

    std::vector<uint8_t> exchange(const Command& command);
    Status send_and_check(const Command& command);
    void wait_for_readout(const CameraConfig& config);
    std::vector<std::vector<uint8_t>> read_frame(size_t expected);

    UsbTransport& transport;
    ByteCode formatter;
    SensorLimits sensor;
    SequencerAddresses sequencer;
    TimingProfile timing;

    mutable std::mutex state_mutex;
    DeviceState current;
    bool in_flight = false;
};

}

#endif
