#include "AndesCamera.hpp"
#include "CameraErrors.hpp"
#include "LibusbTransport.hpp"
#include "Log.hpp"

namespace andes {

AndesCamera::AndesCamera(const DeviceProfile& profile)
    : AndesCamera(profile, std::make_unique<LibusbTransport>(profile.endpoints)) {
}

AndesCamera::AndesCamera(const DeviceProfile& profile, std::unique_ptr<UsbTransport> transport)
    : device(profile), transport(std::move(transport)), acquisition(*this->transport, device), pending(device.sensor) {
}

AndesCamera::~AndesCamera() {
    transport->unwatch_hotplug();
    try {
        close();
    } catch (const DeviceBusy& e) {
        dprintf("AndesCamera::~AndesCamera() - Destroyed while busy: %s\n", e.what());
    }
}

void AndesCamera::open() {
    if (transport->is_open()) {
        if (acquisition.state().kind != StateKind::Disconnected) return;
        // The device went away mid-session; drop the stale handle before reopening.
        acquisition.detach();
        transport->close();
    }

    transport->open(device.vendor_id, device.product_id);
    acquisition.mark_opened();
    dprintf("AndesCamera::open() - Camera ready, sensor %dx%d @ %d bit\n",
            device.sensor.width, device.sensor.height, device.sensor.bit_depth);
}

void AndesCamera::close() {
    if (!transport->is_open()) return;

    // No transfer may be running while the handle goes away.
    acquisition.detach();
    transport->close();
    dprintf("AndesCamera::close() - Camera closed.\n");
}

bool AndesCamera::is_open() const {
    return transport->is_open();
}

void AndesCamera::set_on_connect(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(callback_mutex);
    on_connect = std::move(fn);
}

void AndesCamera::set_on_disconnect(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(callback_mutex);
    on_disconnect = std::move(fn);
}

bool AndesCamera::watch_hotplug() {
    return transport->watch_hotplug(device.vendor_id, device.product_id,
                                    [this](bool arrived) { handle_hotplug(arrived); });
}

void AndesCamera::handle_hotplug(bool arrived) {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex);
        callback = arrived ? on_connect : on_disconnect;
    }
    if (!arrived) {
        acquisition.mark_disconnected();
        dprintf("AndesCamera - Camera unplugged\n");
    }
    if (callback) {
        callback();
    }
}

void AndesCamera::set_binning(int x, int y) {
    pending.set_binning(x, y);
}

void AndesCamera::set_shutter(bool open) {
    pending.set_shutter(open);
}

void AndesCamera::set_exposure_time(int expose_time_ms) {
    pending.set_exposure_time(expose_time_ms);
}

void AndesCamera::set_roi(int x, int y, int width, int height) {
    pending.set_roi(x, y, width, height);
}

void AndesCamera::clear_roi() {
    pending.clear_roi();
}

void AndesCamera::set_gain(int gain) {
    pending.set_gain(gain);
}

void AndesCamera::configure() {
    acquisition.configure(pending);
}

Frame AndesCamera::capture(const std::atomic<bool>* cancel) {
    return acquisition.capture(cancel);
}

void AndesCamera::power_on(bool state) {
    dprintf("AndesCamera::power_on() - Switching sensor power %s\n", state ? "on" : "off");
    acquisition.execute({formatter.power_on(state)});
}

void AndesCamera::configure_temperature() {
    configure_temperature(device.temperature);
}

void AndesCamera::configure_temperature(const TemperatureControl& control) {
    if (control.manual) {
        dprintf("AndesCamera::configure_temperature() - Manual drive at %.2f V\n", control.manipulated_var);
    } else {
        dprintf("AndesCamera::configure_temperature() - PID towards %.1f C\n", control.setpoint);
    }
    acquisition.execute(control.configuration_bytecode(formatter));
}

double AndesCamera::get_temperature() {
    std::vector<uint8_t> response = acquisition.query(formatter.pid_get_temperature());
    uint32_t word = ByteCode::read_word(response, 0);
    if (word == ByteCode::STATUS_DEFAULT_ERROR || word == ByteCode::STATUS_TIMEOUT_ERROR) {
        throw DeviceError(word);
    }
    return TemperatureControl::code_to_celsius((int32_t) word);
}

void AndesCamera::upload_sequencer(const std::vector<SequencerWord>& program, uint32_t start_address) {
    std::vector<Command> commands;
    commands.reserve(program.size() + 2);
    commands.push_back(formatter.disable_sequencer());
    uint32_t address = start_address;
    for (const SequencerWord& word : program) {
        commands.push_back(formatter.write_sequencer_memory(address++, word.hi, word.mid, word.lo));
    }
    commands.push_back(formatter.enable_sequencer());

    dprintf("AndesCamera::upload_sequencer() - Writing %zu word(s) at 0x%X\n", program.size(), start_address);
    acquisition.execute(commands);
}

DeviceState AndesCamera::state() const {
    return acquisition.state();
}

}
