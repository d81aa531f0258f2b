#include "AcquisitionPipeline.hpp"
#include "CameraErrors.hpp"
#include "ImageAssembler.hpp"
#include "Log.hpp"
#include <algorithm>
#include <chrono>

namespace andes {

AcquisitionPipeline::AcquisitionPipeline(UsbTransport& transport, const DeviceProfile& profile)
    : transport(transport), sensor(profile.sensor), sequencer(profile.sequencer), timing(profile.timing) {
}

DeviceState AcquisitionPipeline::state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return current;
}

std::optional<CameraConfig> AcquisitionPipeline::active_config() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return current.active_config;
}

void AcquisitionPipeline::mark_opened() {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (in_flight) {
        throw DeviceBusy(to_string(current.kind));
    }
    current = DeviceState::idle(std::nullopt);
}

void AcquisitionPipeline::detach() {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (in_flight) {
        dprintf("AcquisitionPipeline::detach() - Refused while %s\n", to_string(current.kind));
        throw DeviceBusy(to_string(current.kind));
    }
    current = DeviceState::disconnected();
}

void AcquisitionPipeline::mark_disconnected() {
    std::lock_guard<std::mutex> lock(state_mutex);
    current = DeviceState::disconnected();
}

DeviceState AcquisitionPipeline::begin(const char* operation, bool allow_error) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (current.kind == StateKind::Disconnected) {
        throw Disconnected();
    }

    bool allowed = current.kind == StateKind::Idle || (allow_error && current.kind == StateKind::Error);
    if (in_flight || !allowed) {
        dprintf("AcquisitionPipeline::%s() - Refused while %s\n", operation, to_string(current.kind));
        throw DeviceBusy(to_string(current.kind));
    }
    in_flight = true;
    return current;
}

void AcquisitionPipeline::transition(const DeviceState& next) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (current.kind == StateKind::Disconnected) {
        throw Disconnected();
    }
    current = next;
}

bool AcquisitionPipeline::release(const DeviceState& next) {
    std::lock_guard<std::mutex> lock(state_mutex);
    in_flight = false;
    if (current.kind == StateKind::Disconnected) {
        return next.kind == StateKind::Disconnected;
    }
    current = next;
    return true;
}

void AcquisitionPipeline::finish(const DeviceState& next) {
    if (!release(next)) {
        throw Disconnected();
    }
}

void AcquisitionPipeline::fail(const std::string& reason) {
    dprintf("AcquisitionPipeline - Entering Error state: %s\n", reason.c_str());
    if (!release(DeviceState::error(reason))) {
        dprintf("AcquisitionPipeline - Device was unplugged meanwhile, staying Disconnected\n");
    }
}

std::vector<uint8_t> AcquisitionPipeline::exchange(const Command& command) {
    if (is_verbose()) {
        verbose_printf("AcquisitionPipeline - > %s\n%s\n", command.name.c_str(),
                       ByteCode::as_legacy_file({command}).c_str());
    }
    transport.send_control(command.opcode, command.bytes, timing.command_timeout_ms);
    return transport.bulk_read(ByteCode::STATUS_PACKET_SIZE, timing.command_timeout_ms);
}

Status AcquisitionPipeline::send_and_check(const Command& command) {
    Status status = ByteCode::decode_status(exchange(command));
    verbose_printf("AcquisitionPipeline - < %s 0x%08X\n", to_string(status.kind), status.code);
    if (status.kind == Status::Kind::Nack) {
        dprintf("AcquisitionPipeline - %s rejected with 0x%08X\n", command.name.c_str(), status.code);
    }
    status.check();
    return status;
}

void AcquisitionPipeline::configure(const CameraConfig& config) {
    DeviceState previous = begin("configure", true);

    std::optional<CameraConfig> applied;
    if (previous.kind == StateKind::Idle) {
        applied = previous.active_config;
    }

    try {
        std::vector<Command> commands = formatter.encode(config, config.diff(applied));
        for (const Command& cmd : commands) {
            send_and_check(cmd);
        }
        dprintf("AcquisitionPipeline::configure() - Applied %zu command(s), frame %dx%d\n",
                commands.size(), config.image_width(), config.image_height());
    } catch (const Disconnected&) {
        dprintf("AcquisitionPipeline::configure() - Device disconnected\n");
        release(DeviceState::disconnected());
        throw;
    } catch (const std::exception& e) {
        fail(std::string("configure failed: ") + e.what());
        throw;
    }
    finish(DeviceState::idle(config));
}

void AcquisitionPipeline::wait_for_readout(const CameraConfig& config) {
    using namespace std::chrono;

    unsigned int budget_ms = (unsigned int) config.shutter().expose_time_ms + timing.readout_margin_ms;
    steady_clock::time_point deadline = steady_clock::now() + milliseconds(budget_ms);

    while (true) {
        steady_clock::time_point now = steady_clock::now();
        if (now >= deadline) {
            throw CaptureTimeout(budget_ms);
        }
        long long remaining = duration_cast<milliseconds>(deadline - now).count();
        unsigned int wait_ms = (unsigned int) std::min<long long>(timing.poll_interval_ms, std::max<long long>(remaining, 1));

        std::vector<uint8_t> response;
        try {
            response = transport.bulk_read(ByteCode::STATUS_PACKET_SIZE, wait_ms);
        } catch (const Timeout&) {
            continue;
        }

        Status status = ByteCode::decode_status(response);
        verbose_printf("AcquisitionPipeline - < %s 0x%08X\n", to_string(status.kind), status.code);
        if (status.kind == Status::Kind::ExposeDone) {
            return;
        }
        status.check();
    }
}

std::vector<std::vector<uint8_t>> AcquisitionPipeline::read_frame(size_t expected) {
    std::vector<std::vector<uint8_t>> chunks;
    size_t received = 0;

    while (received < expected) {
        size_t wanted = std::min(timing.max_chunk_bytes, expected - received);
        std::vector<uint8_t> chunk;
        try {
            chunk = transport.bulk_read(wanted, timing.chunk_timeout_ms);
        } catch (const Timeout&) {
            dprintf("AcquisitionPipeline::capture() - Readout stalled after %zu of %zu bytes\n", received, expected);
            throw IncompleteFrame(expected, received);
        }
        if (chunk.empty()) {
            throw IncompleteFrame(expected, received);
        }
        received += chunk.size();
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

Frame AcquisitionPipeline::capture(const std::atomic<bool>* cancel) {
    DeviceState previous = begin("capture", false);
    if (!previous.active_config) {
        finish(previous);
        throw NotConfigured();
    }
    const CameraConfig config = *previous.active_config;

    // Nothing was sent yet, the camera is still idle.
    if (cancel && cancel->load()) {
        finish(previous);
        throw CaptureCancelled();
    }

    try {
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
        transition(DeviceState::exposing(config, std::chrono::steady_clock::now()));

        Command trigger = formatter.trigger(sequencer.stop_cleaning, sequencer.get_image, config.shutter().open);
        if (is_verbose()) {
            verbose_printf("AcquisitionPipeline - > %s\n%s\n", trigger.name.c_str(),
                           ByteCode::as_legacy_file({trigger}).c_str());
        }
        transport.send_control(trigger.opcode, trigger.bytes, timing.command_timeout_ms);
        wait_for_readout(config);

        // The device now holds a frame nobody will read, so a cancel here leaves it in Error.
        if (cancel && cancel->load()) {
            throw CaptureCancelled();
        }

        transition(DeviceState::reading_out(config));
        int width = config.image_width();
        int height = config.image_height();
        std::vector<std::vector<uint8_t>> chunks = read_frame(ImageAssembler::expected_bytes(width, height, sensor.bit_depth));

        Frame frame = ImageAssembler::assemble(chunks, width, height, sensor.bit_depth, config, timestamp);
        finish(DeviceState::idle(config));
        verbose_printf("AcquisitionPipeline::capture() - Frame %dx%d in %zu chunk(s)\n", width, height, chunks.size());
        return frame;
    } catch (const Disconnected&) {
        dprintf("AcquisitionPipeline::capture() - Device disconnected\n");
        release(DeviceState::disconnected());
        throw;
    } catch (const std::exception& e) {
        fail(std::string("capture failed: ") + e.what());
        throw;
    }
}

void AcquisitionPipeline::execute(const std::vector<Command>& commands) {
    DeviceState previous = begin("execute", true);
    try {
        for (const Command& cmd : commands) {
            send_and_check(cmd);
        }
    } catch (const Disconnected&) {
        release(DeviceState::disconnected());
        throw;
    } catch (const std::exception& e) {
        fail(std::string("command failed: ") + e.what());
        throw;
    }
    finish(previous);
}

std::vector<uint8_t> AcquisitionPipeline::query(const Command& command) {
    DeviceState previous = begin("query", true);
    std::vector<uint8_t> response;
    try {
        response = exchange(command);
    } catch (const Disconnected&) {
        release(DeviceState::disconnected());
        throw;
    } catch (const std::exception& e) {
        fail(std::string("query failed: ") + e.what());
        throw;
    }
    finish(previous);
    return response;
}

}
