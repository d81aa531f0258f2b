#include "ByteCode.hpp"
#include "CameraErrors.hpp"
#include <cstdio>

namespace andes {

static void put_word(std::vector<uint8_t>& out, uint32_t word) {
    out.push_back((uint8_t) (word & 0xFF));
    out.push_back((uint8_t) ((word >> 8) & 0xFF));
    out.push_back((uint8_t) ((word >> 16) & 0xFF));
    out.push_back((uint8_t) ((word >> 24) & 0xFF));
}

void Status::check() const {
    if (kind == Kind::Nack) {
        throw DeviceError(code);
    }
}

const char* to_string(Status::Kind kind) {
    switch (kind) {
        case Status::Kind::Ack: return "ACK";
        case Status::Kind::ExposeBusy: return "EXPOSE_BUSY";
        case Status::Kind::ExposeDone: return "EXPOSE_DONE";
        case Status::Kind::Nack: return "NACK";
    }
    return "UNKNOWN";
}

Command ByteCode::build(const char* name, Module module, uint16_t submodule, uint16_t instruction,
                        const std::vector<uint32_t>& params) {
    Command cmd;
    cmd.name = name;
    uint32_t header = ((uint32_t) submodule << 16) | instruction;
    cmd.opcode = ((uint32_t) module << 24) | header;

    cmd.bytes.reserve(16 + params.size() * 4);
    put_word(cmd.bytes, INIT_WORD);
    put_word(cmd.bytes, module);
    put_word(cmd.bytes, (uint32_t) params.size() + 1);
    put_word(cmd.bytes, header);
    for (uint32_t p : params) {
        put_word(cmd.bytes, p);
    }
    return cmd;
}

std::vector<Command> ByteCode::encode(const CameraConfig& config, const std::set<ConfigField>& changed) const {
    std::vector<Command> commands;
    bool binning_changed = changed.count(ConfigField::Binning) > 0;

    if (binning_changed) {
        commands.push_back(write_binning(config.binning().x, config.binning().y));
    }
    // The ROI is in binned coordinates, so a binning change always re-sends it.
    if (binning_changed || changed.count(ConfigField::Roi)) {
        if (config.roi()) {
            const RegionOfInterest& r = *config.roi();
            commands.push_back(write_roi(r.x, r.y, r.width, r.height));
        } else {
            commands.push_back(write_roi(0, 0, config.image_width(), config.image_height()));
        }
    }
    if (changed.count(ConfigField::Gain)) {
        commands.push_back(write_gain(config.gain()));
    }
    if (changed.count(ConfigField::Shutter)) {
        commands.push_back(write_shutter(config.shutter().open));
    }
    if (changed.count(ConfigField::ExposureTime)) {
        commands.push_back(write_exposition_time((uint32_t) config.shutter().expose_time_ms));
    }
    return commands;
}

Command ByteCode::trigger(uint32_t stop_cleaning_address, uint32_t get_image_address, bool open_shutter) const {
    return build("GET_IMAGE", ACQUISITION, SEQUENCER_SUBMODULE, GET_IMAGE,
                 {stop_cleaning_address, get_image_address, open_shutter ? 1u : 0u});
}

Command ByteCode::write_binning(int x, int y) const {
    return build("WRITE_BINNING", ACQUISITION, SEQUENCER_SUBMODULE, WRITE_BINNING, {(uint32_t) x, (uint32_t) y});
}

Command ByteCode::write_roi(int x, int y, int width, int height) const {
    return build("WRITE_ROI", ACQUISITION, SEQUENCER_SUBMODULE, WRITE_ROI,
                 {(uint32_t) x, (uint32_t) y, (uint32_t) width, (uint32_t) height});
}

Command ByteCode::write_gain(int gain) const {
    return build("WRITE_GAIN", ACQUISITION, SEQUENCER_SUBMODULE, WRITE_GAIN, {(uint32_t) gain});
}

Command ByteCode::write_shutter(bool open) const {
    return build("WRITE_SHUTTER", ACQUISITION, SEQUENCER_SUBMODULE, WRITE_SHUTTER, {open ? 1u : 0u});
}

Command ByteCode::write_exposition_time(uint32_t time_ms) const {
    return build("WRITE_EXPOSE_TIME", ACQUISITION, SEQUENCER_SUBMODULE, WRITE_EXPOSE_TIME, {time_ms});
}

Command ByteCode::write_sequencer_memory(uint32_t address, uint32_t data_hi, uint32_t data_mid, uint32_t data_lo) const {
    return build("WRITE_SEQ_MEM", ACQUISITION, SEQUENCER_SUBMODULE, WRITE_SEQ_MEM, {address, data_hi, data_mid, data_lo});
}

Command ByteCode::enable_sequencer() const {
    return build("ENABLE_SEQ", ACQUISITION, SEQUENCER_SUBMODULE, ENABLE_SEQ);
}

Command ByteCode::disable_sequencer() const {
    return build("DISABLE_SEQ", ACQUISITION, SEQUENCER_SUBMODULE, DISABLE_SEQ);
}

Command ByteCode::power_on(bool state) const {
    return build("POWER_ENABLE", CONFIGURATOR, POWER_SUBMODULE, POWER_ENABLE, {state ? 1u : 0u});
}

Command ByteCode::pid_set_manipulated_variable(uint32_t code) const {
    return build("PID_SET_MANIPULATED", PVM, PID_SUBMODULE, PID_SET_MANIPULATED, {code});
}

Command ByteCode::pid_enable() const {
    return build("PID_ENABLE", PVM, PID_SUBMODULE, PID_ENABLE);
}

Command ByteCode::pid_disable() const {
    return build("PID_DISABLE", PVM, PID_SUBMODULE, PID_DISABLE);
}

Command ByteCode::pid_manual_mode_enable() const {
    return build("PID_MANUAL_ENABLE", PVM, PID_SUBMODULE, PID_MANUAL_ENABLE);
}

Command ByteCode::pid_manual_mode_disable() const {
    return build("PID_MANUAL_DISABLE", PVM, PID_SUBMODULE, PID_MANUAL_DISABLE);
}

Command ByteCode::pid_set_k1(int32_t k) const {
    return build("PID_SET_K1", PVM, PID_SUBMODULE, PID_SET_K1, {(uint32_t) k});
}

Command ByteCode::pid_set_k2(int32_t k) const {
    return build("PID_SET_K2", PVM, PID_SUBMODULE, PID_SET_K2, {(uint32_t) k});
}

Command ByteCode::pid_set_k3(int32_t k) const {
    return build("PID_SET_K3", PVM, PID_SUBMODULE, PID_SET_K3, {(uint32_t) k});
}

Command ByteCode::pid_set_setpoint(uint32_t code) const {
    return build("PID_SET_SETPOINT", PVM, PID_SUBMODULE, PID_SET_SETPOINT, {code});
}

Command ByteCode::pid_get_temperature() const {
    return build("PID_GET_TEMPERATURE", PVM, PID_SUBMODULE, PID_GET_TEMPERATURE);
}

uint32_t ByteCode::read_word(const std::vector<uint8_t>& data, size_t offset) {
    if (data.size() < offset + 4) {
        throw ShortRead(offset + 4, data.size());
    }
    return (uint32_t) data[offset] |
           ((uint32_t) data[offset + 1] << 8) |
           ((uint32_t) data[offset + 2] << 16) |
           ((uint32_t) data[offset + 3] << 24);
}

Status ByteCode::decode_status(const std::vector<uint8_t>& response) {
    Status status;
    status.code = read_word(response, 0);

    switch (status.code) {
        case STATUS_OK:
            status.kind = Status::Kind::Ack;
            break;
        case STATUS_EXPOSE_BUSY:
            status.kind = Status::Kind::ExposeBusy;
            break;
        case STATUS_EXPOSE_DONE:
            status.kind = Status::Kind::ExposeDone;
            break;
        default:
            // Includes STATUS_DEFAULT_ERROR, STATUS_TIMEOUT_ERROR and anything the firmware invents later.
            status.kind = Status::Kind::Nack;
            break;
    }
    return status;
}

std::string ByteCode::as_legacy_file(const std::vector<Command>& commands) {
    std::string out;
    int line_n = 1;
    for (const Command& cmd : commands) {
        char prefix[16];
        snprintf(prefix, sizeof(prefix), "%03d:\t", line_n++);
        out += prefix;

        for (size_t i = 0; i + 4 <= cmd.bytes.size(); i += 4) {
            char word[12];
            snprintf(word, sizeof(word), "%s%08X", i == 0 ? "" : " ", read_word(cmd.bytes, i));
            out += word;
        }
        if (line_n <= (int) commands.size()) {
            out += "\n";
        }
    }
    return out;
}

}
