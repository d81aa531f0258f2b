#ifndef ANDES_BYTE_CODE_HPP
#define ANDES_BYTE_CODE_HPP

#include "CameraConfig.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace andes {

// One serialized command record for the Andes controller.
struct Command {
    std::string name;
    // (module << 24) | (submodule << 16) | instruction
    uint32_t opcode = 0;
    std::vector<uint8_t> bytes;
};

struct Status {
    enum class Kind {
        Ack,
        ExposeBusy,
        ExposeDone,
        Nack
    };

    Kind kind = Kind::Nack;
    uint32_t code = 0;

    // Throws DeviceError for a Nack.
    void check() const;
};

const char* to_string(Status::Kind kind);

// Encodes/decodes the controller's byte code. Every record is a sequence of
// little-endian 32-bit words: init word, module, word count, header, parameters.
class ByteCode {
public:
    static constexpr uint32_t INIT_WORD = 0x029A;

    enum Module : uint32_t {
        CONFIGURATOR = 0,
        ACQUISITION = 1,
        PVM = 2
    };

    // Status words
    static constexpr uint32_t STATUS_OK = 0x55555555;
    static constexpr uint32_t STATUS_DEFAULT_ERROR = 0xFFFFFFFF;
    static constexpr uint32_t STATUS_TIMEOUT_ERROR = 0xFEDCBA98;
    static constexpr uint32_t STATUS_EXPOSE_BUSY = 0xEEEEBBBB;
    static constexpr uint32_t STATUS_EXPOSE_DONE = 0xEEEEDDDD;

    // Every status response is a full packet of this size.
    static constexpr size_t STATUS_PACKET_SIZE = 512;

    // Configuration commands for the changed fields, in the order the firmware needs them:
    // geometry, gain, shutter, exposure time.
    std::vector<Command> encode(const CameraConfig& config, const std::set<ConfigField>& changed) const;

    Command trigger(uint32_t stop_cleaning_address, uint32_t get_image_address, bool open_shutter) const;

    Command write_binning(int x, int y) const;
    Command write_roi(int x, int y, int width, int height) const;
    Command write_gain(int gain) const;
    Command write_shutter(bool open) const;
    Command write_exposition_time(uint32_t time_ms) const;

    Command write_sequencer_memory(uint32_t address, uint32_t data_hi, uint32_t data_mid, uint32_t data_lo) const;
    Command enable_sequencer() const;
    Command disable_sequencer() const;

    Command power_on(bool state) const;

    Command pid_set_manipulated_variable(uint32_t code) const;
    Command pid_enable() const;
    Command pid_disable() const;
    Command pid_manual_mode_enable() const;
    Command pid_manual_mode_disable() const;
    Command pid_set_k1(int32_t k) const;
    Command pid_set_k2(int32_t k) const;
    Command pid_set_k3(int32_t k) const;
    Command pid_set_setpoint(uint32_t code) const;
    Command pid_get_temperature() const;

    // Throws ShortRead when the response does not hold a full status word.
    static Status decode_status(const std::vector<uint8_t>& response);

    static uint32_t read_word(const std::vector<uint8_t>& data, size_t offset);

    // Hex dump, one numbered line per record with words printed MSB first.
    static std::string as_legacy_file(const std::vector<Command>& commands);

private:
    enum AcquisitionInstruction : uint16_t {
        GET_IMAGE = 0,
        WRITE_SEQ_MEM = 1,
        ENABLE_SEQ = 2,
        DISABLE_SEQ = 3,
        WRITE_EXPOSE_TIME = 4,
        WRITE_BINNING = 11,
        WRITE_ROI = 12,
        WRITE_GAIN = 13,
        WRITE_SHUTTER = 14
    };

    enum ConfiguratorInstruction : uint16_t {
        POWER_ENABLE = 1
    };

    enum PidInstruction : uint16_t {
        PID_SET_MANIPULATED = 0,
        PID_ENABLE = 1,
        PID_DISABLE = 2,
        PID_MANUAL_ENABLE = 3,
        PID_MANUAL_DISABLE = 4,
        PID_SET_K1 = 5,
        PID_SET_K2 = 6,
        PID_SET_K3 = 7,
        PID_SET_SETPOINT = 8,
        PID_GET_TEMPERATURE = 9
    };

    static constexpr uint16_t SEQUENCER_SUBMODULE = 0;
    static constexpr uint16_t POWER_SUBMODULE = 0;
    static constexpr uint16_t PID_SUBMODULE = 1;

    static Command build(const char* name, Module module, uint16_t submodule, uint16_t instruction,
                         const std::vector<uint32_t>& params = {});
};

}

#endif
