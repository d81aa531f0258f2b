#include "CameraErrors.hpp"
#include <cstdio>

namespace andes {

static std::string hex_id(uint16_t id) {
    char buf[8];
    snprintf(buf, sizeof(buf), "%04x", id);
    return buf;
}

static std::string hex_word(uint32_t word) {
    char buf[12];
    snprintf(buf, sizeof(buf), "0x%08X", word);
    return buf;
}

DeviceNotFound::DeviceNotFound(uint16_t vid, uint16_t pid)
    : CameraError("No camera found with VID 0x" + hex_id(vid) + ", PID 0x" + hex_id(pid)), vid(vid), pid(pid) {}

PermissionDenied::PermissionDenied(uint16_t vid, uint16_t pid)
    : CameraError("Permission denied opening camera 0x" + hex_id(vid) + ":0x" + hex_id(pid) + ". " + udev_hint(vid, pid)) {}

std::string PermissionDenied::udev_hint(uint16_t vid, uint16_t pid) {
    return "Add a udev rule such as SUBSYSTEM==\"usb\", ATTR{idVendor}==\"" + hex_id(vid) +
           "\", ATTR{idProduct}==\"" + hex_id(pid) + "\", MODE=\"0666\" to /etc/udev/rules.d/ and replug the camera.";
}

InvalidParameter::InvalidParameter(const std::string& field, long long value, const std::string& constraint)
    : CameraError("Invalid " + field + " = " + std::to_string(value) + " (" + constraint + ")"),
      field_name(field), bad_value(value), constraint_text(constraint) {}

DeviceBusy::DeviceBusy(const std::string& state_name)
    : CameraError("Camera busy (state: " + state_name + ")") {}

ShortRead::ShortRead(size_t expected, size_t received)
    : TransportError("Short read: expected " + std::to_string(expected) + " bytes, got " + std::to_string(received)),
      expected_bytes(expected), received_bytes(received) {}

CaptureTimeout::CaptureTimeout(unsigned int waited_ms)
    : CameraError("Exposure did not complete within " + std::to_string(waited_ms) + " ms") {}

IncompleteFrame::IncompleteFrame(size_t expected, size_t received)
    : CameraError("Incomplete frame: expected " + std::to_string(expected) + " bytes, received " + std::to_string(received)),
      expected_bytes(expected), received_bytes(received) {}

DeviceError::DeviceError(uint32_t code)
    : CameraError("Device returned error code " + hex_word(code)), raw_code(code) {}

}
