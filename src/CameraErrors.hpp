#ifndef ANDES_CAMERA_ERRORS_HPP
#define ANDES_CAMERA_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace andes {

class CameraError : public std::runtime_error {
public:
    explicit CameraError(const std::string& what) : std::runtime_error(what) {}
};

class DeviceNotFound : public CameraError {
public:
    DeviceNotFound(uint16_t vid, uint16_t pid);

    uint16_t vendor_id() const { return vid; }
    uint16_t product_id() const { return pid; }

private:
    uint16_t vid;
    uint16_t pid;
};

// The device exists but the OS refused access. Callers usually react with a udev-rule hint.
class PermissionDenied : public CameraError {
public:
    PermissionDenied(uint16_t vid, uint16_t pid);

    static std::string udev_hint(uint16_t vid, uint16_t pid);
};

class InvalidParameter : public CameraError {
public:
    InvalidParameter(const std::string& field, long long value, const std::string& constraint);

    const std::string& field() const { return field_name; }
    long long value() const { return bad_value; }
    const std::string& constraint() const { return constraint_text; }

private:
    std::string field_name;
    long long bad_value;
    std::string constraint_text;
};

class DeviceBusy : public CameraError {
public:
    explicit DeviceBusy(const std::string& state_name);
};

class NotConfigured : public CameraError {
public:
    NotConfigured() : CameraError("Camera has no applied configuration, call configure() first") {}
};

class TransportError : public CameraError {
public:
    explicit TransportError(const std::string& what) : CameraError(what) {}
};

class Timeout : public TransportError {
public:
    explicit Timeout(const std::string& what) : TransportError(what) {}
};

class ShortRead : public TransportError {
public:
    ShortRead(size_t expected, size_t received);

    size_t expected() const { return expected_bytes; }
    size_t received() const { return received_bytes; }

private:
    size_t expected_bytes;
    size_t received_bytes;
};

class CaptureTimeout : public CameraError {
public:
    explicit CaptureTimeout(unsigned int waited_ms);
};

class CaptureCancelled : public CameraError {
public:
    CaptureCancelled() : CameraError("Capture cancelled") {}
};

class IncompleteFrame : public CameraError {
public:
    IncompleteFrame(size_t expected, size_t received);

    size_t expected() const { return expected_bytes; }
    size_t received() const { return received_bytes; }

private:
    size_t expected_bytes;
    size_t received_bytes;
};

class DeviceError : public CameraError {
public:
    explicit DeviceError(uint32_t code);

    uint32_t code() const { return raw_code; }

private:
    uint32_t raw_code;
};

// Terminal for the session: the camera must be reopened.
class Disconnected : public CameraError {
public:
    Disconnected() : CameraError("Camera disconnected") {}
};

}

#endif
