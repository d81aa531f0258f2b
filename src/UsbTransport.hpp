#ifndef ANDES_USB_TRANSPORT_HPP
#define ANDES_USB_TRANSPORT_HPP

#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>

namespace andes {

struct UsbEndpoints {
    uint8_t command_out = 0x01;
    uint8_t data_in = 0x81;
    int interface_number = 0;
};

// Raw USB session with the camera. The open session is the device handle; everything
// above this layer only borrows a reference to it.
class UsbTransport {
public:
    virtual ~UsbTransport() = default;

    // Throws DeviceNotFound, PermissionDenied or TransportError.
    virtual void open(uint16_t vid, uint16_t pid) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Sends one command record. request_code is the record's opcode.
    virtual void send_control(uint32_t request_code, const std::vector<uint8_t>& payload, unsigned int timeout_ms) = 0;

    // Returns up to expected_length bytes; fewer when the device sent a shorter transfer.
    // Throws Timeout only when nothing arrived.
    virtual std::vector<uint8_t> bulk_read(size_t expected_length, unsigned int timeout_ms) = 0;

    // true when a matching device arrived, false when it left.
    using HotplugHandler = std::function<void(bool arrived)>;

    // Reports arrival and removal of vid/pid devices on a transport-owned thread.
    // Returns false when the platform cannot report them.
    virtual bool watch_hotplug(uint16_t vid, uint16_t pid, HotplugHandler handler) = 0;
    // Blocks until no handler call is running any more.
    virtual void unwatch_hotplug() = 0;
};

}

#endif
