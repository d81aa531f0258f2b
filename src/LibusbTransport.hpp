#ifndef ANDES_LIBUSB_TRANSPORT_HPP
#define ANDES_LIBUSB_TRANSPORT_HPP

#include "UsbTransport.hpp"
#include <libusb-1.0/libusb.h>
#include <atomic>
#include <string>
#include <thread>

namespace andes {

class LibusbTransport : public UsbTransport {
public:
    explicit LibusbTransport(const UsbEndpoints& endpoints = UsbEndpoints());

    virtual ~LibusbTransport();

    LibusbTransport(const LibusbTransport&) = delete;
    LibusbTransport& operator=(const LibusbTransport&) = delete;

    void open(uint16_t vid, uint16_t pid) override;

    void close() override;

    bool is_open() const override;

    void send_control(uint32_t request_code, const std::vector<uint8_t>& payload, unsigned int timeout_ms) override;

    std::vector<uint8_t> bulk_read(size_t expected_length, unsigned int timeout_ms) override;

    bool watch_hotplug(uint16_t vid, uint16_t pid, HotplugHandler handler) override;

    void unwatch_hotplug() override;

private:
    libusb_device_handle* find_and_open(uint16_t vid, uint16_t pid);
    void throw_transfer_error(int rc, const std::string& hint);
    void handle_events();

    static int LIBUSB_CALL on_hotplug(libusb_context* ctx, libusb_device* device, libusb_hotplug_event event,
                                      void* user_data);

    UsbEndpoints endpoints;
    libusb_context* ctx = nullptr;
    libusb_device_handle* dev_handle = nullptr;
    bool interface_claimed = false;

    HotplugHandler hotplug_handler;
    libusb_hotplug_callback_handle hotplug_handle = 0;
    std::thread event_thread;
    std::atomic<bool> watching{false};
};

}

#endif
