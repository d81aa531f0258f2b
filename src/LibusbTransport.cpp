#include "LibusbTransport.hpp"
#include "CameraErrors.hpp"
#include "CleanupHelper.hpp"
#include "Log.hpp"
#include <cstdio>

namespace andes {

static std::string opcode_name(uint32_t request_code) {
    char buf[16];
    snprintf(buf, sizeof(buf), "0x%08X", request_code);
    return buf;
}

LibusbTransport::LibusbTransport(const UsbEndpoints& endpoints) : endpoints(endpoints) {
    if (libusb_init(&ctx) < 0) {
        dprintf("LibusbTransport - Failed to initialize libusb\n");
        ctx = nullptr;
    }
}

LibusbTransport::~LibusbTransport() {
    unwatch_hotplug();
    close();
    if (ctx) {
        libusb_exit(ctx);
    }
}

libusb_device_handle* LibusbTransport::find_and_open(uint16_t vid, uint16_t pid) {
    libusb_device** list = nullptr;
    ssize_t count = libusb_get_device_list(ctx, &list);
    if (count < 0) {
        throw TransportError(std::string("Could not enumerate USB devices: ") + libusb_error_name((int) count));
    }
    CleanupHelper free_list([list]() { libusb_free_device_list(list, 1); });

    bool found = false;
    int last_rc = LIBUSB_SUCCESS;
    for (ssize_t i = 0; i < count; ++i) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(list[i], &desc) < 0) continue;
        if (desc.idVendor != vid || desc.idProduct != pid) continue;

        found = true;
        libusb_device_handle* handle = nullptr;
        last_rc = libusb_open(list[i], &handle);
        if (last_rc == LIBUSB_SUCCESS) {
            return handle;
        }
        dprintf("LibusbTransport::open() - Matching device on bus %d refused: %s\n",
                libusb_get_bus_number(list[i]), libusb_error_name(last_rc));
    }

    if (!found) {
        throw DeviceNotFound(vid, pid);
    }
    if (last_rc == LIBUSB_ERROR_ACCESS) {
        throw PermissionDenied(vid, pid);
    }
    throw TransportError(std::string("Could not open camera: ") + libusb_error_name(last_rc));
}

void LibusbTransport::open(uint16_t vid, uint16_t pid) {
    if (!ctx) {
        throw TransportError("libusb is not initialized");
    }
    if (dev_handle) return;

    dprintf("LibusbTransport::open() - Searching for device VID: 0x%04X, PID: 0x%04X\n", vid, pid);
    libusb_device_handle* handle = find_and_open(vid, pid);
    CleanupHelper close_handle([handle]() { libusb_close(handle); });

    // Unlike a UVC camera there is no kernel driver we want to keep, so let libusb detach it.
    int rc = libusb_set_auto_detach_kernel_driver(handle, 1);
    if (rc != LIBUSB_SUCCESS) {
        dprintf("LibusbTransport::open() - Kernel driver auto-detach unavailable: %s\n", libusb_error_name(rc));
    }

    rc = libusb_claim_interface(handle, endpoints.interface_number);
    if (rc == LIBUSB_ERROR_ACCESS) {
        throw PermissionDenied(vid, pid);
    }
    if (rc == LIBUSB_ERROR_NO_DEVICE) {
        throw Disconnected();
    }
    if (rc < 0) {
        throw TransportError(std::string("Could not claim camera interface: ") + libusb_error_name(rc));
    }

    close_handle.dismiss();
    dev_handle = handle;
    interface_claimed = true;
    dprintf("LibusbTransport::open() - Device opened and interface %d claimed.\n", endpoints.interface_number);
}

void LibusbTransport::close() {
    if (!dev_handle) return;

    if (interface_claimed) {
        int rc = libusb_release_interface(dev_handle, endpoints.interface_number);
        if (rc < 0 && rc != LIBUSB_ERROR_NO_DEVICE) {
            dprintf("LibusbTransport::close() - Releasing interface failed: %s\n", libusb_error_name(rc));
        }
        interface_claimed = false;
    }
    libusb_close(dev_handle);
    dev_handle = nullptr;
    dprintf("LibusbTransport::close() - Device closed.\n");
}

bool LibusbTransport::is_open() const {
    return dev_handle != nullptr;
}

void LibusbTransport::throw_transfer_error(int rc, const std::string& hint) {
    switch (rc) {
        case LIBUSB_ERROR_NO_DEVICE:
            throw Disconnected();
        case LIBUSB_ERROR_TIMEOUT:
            throw Timeout(hint + ": timed out");
        default:
            throw TransportError(hint + ": " + libusb_error_name(rc));
    }
}

void LibusbTransport::send_control(uint32_t request_code, const std::vector<uint8_t>& payload, unsigned int timeout_ms) {
    if (!dev_handle) throw Disconnected();

    // The controller takes command records on the bulk OUT endpoint, not on EP0.
    std::vector<uint8_t> buffer(payload);
    int transferred = 0;
    int rc = libusb_bulk_transfer(dev_handle, endpoints.command_out, buffer.data(), (int) buffer.size(),
                                  &transferred, timeout_ms);
    if (rc < 0) {
        throw_transfer_error(rc, "Sending command " + opcode_name(request_code));
    }
    if ((size_t) transferred != payload.size()) {
        throw TransportError("Command " + opcode_name(request_code) + " only partially written (" +
                             std::to_string(transferred) + " of " + std::to_string(payload.size()) + " bytes)");
    }
}

std::vector<uint8_t> LibusbTransport::bulk_read(size_t expected_length, unsigned int timeout_ms) {
    if (!dev_handle) throw Disconnected();

    std::vector<uint8_t> buffer(expected_length);
    int transferred = 0;
    int rc = libusb_bulk_transfer(dev_handle, endpoints.data_in, buffer.data(), (int) buffer.size(),
                                  &transferred, timeout_ms);
    // A timeout after partial data still hands back what arrived.
    if (rc == LIBUSB_ERROR_TIMEOUT && transferred > 0) {
        rc = LIBUSB_SUCCESS;
    }
    if (rc < 0) {
        throw_transfer_error(rc, "Bulk read");
    }
    buffer.resize((size_t) transferred);
    return buffer;
}

int LIBUSB_CALL LibusbTransport::on_hotplug(libusb_context*, libusb_device*, libusb_hotplug_event event,
                                            void* user_data) {
    LibusbTransport* self = static_cast<LibusbTransport*>(user_data);
    bool arrived = event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED;
    dprintf("LibusbTransport - Camera %s\n", arrived ? "plugged in" : "unplugged");
    if (self->hotplug_handler) {
        self->hotplug_handler(arrived);
    }
    // Keep the callback registered.
    return 0;
}

void LibusbTransport::handle_events() {
    while (watching) {
        timeval tv = {0, 100000};
        int rc = libusb_handle_events_timeout_completed(ctx, &tv, nullptr);
        if (rc < 0 && rc != LIBUSB_ERROR_INTERRUPTED) {
            dprintf("LibusbTransport - Event handling stopped: %s\n", libusb_error_name(rc));
            break;
        }
    }
}

bool LibusbTransport::watch_hotplug(uint16_t vid, uint16_t pid, HotplugHandler handler) {
    if (!ctx) {
        throw TransportError("libusb is not initialized");
    }
    if (!libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        dprintf("LibusbTransport::watch_hotplug() - Hotplug is not supported on this platform\n");
        return false;
    }
    unwatch_hotplug();

    hotplug_handler = std::move(handler);
    int rc = libusb_hotplug_register_callback(
            ctx, (libusb_hotplug_event) (LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED | LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
            LIBUSB_HOTPLUG_NO_FLAGS, vid, pid, LIBUSB_HOTPLUG_MATCH_ANY, &LibusbTransport::on_hotplug, this,
            &hotplug_handle);
    if (rc != LIBUSB_SUCCESS) {
        hotplug_handler = nullptr;
        throw TransportError(std::string("Could not register hotplug callback: ") + libusb_error_name(rc));
    }

    watching = true;
    event_thread = std::thread(&LibusbTransport::handle_events, this);
    dprintf("LibusbTransport::watch_hotplug() - Watching VID: 0x%04X, PID: 0x%04X\n", vid, pid);
    return true;
}

void LibusbTransport::unwatch_hotplug() {
    if (!event_thread.joinable()) return;

    watching = false;
    // Deregistering also wakes up the event thread.
    libusb_hotplug_deregister_callback(ctx, hotplug_handle);
    event_thread.join();
    hotplug_handler = nullptr;
}

}
