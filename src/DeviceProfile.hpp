#ifndef ANDES_DEVICE_PROFILE_HPP
#define ANDES_DEVICE_PROFILE_HPP

#include "CameraConfig.hpp"
#include "UsbTransport.hpp"
#include "TemperatureControl.hpp"
#include <boost/property_tree/ptree_fwd.hpp>
#include <cstdint>
#include <string>

namespace andes {

// Transfer timing for one exposure.
struct TimingProfile {
    unsigned int command_timeout_ms = 1000;
    // Added to the exposure time to get the readout-ready deadline.
    unsigned int readout_margin_ms = 500;
    unsigned int poll_interval_ms = 100;
    unsigned int chunk_timeout_ms = 1000;
    size_t max_chunk_bytes = 512 * 1024;
};

// Sequencer memory addresses of the modes GET_IMAGE jumps to.
struct SequencerAddresses {
    uint32_t stop_cleaning = 0;
    uint32_t get_image = 0;
};

// Everything that differs between controller boards and CCDs. Read from JSON.
struct DeviceProfile {
    static constexpr int SCHEMA_VERSION = 1;

    uint16_t vendor_id = 0x04B4;
    uint16_t product_id = 0x00F1;
    UsbEndpoints endpoints;
    SensorLimits sensor;
    SequencerAddresses sequencer;
    TimingProfile timing;
    TemperatureControl temperature;

    // CCD230-42 on the stock controller.
    static DeviceProfile defaults();

    static DeviceProfile from_ptree(const boost::property_tree::ptree& parsed);
    static DeviceProfile from_file(const std::string& filename);
};

}

#endif
