#include "DeviceProfile.hpp"
#include "Log.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <stdexcept>

namespace andes {

// Accepts both 1204 and "0x04B4".
static unsigned long parse_id(const boost::property_tree::ptree& parsed, const std::string& path, unsigned long fallback,
                              unsigned long max_value = 0xFFFF) {
    auto text = parsed.get_optional<std::string>(path);
    if (!text.is_initialized()) {
        return fallback;
    }
    size_t consumed = 0;
    unsigned long value = std::stoul(*text, &consumed, 0);
    if (consumed != text->size() || value > max_value) {
        throw std::logic_error(path + " must be a number up to " + std::to_string(max_value) + ", got \"" + *text + "\"");
    }
    return value;
}

DeviceProfile DeviceProfile::defaults() {
    return DeviceProfile();
}

DeviceProfile DeviceProfile::from_ptree(const boost::property_tree::ptree& parsed) {
    if (parsed.get<int>("schema_version") != SCHEMA_VERSION) {
        throw std::logic_error("Unsupported device profile schema_version " + parsed.get<std::string>("schema_version") +
                               ", expected " + std::to_string(SCHEMA_VERSION));
    }

    DeviceProfile profile;

    profile.vendor_id = (uint16_t) parse_id(parsed, "usb.vendor_id", profile.vendor_id);
    profile.product_id = (uint16_t) parse_id(parsed, "usb.product_id", profile.product_id);
    profile.endpoints.command_out = (uint8_t) parse_id(parsed, "usb.command_endpoint", profile.endpoints.command_out, 0xFF);
    profile.endpoints.data_in = (uint8_t) parse_id(parsed, "usb.data_endpoint", profile.endpoints.data_in, 0xFF);
    profile.endpoints.interface_number = parsed.get<int>("usb.interface", profile.endpoints.interface_number);

    SensorLimits& sensor = profile.sensor;
    sensor.width = parsed.get<int>("sensor.width", sensor.width);
    sensor.height = parsed.get<int>("sensor.height", sensor.height);
    sensor.bit_depth = parsed.get<int>("sensor.bit_depth", sensor.bit_depth);
    sensor.min_expose_ms = parsed.get<int>("sensor.min_expose_ms", sensor.min_expose_ms);
    sensor.max_expose_ms = parsed.get<int>("sensor.max_expose_ms", sensor.max_expose_ms);
    sensor.min_gain = parsed.get<int>("sensor.min_gain", sensor.min_gain);
    sensor.max_gain = parsed.get<int>("sensor.max_gain", sensor.max_gain);
    if (sensor.width <= 0 || sensor.height <= 0) {
        throw std::logic_error("sensor.width and sensor.height must be positive");
    }
    if (sensor.bit_depth != 8 && sensor.bit_depth != 12 && sensor.bit_depth != 16) {
        throw std::logic_error("sensor.bit_depth must be 8, 12 or 16");
    }
    if (sensor.min_expose_ms < 0 || sensor.min_expose_ms > sensor.max_expose_ms) {
        throw std::logic_error("sensor exposure limits are inconsistent");
    }
    if (sensor.min_gain > sensor.max_gain) {
        throw std::logic_error("sensor gain limits are inconsistent");
    }

    profile.sequencer.stop_cleaning = parsed.get<uint32_t>("sequencer.stop_cleaning_address", profile.sequencer.stop_cleaning);
    profile.sequencer.get_image = parsed.get<uint32_t>("sequencer.get_image_address", profile.sequencer.get_image);

    TimingProfile& timing = profile.timing;
    timing.command_timeout_ms = parsed.get<unsigned int>("timing.command_timeout_ms", timing.command_timeout_ms);
    timing.readout_margin_ms = parsed.get<unsigned int>("timing.readout_margin_ms", timing.readout_margin_ms);
    timing.poll_interval_ms = parsed.get<unsigned int>("timing.poll_interval_ms", timing.poll_interval_ms);
    timing.chunk_timeout_ms = parsed.get<unsigned int>("timing.chunk_timeout_ms", timing.chunk_timeout_ms);
    timing.max_chunk_bytes = parsed.get<size_t>("timing.max_chunk_bytes", timing.max_chunk_bytes);
    if (timing.max_chunk_bytes == 0 || timing.poll_interval_ms == 0) {
        throw std::logic_error("timing.max_chunk_bytes and timing.poll_interval_ms must be non-zero");
    }

    TemperatureControl& temperature = profile.temperature;
    temperature.manual = parsed.get<bool>("temperature.manual", temperature.manual);
    temperature.manipulated_var = parsed.get<double>("temperature.manipulated_var", temperature.manipulated_var);
    temperature.setpoint = parsed.get<double>("temperature.setpoint", temperature.setpoint);
    temperature.k.k_p = parsed.get<double>("temperature.k_p", temperature.k.k_p);
    temperature.k.k_i = parsed.get<double>("temperature.k_i", temperature.k.k_i);
    temperature.k.k_d = parsed.get<double>("temperature.k_d", temperature.k.k_d);

    return profile;
}

DeviceProfile DeviceProfile::from_file(const std::string& filename) {
    dprintf("DeviceProfile::from_file() - Loading %s\n", filename.c_str());
    boost::property_tree::ptree parsed;
    boost::property_tree::read_json(filename, parsed);
    return from_ptree(parsed);
}

}
