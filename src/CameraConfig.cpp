#include "CameraConfig.hpp"
#include "CameraErrors.hpp"
#include "Log.hpp"

namespace andes {

const char* to_string(ConfigField field) {
    switch (field) {
        case ConfigField::Binning: return "binning";
        case ConfigField::Roi: return "roi";
        case ConfigField::Gain: return "gain";
        case ConfigField::Shutter: return "shutter";
        case ConfigField::ExposureTime: return "expose_time_ms";
    }
    return "unknown";
}

CameraConfig::CameraConfig(const SensorLimits& limits) : sensor(limits) {
    if (shutter_state.expose_time_ms < sensor.min_expose_ms) shutter_state.expose_time_ms = sensor.min_expose_ms;
    if (shutter_state.expose_time_ms > sensor.max_expose_ms) shutter_state.expose_time_ms = sensor.max_expose_ms;
    if (gain_value < sensor.min_gain) gain_value = sensor.min_gain;
}

void CameraConfig::set_binning(int x, int y) {
    if (x < 1) throw InvalidParameter("binning.x", x, ">= 1");
    if (y < 1) throw InvalidParameter("binning.y", y, ">= 1");
    if (sensor.width % x != 0) {
        throw InvalidParameter("binning.x", x, "must divide sensor width " + std::to_string(sensor.width));
    }
    if (sensor.height % y != 0) {
        throw InvalidParameter("binning.y", y, "must divide sensor height " + std::to_string(sensor.height));
    }

    Binning next{x, y};
    if (region) {
        try {
            validate_roi(*region, next);
        } catch (const InvalidParameter& e) {
            dprintf("CameraConfig::set_binning() - Clearing ROI that no longer fits %dx%d binning: %s\n", x, y, e.what());
            region.reset();
        }
    }
    bin = next;
}

void CameraConfig::set_shutter(bool open) {
    shutter_state.open = open;
}

void CameraConfig::set_exposure_time(int expose_time_ms) {
    if (expose_time_ms < 0) throw InvalidParameter("expose_time_ms", expose_time_ms, ">= 0");
    if (expose_time_ms < sensor.min_expose_ms) {
        throw InvalidParameter("expose_time_ms", expose_time_ms, ">= device minimum " + std::to_string(sensor.min_expose_ms));
    }
    if (expose_time_ms > sensor.max_expose_ms) {
        throw InvalidParameter("expose_time_ms", expose_time_ms, "<= device maximum " + std::to_string(sensor.max_expose_ms));
    }
    shutter_state.expose_time_ms = expose_time_ms;
}

void CameraConfig::validate_roi(const RegionOfInterest& candidate, const Binning& with_binning) const {
    int binned_width = sensor.width / with_binning.x;
    int binned_height = sensor.height / with_binning.y;

    if (candidate.x < 0) throw InvalidParameter("roi.x", candidate.x, ">= 0");
    if (candidate.y < 0) throw InvalidParameter("roi.y", candidate.y, ">= 0");
    if (candidate.width < 1) throw InvalidParameter("roi.width", candidate.width, ">= 1");
    if (candidate.height < 1) throw InvalidParameter("roi.height", candidate.height, ">= 1");
    if (candidate.x + candidate.width > binned_width) {
        throw InvalidParameter("roi.width", candidate.width,
                               "x + width <= binned sensor width " + std::to_string(binned_width));
    }
    if (candidate.y + candidate.height > binned_height) {
        throw InvalidParameter("roi.height", candidate.height,
                               "y + height <= binned sensor height " + std::to_string(binned_height));
    }
}

void CameraConfig::set_roi(int x, int y, int width, int height) {
    RegionOfInterest candidate{x, y, width, height};
    validate_roi(candidate, bin);
    region = candidate;
}

void CameraConfig::clear_roi() {
    region.reset();
}

void CameraConfig::set_gain(int gain) {
    if (gain < sensor.min_gain || gain > sensor.max_gain) {
        throw InvalidParameter("gain", gain,
                               "in [" + std::to_string(sensor.min_gain) + ", " + std::to_string(sensor.max_gain) + "]");
    }
    gain_value = gain;
}

int CameraConfig::image_width() const {
    return region ? region->width : sensor.width / bin.x;
}

int CameraConfig::image_height() const {
    return region ? region->height : sensor.height / bin.y;
}

std::set<ConfigField> CameraConfig::diff(const std::optional<CameraConfig>& active) const {
    if (!active) {
        return {ConfigField::Binning, ConfigField::Roi, ConfigField::Gain, ConfigField::Shutter, ConfigField::ExposureTime};
    }

    std::set<ConfigField> changed;
    if (!(bin == active->bin)) changed.insert(ConfigField::Binning);
    if (region != active->region) changed.insert(ConfigField::Roi);
    if (gain_value != active->gain_value) changed.insert(ConfigField::Gain);
    if (shutter_state.open != active->shutter_state.open) changed.insert(ConfigField::Shutter);
    if (shutter_state.expose_time_ms != active->shutter_state.expose_time_ms) changed.insert(ConfigField::ExposureTime);
    return changed;
}

bool CameraConfig::operator==(const CameraConfig& other) const {
    return diff(other).empty();
}

}
