#ifndef ANDES_CAMERA_CONFIG_HPP
#define ANDES_CAMERA_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace andes {

// What the sensor and firmware accept. Loaded from the device profile.
struct SensorLimits {
    int width = 2048;
    int height = 2064;
    int bit_depth = 16;
    int min_expose_ms = 0;
    int max_expose_ms = 3600000;
    int min_gain = 0;
    int max_gain = 7;
};

struct Binning {
    int x = 1;
    int y = 1;

    bool operator==(const Binning& other) const { return x == other.x && y == other.y; }
};

struct Shutter {
    bool open = true;
    int expose_time_ms = 30;
};

// In binned pixel coordinates.
struct RegionOfInterest {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const RegionOfInterest& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const RegionOfInterest& other) const { return !(*this == other); }
};

enum class ConfigField {
    Binning,
    Roi,
    Gain,
    Shutter,
    ExposureTime
};

const char* to_string(ConfigField field);

// Staged camera settings. Setters validate on assignment and never talk to the device;
// the values only reach the camera through configure().
class CameraConfig {
public:
    explicit CameraConfig(const SensorLimits& limits = SensorLimits());

    void set_binning(int x, int y);
    void set_shutter(bool open);
    void set_exposure_time(int expose_time_ms);
    void set_roi(int x, int y, int width, int height);
    void clear_roi();
    void set_gain(int gain);

    const Binning& binning() const { return bin; }
    const Shutter& shutter() const { return shutter_state; }
    const std::optional<RegionOfInterest>& roi() const { return region; }
    int gain() const { return gain_value; }
    const SensorLimits& limits() const { return sensor; }

    // Width/height of the frame the camera will produce with these settings.
    int image_width() const;
    int image_height() const;

    // Fields that differ from `active`. Everything when nothing was applied yet.
    std::set<ConfigField> diff(const std::optional<CameraConfig>& active) const;

    bool operator==(const CameraConfig& other) const;
    bool operator!=(const CameraConfig& other) const { return !(*this == other); }

private:
    void validate_roi(const RegionOfInterest& candidate, const Binning& with_binning) const;

    SensorLimits sensor;
    Binning bin;
    Shutter shutter_state;
    std::optional<RegionOfInterest> region;
    int gain_value = 0;
};

}

#endif
