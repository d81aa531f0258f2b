#ifndef ANDES_DEVICE_STATE_HPP
#define ANDES_DEVICE_STATE_HPP

#include "CameraConfig.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace andes {

enum class StateKind {
    Disconnected,
    Idle,
    Exposing,
    ReadingOut,
    Error
};

const char* to_string(StateKind kind);

// Only the fields that belong to `kind` are meaningful:
// Idle/Exposing/ReadingOut carry active_config (Idle may have none yet),
// Exposing carries start_time, Error carries reason.
struct DeviceState {
    StateKind kind = StateKind::Disconnected;
    std::optional<CameraConfig> active_config;
    std::chrono::steady_clock::time_point start_time;
    std::string reason;

    static DeviceState disconnected();
    static DeviceState idle(const std::optional<CameraConfig>& config);
    static DeviceState exposing(const CameraConfig& config, std::chrono::steady_clock::time_point start);
    static DeviceState reading_out(const CameraConfig& config);
    static DeviceState error(const std::string& reason);
};

}

#endif
