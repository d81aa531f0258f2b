#include "DeviceState.hpp"

namespace andes {

const char* to_string(StateKind kind) {
    switch (kind) {
        case StateKind::Disconnected: return "Disconnected";
        case StateKind::Idle: return "Idle";
        case StateKind::Exposing: return "Exposing";
        case StateKind::ReadingOut: return "ReadingOut";
        case StateKind::Error: return "Error";
    }
    return "Unknown";
}

DeviceState DeviceState::disconnected() {
    return DeviceState();
}

DeviceState DeviceState::idle(const std::optional<CameraConfig>& config) {
    DeviceState s;
    s.kind = StateKind::Idle;
    s.active_config = config;
    return s;
}

DeviceState DeviceState::exposing(const CameraConfig& config, std::chrono::steady_clock::time_point start) {
    DeviceState s;
    s.kind = StateKind::Exposing;
    s.active_config = config;
    s.start_time = start;
    return s;
}

DeviceState DeviceState::reading_out(const CameraConfig& config) {
    DeviceState s;
    s.kind = StateKind::ReadingOut;
    s.active_config = config;
    return s;
}

DeviceState DeviceState::error(const std::string& reason) {
    DeviceState s;
    s.kind = StateKind::Error;
    s.reason = reason;
    return s;
}

}
