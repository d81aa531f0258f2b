#include "TemperatureControl.hpp"
#include <algorithm>

namespace andes {

constexpr static double KELVIN_OFFSET = 273.15;
constexpr static double MIN_SETPOINT_C = -25.0;
constexpr static double MAX_SETPOINT_C = 25.0;
constexpr static double MAX_MANIPULATED_V = 2.7;

// Peltier driver transfer function: DAC code for a drive voltage.
static double volts_to_dac(double volts) {
    return (((volts - 0.49548) / 2.7098 / 5.0) / 4.096 + 1) * 4096;
}

std::vector<int32_t> TemperatureControl::k123_codes() const {
    return {
        (int32_t) (k.k_p + k.k_i + k.k_d),
        (int32_t) (-(k.k_p + 2 * k.k_d)),
        (int32_t) k.k_d
    };
}

uint32_t TemperatureControl::setpoint_code() const {
    double min_code = (MIN_SETPOINT_C + KELVIN_OFFSET) * 10;
    double max_code = (MAX_SETPOINT_C + KELVIN_OFFSET) * 10;
    double code = (setpoint + KELVIN_OFFSET) * 10;
    return (uint32_t) std::min(std::max(code, min_code), max_code);
}

uint32_t TemperatureControl::manipulated_var_code() const {
    double min_code = volts_to_dac(0);
    double max_code = volts_to_dac(MAX_MANIPULATED_V);
    double code = volts_to_dac(manipulated_var);
    return (uint32_t) std::min(std::max(code, min_code), max_code);
}

double TemperatureControl::code_to_celsius(int32_t code) {
    return code / 10.0 - KELVIN_OFFSET;
}

std::vector<Command> TemperatureControl::configuration_bytecode(const ByteCode& formatter) const {
    std::vector<Command> lines;
    if (manual) {
        lines.push_back(formatter.pid_set_manipulated_variable(manipulated_var_code()));
        lines.push_back(formatter.pid_disable());
        lines.push_back(formatter.pid_manual_mode_enable());
    } else {
        std::vector<int32_t> k123 = k123_codes();
        lines.push_back(formatter.pid_set_k1(k123[0]));
        lines.push_back(formatter.pid_set_k2(k123[1]));
        lines.push_back(formatter.pid_set_k3(k123[2]));
        lines.push_back(formatter.pid_set_setpoint(setpoint_code()));
        lines.push_back(formatter.pid_manual_mode_disable());
        lines.push_back(formatter.pid_enable());
    }
    return lines;
}

}
