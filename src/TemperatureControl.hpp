#ifndef ANDES_TEMPERATURE_CONTROL_HPP
#define ANDES_TEMPERATURE_CONTROL_HPP

#include "ByteCode.hpp"
#include <cstdint>
#include <vector>

namespace andes {

// CCD cooler settings. In manual mode the peltier drive voltage is fixed;
// otherwise the controller runs its PID loop towards the setpoint.
class TemperatureControl {
public:
    struct Gains {
        double k_p = 0;
        double k_i = 0;
        double k_d = 0;
    };

    bool manual = true;
    // Volts applied to the peltier in manual mode.
    double manipulated_var = 0;
    // Degrees Celsius.
    double setpoint = 0;
    Gains k;

    // Digital PID coefficients (k_p + k_i + k_d, -(k_p + 2 k_d), k_d).
    std::vector<int32_t> k123_codes() const;
    uint32_t setpoint_code() const;
    uint32_t manipulated_var_code() const;

    static double code_to_celsius(int32_t code);

    std::vector<Command> configuration_bytecode(const ByteCode& formatter) const;
};

}

#endif
