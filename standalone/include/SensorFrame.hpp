#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

using FeatureVector = std::vector<double>;

// One decoded inbound message. Pressure values are raw FSR readings; inertial
// data is optional and only consulted by the second cascade stage.
struct SensorFrame {
    std::int64_t messageId{0};
    std::string deviceId;
    std::vector<double> pressure;
    bool hasInertial{false};
    std::array<double, 3> accel{{0.0, 0.0, 0.0}};
    std::array<double, 3> gyro{{0.0, 0.0, 0.0}};

    // accel followed by gyro
    std::vector<double> inertial() const {
        return {accel[0], accel[1], accel[2], gyro[0], gyro[1], gyro[2]};
    }
};
