#pragma once

#include "units/Angle.hpp"

namespace hardware {

/**
 * @brief Capability contract for a single-axis inertial sensor
 *
 * The heading is a compass heading, build and read values with from_cDeg()
 * and to_cDeg(). Implementations throw std::runtime_error if the sensor
 * cannot be read.
 */
class IMU {
public:
    virtual ~IMU() = default;

    virtual Angle getHeading() const = 0;

    virtual void setHeading(Angle heading) = 0;
};

} // namespace hardware
