#pragma once

#include "units/Angle.hpp"

namespace hardware {

/**
 * @brief Units accepted for velocity commands and readings
 */
enum class VelocityUnit {
    PERCENT,
    RPM
};

enum class SpinDirection {
    FORWARD,
    REVERSE
};

enum class BrakeMode {
    COAST,
    BRAKE,
    HOLD
};

/**
 * @brief Capability contract for a single motor or a group of motors
 *
 * Velocity set with setVelocity() takes effect once the motor is spinning.
 * Calling setVelocity() while spinning updates the output immediately.
 */
class Motor {
public:
    virtual ~Motor() = default;

    /**
     * @brief Set the velocity used while spinning
     *
     * @param value Velocity, in percent of max speed by default
     * @param unit Unit of value
     */
    virtual void setVelocity(double value, VelocityUnit unit = VelocityUnit::PERCENT) = 0;

    /**
     * @brief Start spinning at the last set velocity
     */
    virtual void spin(SpinDirection direction) = 0;

    /**
     * @brief Stop the motor using the configured brake mode
     */
    virtual void stop() = 0;

    /**
     * @brief Cumulative rotation of the motor since the last reset
     */
    virtual Angle getPosition() const = 0;

    /**
     * @brief Measured velocity, signed
     */
    virtual double getVelocity(VelocityUnit unit = VelocityUnit::PERCENT) const = 0;

    virtual void setBrakeMode(BrakeMode mode) = 0;
};

} // namespace hardware
