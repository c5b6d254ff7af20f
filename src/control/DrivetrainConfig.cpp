#include "control/DrivetrainConfig.hpp"
#include "control/DrivetrainErrors.hpp"
#include "rtos/Scheduler.hpp"
#include <cmath>

namespace control {

namespace {

void require(bool condition, const char* message) {
    if (!condition) {
        throw ConfigurationError(message);
    }
}

bool finite(double value) {
    return std::isfinite(value);
}

} // namespace

Length DrivetrainConfig::wheelCircumference() const {
    return wheelRadius * (2.0 * M_PI);
}

void DrivetrainConfig::validate() const {
    require(finite(to_stDeg(headingOffsetTolerance)) && headingOffsetTolerance > 0_stDeg,
            "headingOffsetTolerance must be greater than 0");
    require(finite(to_mm(wheelRadius)) && wheelRadius > 0_mm,
            "wheelRadius must be greater than 0");
    require(finite(turnAggression) && turnAggression >= 0,
            "turnAggression must not be negative");
    require(finite(correctionAggression) && correctionAggression >= 0,
            "correctionAggression must not be negative");
    require(finite(motorStallSpeed) && motorStallSpeed >= 0 && motorStallSpeed <= 100,
            "motorStallSpeed must be between 0 and 100 percent");
    require(finite(movementSlowdownSlope) && movementSlowdownSlope >= 0,
            "movementSlowdownSlope must not be negative");
    require(finite(driverControlLinearity) && driverControlLinearity >= 0 && driverControlLinearity <= 3,
            "driverControlLinearity must be between 0.0 and 3.0");
    require(finite(driverControlDeadzone) && driverControlDeadzone >= 0 && driverControlDeadzone < 1,
            "driverControlDeadzone must be at least 0.0 and below 1.0");
    require(finite(driverSlewRate) && driverSlewRate >= 0,
            "driverSlewRate must not be negative");
    // The loops sleep in whole milliseconds
    require(finite(to_msec(pollInterval)) && rtos::toMillis(pollInterval) > 0,
            "pollInterval must be at least 1 ms");
    require(finite(to_msec(settleTime)) && settleTime >= 0_msec,
            "settleTime must not be negative");
    require(finite(to_msec(turnTimeout)) && turnTimeout > 0_msec,
            "turnTimeout must be greater than 0");
    require(finite(to_msec(moveTimeout)) && moveTimeout > 0_msec,
            "moveTimeout must be greater than 0");
    require(driverControlStyle == DriverControlStyle::TANK || driverControlStyle == DriverControlStyle::ARCADE,
            "Invalid driver control style, use DriverControlStyle::TANK or DriverControlStyle::ARCADE");
    require(drivetrainType == DrivetrainType::TANK || drivetrainType == DrivetrainType::X_DRIVE,
            "Invalid drivetrain type, use DrivetrainType::TANK or DrivetrainType::X_DRIVE");
}

} // namespace control
