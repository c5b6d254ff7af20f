#pragma once

#include "units/Angle.hpp"
#include "units/units.hpp"

namespace control {

/**
 * @brief Physical layout of the drivetrain
 */
enum class DrivetrainType {
    TANK,
    X_DRIVE // Untested placeholder
};

/**
 * @brief Joystick mapping used during driver control
 */
enum class DriverControlStyle {
    TANK,
    ARCADE // Not implemented
};

/**
 * @brief Configuration for the drivetrain and its control loops
 *
 * Speeds are in percent. Gains are percent per degree of heading error,
 * the slowdown slope is percent per mm.
 */
struct DrivetrainConfig {
    Angle headingOffsetTolerance;    // Heading error accepted as "on target"
    Length wheelRadius;              // Drive wheel radius
    double turnAggression;           // Proportional gain while turning in place
    double correctionAggression;     // Proportional gain for heading correction while driving
    double motorStallSpeed;          // Lowest speed at which the wheels still turn
    double movementSlowdownSlope;    // Percent speed removed per mm closer to the target
    double driverControlLinearity;   // Cubic curve shape, 0 is pure cubic
    double driverControlDeadzone;    // Fraction of stick travel treated as zero
    DriverControlStyle driverControlStyle;
    DrivetrainType drivetrainType;

    double driverSlewRate = 0.0;     // Percent per second, 0 disables
    Time pollInterval = 10_msec;     // Control loop period
    Time settleTime = 500_msec;      // Pause after a maneuver before measuring the result
    Time turnTimeout = 5_sec;
    Time moveTimeout = 10_sec;

    /**
     * @brief Construct a drivetrain configuration
     *
     * @param headingOffsetTolerance Acceptable heading error
     * @param wheelRadius Radius of the drive wheels
     * @param turnAggression How aggressive to be while turning
     * @param correctionAggression How aggressive to be while correcting heading on the move
     * @param motorStallSpeed Speed in percent at which the motors just barely spin
     * @param movementSlowdownSlope Percent to decelerate for every mm closer to the target
     * @param driverControlLinearity How close to linear the stick mapping is, 0.0 to 3.0
     * @param driverControlDeadzone Stick fraction treated as zero, 0.0 is no deadzone
     * @param driverControlStyle Joystick mapping
     * @param drivetrainType Physical drivetrain layout
     */
    DrivetrainConfig(
        Angle headingOffsetTolerance = 1_stDeg,
        Length wheelRadius = 50_mm,
        double turnAggression = 0.25,
        double correctionAggression = 0.1,
        double motorStallSpeed = 1.0,
        double movementSlowdownSlope = 0.2,
        double driverControlLinearity = 0.45,
        double driverControlDeadzone = 0.0,
        DriverControlStyle driverControlStyle = DriverControlStyle::TANK,
        DrivetrainType drivetrainType = DrivetrainType::TANK
    ) : headingOffsetTolerance(headingOffsetTolerance), wheelRadius(wheelRadius),
        turnAggression(turnAggression), correctionAggression(correctionAggression),
        motorStallSpeed(motorStallSpeed), movementSlowdownSlope(movementSlowdownSlope),
        driverControlLinearity(driverControlLinearity), driverControlDeadzone(driverControlDeadzone),
        driverControlStyle(driverControlStyle), drivetrainType(drivetrainType) {}

    Length wheelCircumference() const;

    /**
     * @brief Check every field against its valid range
     *
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

} // namespace control
