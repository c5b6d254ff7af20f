#pragma once

#include "control/DrivetrainConfig.hpp"
#include "hardware/Motor.hpp"
#include <memory>

namespace control {

/**
 * @brief Maps side commands onto the motors for one drivetrain layout
 *
 * The controllers describe what each side should do as a shared forward
 * speed plus a per-side bias. How that reaches the wheels depends on the
 * physical layout.
 */
class DriveKinematics {
public:
    virtual ~DriveKinematics() = default;

    /**
     * @brief Command both sides of the drivetrain
     *
     * A positive leftBias with a negative rightBias of the same size rotates
     * the chassis clockwise in place.
     *
     * @param left Left side motors
     * @param right Right side motors
     * @param leftBias Differential term for the left side, percent
     * @param rightBias Differential term for the right side, percent
     * @param speed Shared forward speed, percent
     */
    virtual void command(hardware::Motor& left, hardware::Motor& right,
                         double leftBias, double rightBias, double speed) const = 0;

    /**
     * @brief Apply per-side driver outputs
     *
     * @throws ConfigurationError if the layout has no driver mapping
     */
    virtual void drive(hardware::Motor& left, hardware::Motor& right,
                       double leftSpeed, double rightSpeed) const = 0;

    virtual const char* name() const = 0;
};

/**
 * @brief Skid-steer layout, each side drives its own wheels
 */
class TankKinematics : public DriveKinematics {
public:
    void command(hardware::Motor& left, hardware::Motor& right,
                 double leftBias, double rightBias, double speed) const override;

    void drive(hardware::Motor& left, hardware::Motor& right,
               double leftSpeed, double rightSpeed) const override;

    const char* name() const override { return "tank"; }
};

/**
 * @brief X-drive layout, right side motors are mounted mirrored
 *
 * Untested on a real robot. Driver control is not mapped.
 */
class XDriveKinematics : public DriveKinematics {
public:
    void command(hardware::Motor& left, hardware::Motor& right,
                 double leftBias, double rightBias, double speed) const override;

    void drive(hardware::Motor& left, hardware::Motor& right,
               double leftSpeed, double rightSpeed) const override;

    const char* name() const override { return "x-drive"; }
};

/**
 * @brief Create the strategy for a drivetrain layout
 *
 * @throws ConfigurationError for an unknown layout
 */
std::unique_ptr<DriveKinematics> makeKinematics(DrivetrainType type);

} // namespace control
