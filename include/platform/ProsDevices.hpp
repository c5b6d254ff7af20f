#pragma once

#include "hardware/Controller.hpp"
#include "hardware/IMU.hpp"
#include "hardware/Motor.hpp"
#include "pros/imu.hpp"
#include "pros/misc.hpp"
#include "pros/motor_group.hpp"

namespace platform {

/**
 * @brief V5 motor group behind the hardware::Motor contract
 *
 * Percent velocities are scaled by the cartridge's free speed.
 */
class ProsMotorGroup : public hardware::Motor {
public:
    /**
     * @param motors PROS motor group, encoder units are set to degrees
     * @param maxRpm Free speed of the fitted cartridge (100, 200 or 600)
     */
    ProsMotorGroup(pros::MotorGroup& motors, double maxRpm);

    void setVelocity(double value, hardware::VelocityUnit unit = hardware::VelocityUnit::PERCENT) override;

    void spin(hardware::SpinDirection direction) override;

    void stop() override;

    Angle getPosition() const override;

    double getVelocity(hardware::VelocityUnit unit = hardware::VelocityUnit::PERCENT) const override;

    void setBrakeMode(hardware::BrakeMode mode) override;

private:
    pros::MotorGroup& m_motors;
    double m_maxRpm;
    double m_velocityRpm = 0.0;
    bool m_spinning = false;
    double m_direction = 1.0;

    void apply();
};

/**
 * @brief V5 inertial sensor behind the hardware::IMU contract
 */
class ProsInertial : public hardware::IMU {
public:
    explicit ProsInertial(pros::Imu& imu);

    Angle getHeading() const override;

    void setHeading(Angle heading) override;

    /**
     * @brief Calibrate and block until done
     */
    void calibrate();

private:
    pros::Imu& m_imu;
};

/**
 * @brief V5 controller behind the hardware::Controller contract
 */
class ProsController : public hardware::Controller {
public:
    explicit ProsController(pros::Controller& controller);

    double getAxis(hardware::Axis axis) const override;

private:
    pros::Controller& m_controller;
};

} // namespace platform
