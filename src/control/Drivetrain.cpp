#include "control/Drivetrain.hpp"
#include "control/DrivetrainErrors.hpp"
#include <cmath>
#include <string>

namespace control {

const DrivetrainConfig& Drivetrain::validated(const DrivetrainConfig& config) {
    config.validate();
    return config;
}

Drivetrain::Drivetrain(
    hardware::Motor& leftMotors,
    hardware::Motor& rightMotors,
    hardware::IMU& imu,
    rtos::Scheduler& scheduler,
    const DrivetrainConfig& config,
    utils::Logger& logger
) : m_leftMotors(leftMotors),
    m_rightMotors(rightMotors),
    m_imu(imu),
    m_scheduler(scheduler),
    m_logger(logger),
    m_config(validated(config)),
    m_kinematics(makeKinematics(m_config.drivetrainType)),
    m_headingController(leftMotors, rightMotors, imu, *m_kinematics, m_poseTracker,
                        scheduler, logger, m_config, m_cancelToken),
    m_motionController(leftMotors, rightMotors, imu, *m_kinematics, m_poseTracker,
                       scheduler, logger, m_config, m_cancelToken),
    m_leftSlew(m_config.driverSlewRate, [&scheduler]() { return scheduler.millis(); }),
    m_rightSlew(m_config.driverSlewRate, [&scheduler]() { return scheduler.millis(); }) {}

void Drivetrain::turnToHeading(Angle desiredHeading) {
    m_driverSpinning = false;
    m_headingController.turnToHeading(desiredHeading);
}

void Drivetrain::turnRelative(Angle deltaHeading) {
    // Clockwise on the compass is a decreasing standard angle
    turnToHeading(m_poseTracker.getHeading() - deltaHeading);
}

void Drivetrain::moveTowardsHeading(Angle desiredHeading, double targetSpeed, Length distance) {
    m_driverSpinning = false;
    m_motionController.moveTowardsHeading(desiredHeading, targetSpeed, distance);
}

void Drivetrain::moveToPosition(Length x, Length y, double targetSpeed) {
    if (!std::isfinite(to_mm(x)) || !std::isfinite(to_mm(y))) {
        throw ConfigurationError("Target position must be finite");
    }
    // Reject a bad speed before turning, so no partial maneuver happens
    if (targetSpeed == 0.0 || !std::isfinite(targetSpeed)) {
        throw ConfigurationError("Both speed and distance must be nonzero");
    }

    Length distance = m_poseTracker.distanceTo(x, y);
    if (distance < 0.000001_mm) {
        utils::logQuietly(m_logger, "already at (" + std::to_string(to_mm(x)) + ", " +
                          std::to_string(to_mm(y)) + ")", "moveToPosition");
        return;
    }
    Angle angle = m_poseTracker.headingTo(x, y);

    turnToHeading(angle);
    moveTowardsHeading(angle, targetSpeed, distance);
}

void Drivetrain::moveWithController(const hardware::Controller& controller) {
    if (m_config.driverControlStyle == DriverControlStyle::ARCADE) {
        throw ConfigurationError("Arcade drive not yet implemented, use DriverControlStyle::TANK");
    }
    if (m_config.driverControlStyle != DriverControlStyle::TANK) {
        throw ConfigurationError("Invalid driver control style");
    }

    double leftInput = applyDeadzone(controller.getAxis(hardware::Axis::AXIS3) / 100.0,
                                     m_config.driverControlDeadzone);
    double rightInput = applyDeadzone(controller.getAxis(hardware::Axis::AXIS2) / 100.0,
                                      m_config.driverControlDeadzone);
    double leftSpeed = cubicResponse(leftInput, m_config.driverControlLinearity) * 100.0;
    double rightSpeed = cubicResponse(rightInput, m_config.driverControlLinearity) * 100.0;

    if (!m_driverSpinning) {
        m_leftSlew.reset(0.0);
        m_rightSlew.reset(0.0);
    }
    leftSpeed = m_leftSlew.update(leftSpeed);
    rightSpeed = m_rightSlew.update(rightSpeed);

    m_kinematics->drive(m_leftMotors, m_rightMotors, leftSpeed, rightSpeed);
    if (!m_driverSpinning) {
        m_leftMotors.spin(hardware::SpinDirection::FORWARD);
        m_rightMotors.spin(hardware::SpinDirection::FORWARD);
        m_driverSpinning = true;
    }
}

void Drivetrain::stop() {
    m_leftMotors.stop();
    m_rightMotors.stop();
    m_driverSpinning = false;
}

void Drivetrain::reset() {
    stop();
    m_leftMotors.setVelocity(0.0);
    m_rightMotors.setVelocity(0.0);
    m_imu.setHeading(from_cDeg(0));
    m_poseTracker.reset();
}

void Drivetrain::setPosition(Length x, Length y) {
    m_poseTracker.setPosition(x, y);
}

void Drivetrain::setHeading(Angle heading) {
    m_poseTracker.setHeading(heading);
}

void Drivetrain::cancelMotion() {
    m_cancelToken.cancel();
}

void Drivetrain::clearCancellation() {
    m_cancelToken.reset();
}

} // namespace control
