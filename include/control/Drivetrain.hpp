#pragma once

#include "control/DriveKinematics.hpp"
#include "control/DrivetrainConfig.hpp"
#include "control/HeadingController.hpp"
#include "control/InputShaper.hpp"
#include "control/MotionController.hpp"
#include "hardware/Controller.hpp"
#include "hardware/IMU.hpp"
#include "hardware/Motor.hpp"
#include "odometry/PoseTracker.hpp"
#include "rtos/CancellationToken.hpp"
#include "rtos/Scheduler.hpp"
#include "utils/Logger.hpp"
#include "units/Angle.hpp"
#include "units/Pose.hpp"
#include "units/units.hpp"
#include <memory>

namespace control {

/**
 * @brief A drivetrain with built-in dynamic course correction
 *
 * Owns the configuration and the dead-reckoned pose. The motors, inertial
 * sensor, scheduler and logger belong to the application and must outlive
 * the drivetrain.
 */
class Drivetrain {
public:
    /**
     * @brief Construct a new Drivetrain
     *
     * @param leftMotors Motors on the left side of the robot
     * @param rightMotors Motors on the right side of the robot
     * @param imu Inertial sensor used for heading
     * @param scheduler Timing services for the control loops
     * @param config Drivetrain configuration, copied and validated
     * @param logger Diagnostic sink
     * @throws ConfigurationError if the configuration is invalid
     */
    Drivetrain(
        hardware::Motor& leftMotors,
        hardware::Motor& rightMotors,
        hardware::IMU& imu,
        rtos::Scheduler& scheduler,
        const DrivetrainConfig& config,
        utils::Logger& logger
    );

    Drivetrain(const Drivetrain&) = delete;
    Drivetrain& operator=(const Drivetrain&) = delete;

    /**
     * @brief Turn to an absolute heading using the inertial sensor
     *
     * @param desiredHeading The heading to turn to, e.g. from_cDeg(90)
     */
    void turnToHeading(Angle desiredHeading);

    /**
     * @brief Turn by an angle relative to the tracked heading
     *
     * @param deltaHeading Angle to turn, positive is clockwise like a compass
     */
    void turnRelative(Angle deltaHeading);

    /**
     * @brief Move towards a heading using dynamic course correction
     *
     * @param desiredHeading The absolute heading to move towards
     * @param targetSpeed The base speed to move at, negative to reverse
     * @param distance The distance to move before stopping
     */
    void moveTowardsHeading(Angle desiredHeading, double targetSpeed, Length distance);

    /**
     * @brief Turn towards a point and drive to it
     *
     * @param x Target x, +x is compass heading 90
     * @param y Target y, +y is compass heading 0
     * @param targetSpeed The speed to move at, negative to reverse
     */
    void moveToPosition(Length x, Length y, double targetSpeed);

    /**
     * @brief Apply one update of driver control from the joysticks
     *
     * Call this in the driver control loop.
     *
     * @param controller The controller to get input from
     * @throws ConfigurationError for an unimplemented control style or layout
     */
    void moveWithController(const hardware::Controller& controller);

    /**
     * @brief Stop both sides, the next moveWithController() restarts them
     */
    void stop();

    /**
     * @brief Stop the drivetrain, zero the inertial sensor and the pose
     */
    void reset();

    /**
     * @brief Set the tracked position without modifying heading
     *
     * @throws ConfigurationError if either coordinate is not finite
     */
    void setPosition(Length x, Length y);

    /**
     * @brief Set the tracked heading
     *
     * @throws ConfigurationError if heading is not finite
     */
    void setHeading(Angle heading);

    /**
     * @brief Ask a running turn or move to stop, from any task
     *
     * Motions stay refused until clearCancellation() is called.
     */
    void cancelMotion();

    void clearCancellation();

    Angle getCurrentHeading() const { return m_poseTracker.getHeading(); }

    Length getCurrentX() const { return m_poseTracker.getX(); }

    Length getCurrentY() const { return m_poseTracker.getY(); }

    units::Pose getPose() const { return m_poseTracker.getPose(); }

    const DrivetrainConfig& getConfig() const { return m_config; }

private:
    hardware::Motor& m_leftMotors;
    hardware::Motor& m_rightMotors;
    hardware::IMU& m_imu;
    rtos::Scheduler& m_scheduler;
    utils::Logger& m_logger;
    const DrivetrainConfig m_config;
    std::unique_ptr<DriveKinematics> m_kinematics;
    odometry::PoseTracker m_poseTracker;
    rtos::CancellationToken m_cancelToken;
    HeadingController m_headingController;
    MotionController m_motionController;
    SlewLimiter m_leftSlew;
    SlewLimiter m_rightSlew;
    bool m_driverSpinning = false;

    static const DrivetrainConfig& validated(const DrivetrainConfig& config);
};

} // namespace control
