#pragma once

#include "control/DriveKinematics.hpp"
#include "control/DrivetrainConfig.hpp"
#include "hardware/IMU.hpp"
#include "hardware/Motor.hpp"
#include "odometry/PoseTracker.hpp"
#include "rtos/CancellationToken.hpp"
#include "rtos/Scheduler.hpp"
#include "utils/Logger.hpp"
#include "units/Angle.hpp"

namespace control {

/**
 * @brief Turns the chassis in place to an absolute heading
 *
 * Proportional control on the shorter of the two possible turns, re-chosen
 * every iteration so the direction flips if the chassis overshoots.
 */
class HeadingController {
public:
    /**
     * @brief Construct a new Heading Controller
     *
     * @param leftMotors Left side motors
     * @param rightMotors Right side motors
     * @param imu Inertial sensor providing the heading
     * @param kinematics Layout strategy used to command the sides
     * @param poseTracker Pose updated after each turn
     * @param scheduler Timing services for the polling loop
     * @param logger Diagnostic sink
     * @param config Drivetrain configuration, must outlive the controller
     * @param cancelToken Checked every iteration
     */
    HeadingController(
        hardware::Motor& leftMotors,
        hardware::Motor& rightMotors,
        hardware::IMU& imu,
        const DriveKinematics& kinematics,
        odometry::PoseTracker& poseTracker,
        rtos::Scheduler& scheduler,
        utils::Logger& logger,
        const DrivetrainConfig& config,
        const rtos::CancellationToken& cancelToken
    );

    /**
     * @brief Turn to an absolute heading using the inertial sensor
     *
     * Blocks until the heading error is within the configured tolerance, then
     * stops, records the heading and pauses for the chassis to settle.
     *
     * @param desiredHeading Heading to turn to, e.g. from_cDeg(90)
     * @throws ConfigurationError if desiredHeading is not finite
     * @throws MotionTimeout if the turn does not converge within the turn timeout
     * @throws MotionCancelled if the cancel token is set
     */
    void turnToHeading(Angle desiredHeading);

    Angle readHeading() const;

private:
    hardware::Motor& m_leftMotors;
    hardware::Motor& m_rightMotors;
    hardware::IMU& m_imu;
    const DriveKinematics& m_kinematics;
    odometry::PoseTracker& m_poseTracker;
    rtos::Scheduler& m_scheduler;
    utils::Logger& m_logger;
    const DrivetrainConfig& m_config;
    const rtos::CancellationToken& m_cancelToken;
};

} // namespace control
