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
#include "units/units.hpp"

namespace control {

/**
 * @brief Commanded speed for a given distance remaining
 *
 * Saturates at |targetSpeed| far from the target and decays linearly toward
 * the stall speed as the target approaches, re-signed for reverse travel.
 *
 * @param targetSpeed Cruise speed in percent, sign selects direction
 * @param remaining Distance left to travel
 * @param stallSpeed Lowest speed that still moves the chassis, percent
 * @param slowdownSlope Percent removed per mm closer to the target
 */
double profileSpeed(double targetSpeed, Length remaining, double stallSpeed, double slowdownSlope);

/**
 * @brief Drives a distance along a heading with live heading correction
 */
class MotionController {
public:
    /**
     * @brief Construct a new Motion Controller
     *
     * @param leftMotors Left side motors, also the left distance encoder
     * @param rightMotors Right side motors, also the right distance encoder
     * @param imu Inertial sensor providing the heading
     * @param kinematics Layout strategy used to command the sides
     * @param poseTracker Pose updated after each move
     * @param scheduler Timing services for the polling loop
     * @param logger Diagnostic sink
     * @param config Drivetrain configuration, must outlive the controller
     * @param cancelToken Checked every iteration
     */
    MotionController(
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
     * @brief Move towards a heading using dynamic course correction
     *
     * @param desiredHeading Absolute heading to move along
     * @param targetSpeed Cruise speed in percent, negative drives in reverse
     * @param distance Distance to travel before stopping, must be positive
     * @throws ConfigurationError if speed or distance is zero or distance is negative
     * @throws MotionTimeout if the distance is not covered within the move timeout
     * @throws MotionCancelled if the cancel token is set
     */
    void moveTowardsHeading(Angle desiredHeading, double targetSpeed, Length distance);

    /**
     * @brief Mean accumulated rotation of both sides
     *
     * The two sides are read one after the other, not atomically.
     */
    Angle averageWheelRotation() const;

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

    Length distanceTraveled(Angle initialRotation) const;
};

} // namespace control
