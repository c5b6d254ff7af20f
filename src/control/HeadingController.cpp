#include "control/HeadingController.hpp"
#include "control/DrivetrainErrors.hpp"
#include "utils/AngleUtils.hpp"
#include <cmath>
#include <string>

namespace control {

HeadingController::HeadingController(
    hardware::Motor& leftMotors,
    hardware::Motor& rightMotors,
    hardware::IMU& imu,
    const DriveKinematics& kinematics,
    odometry::PoseTracker& poseTracker,
    rtos::Scheduler& scheduler,
    utils::Logger& logger,
    const DrivetrainConfig& config,
    const rtos::CancellationToken& cancelToken
) : m_leftMotors(leftMotors),
    m_rightMotors(rightMotors),
    m_imu(imu),
    m_kinematics(kinematics),
    m_poseTracker(poseTracker),
    m_scheduler(scheduler),
    m_logger(logger),
    m_config(config),
    m_cancelToken(cancelToken) {}

Angle HeadingController::readHeading() const {
    return m_imu.getHeading();
}

void HeadingController::turnToHeading(Angle desiredHeading) {
    if (!std::isfinite(to_stDeg(desiredHeading))) {
        throw ConfigurationError("Desired heading must be finite");
    }
    if (m_cancelToken.isCancelled()) {
        throw MotionCancelled("turnToHeading cancelled before start");
    }
    desiredHeading = utils::wrapAngle360(desiredHeading);
    std::string target = std::to_string(utils::toCompassDegrees(desiredHeading));

    // Determine how far off the robot is and which way is a shorter turn
    utils::TurnDelta delta = utils::computeTurnDelta(readHeading(), desiredHeading);

    // Stop the drivetrain on every exit path, including sensor faults
    struct StopGuard {
        hardware::Motor& left;
        hardware::Motor& right;
        bool active = true;
        void release() {
            if (active) {
                left.stop();
                right.stop();
                active = false;
            }
        }
        ~StopGuard() { release(); }
    } guard{m_leftMotors, m_rightMotors};

    m_kinematics.command(m_leftMotors, m_rightMotors, 0.0, 0.0, 0.0);
    m_leftMotors.spin(hardware::SpinDirection::FORWARD);
    m_rightMotors.spin(hardware::SpinDirection::FORWARD);

    const uint32_t pollMs = rtos::toMillis(m_config.pollInterval);
    const uint32_t timeoutMs = rtos::toMillis(m_config.turnTimeout);
    uint32_t elapsedMs = 0;
    while (delta.magnitude() > m_config.headingOffsetTolerance) {
        if (m_cancelToken.isCancelled()) {
            guard.release();
            utils::logQuietly(m_logger, "cancelled " + std::to_string(to_stDeg(delta.magnitude())) +
                              " degrees from " + target, "turnToHeading");
            throw MotionCancelled("turnToHeading cancelled");
        }
        if (elapsedMs >= timeoutMs) {
            guard.release();
            std::string message = "turnToHeading timed out after " + std::to_string(elapsedMs) +
                                  " ms, " + std::to_string(to_stDeg(delta.magnitude())) +
                                  " degrees from " + target;
            utils::logQuietly(m_logger, message, "turnToHeading");
            throw MotionTimeout(message);
        }

        double power = to_stDeg(delta.magnitude()) * m_config.turnAggression + m_config.motorStallSpeed;
        double direction = delta.sign();
        m_kinematics.command(m_leftMotors, m_rightMotors, direction * power, -direction * power, 0.0);

        m_scheduler.delay(pollMs);
        elapsedMs += pollMs;

        delta = utils::computeTurnDelta(readHeading(), desiredHeading);
    }

    guard.release();
    m_poseTracker.setHeading(desiredHeading);

    m_scheduler.delay(rtos::toMillis(m_config.settleTime));
    utils::TurnDelta finalDelta = utils::computeTurnDelta(readHeading(), desiredHeading);
    utils::logQuietly(m_logger, "turned to " + target + " with accuracy of " +
                      std::to_string(to_stDeg(finalDelta.magnitude())) + " degrees", "turnToHeading");
}

} // namespace control
