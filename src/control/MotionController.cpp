#include "control/MotionController.hpp"
#include "control/DrivetrainErrors.hpp"
#include "control/PID.hpp"
#include "utils/AngleUtils.hpp"
#include <cmath>
#include <string>

namespace control {

double profileSpeed(double targetSpeed, Length remaining, double stallSpeed, double slowdownSlope) {
    double directionSign = targetSpeed < 0 ? -1.0 : 1.0;
    double magnitude = clamp(stallSpeed + slowdownSlope * to_mm(remaining), 0.0, std::abs(targetSpeed));
    return magnitude * directionSign;
}

MotionController::MotionController(
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

Angle MotionController::averageWheelRotation() const {
    Angle left = m_leftMotors.getPosition();
    Angle right = m_rightMotors.getPosition();
    return (left + right) / 2.0;
}

Length MotionController::distanceTraveled(Angle initialRotation) const {
    double turns = to_stDeg(averageWheelRotation() - initialRotation) / 360.0;
    return units::abs(m_config.wheelCircumference() * turns);
}

void MotionController::moveTowardsHeading(Angle desiredHeading, double targetSpeed, Length distance) {
    if (!std::isfinite(to_stDeg(desiredHeading)) || !std::isfinite(targetSpeed) ||
        !std::isfinite(to_mm(distance))) {
        throw ConfigurationError("Heading, speed and distance must be finite");
    }
    if (targetSpeed == 0.0 || distance == 0_mm) {
        throw ConfigurationError("Both speed and distance must be nonzero");
    }
    if (distance < 0_mm) {
        throw ConfigurationError("Distance must be positive, to drive in reverse set a negative speed");
    }
    if (m_cancelToken.isCancelled()) {
        throw MotionCancelled("moveTowardsHeading cancelled before start");
    }
    desiredHeading = utils::wrapAngle360(desiredHeading);
    double directionSign = targetSpeed < 0 ? -1.0 : 1.0;

    // Averaged wheel rotation at the start is the origin for distance traveled
    Angle initialRotation = averageWheelRotation();
    Length traveled = 0_mm;

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
    const uint32_t timeoutMs = rtos::toMillis(m_config.moveTimeout);
    uint32_t elapsedMs = 0;
    while (true) {
        // Update the drivetrain state from the encoders and the inertial sensor
        traveled = distanceTraveled(initialRotation);
        if (traveled > distance) {
            break;
        }
        Angle currentHeading = m_imu.getHeading();

        if (m_cancelToken.isCancelled()) {
            guard.release();
            utils::logQuietly(m_logger, "cancelled with " + std::to_string(to_mm(distance - traveled)) +
                              "mm remaining", "moveTowardsHeading");
            throw MotionCancelled("moveTowardsHeading cancelled");
        }
        if (elapsedMs >= timeoutMs) {
            guard.release();
            std::string message = "moveTowardsHeading timed out after " + std::to_string(elapsedMs) +
                                  " ms with " + std::to_string(to_mm(distance - traveled)) + "mm remaining";
            utils::logQuietly(m_logger, message, "moveTowardsHeading");
            throw MotionTimeout(message);
        }

        double speed = profileSpeed(targetSpeed, distance - traveled,
                                    m_config.motorStallSpeed, m_config.movementSlowdownSlope);

        // Steer back toward the desired heading along the shorter direction
        utils::TurnDelta delta = utils::computeTurnDelta(currentHeading, desiredHeading);
        double correction = delta.sign() * to_stDeg(delta.magnitude()) * m_config.correctionAggression;
        m_kinematics.command(m_leftMotors, m_rightMotors, correction, -correction, speed);

        m_scheduler.delay(pollMs);
        elapsedMs += pollMs;
    }

    guard.release();
    m_poseTracker.setHeading(desiredHeading);
    m_poseTracker.applyStraightMove(desiredHeading, distance * directionSign);

    m_scheduler.delay(rtos::toMillis(m_config.settleTime));
    utils::TurnDelta finalDelta = utils::computeTurnDelta(m_imu.getHeading(), desiredHeading);
    traveled = distanceTraveled(initialRotation);
    utils::logQuietly(m_logger, "moved towards " + std::to_string(utils::toCompassDegrees(desiredHeading)) +
                      " with heading accuracy of " + std::to_string(to_stDeg(finalDelta.magnitude())) +
                      " degrees and distance accuracy of " + std::to_string(to_mm(distance - traveled)) + "mm",
                      "moveTowardsHeading");
}

} // namespace control
