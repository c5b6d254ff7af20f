#include "odometry/PoseTracker.hpp"
#include "control/DrivetrainErrors.hpp"
#include "utils/AngleUtils.hpp"
#include <cmath>

namespace odometry {

PoseTracker::PoseTracker() : m_pose(0_mm, 0_mm, from_cDeg(0)) {}

PoseTracker::PoseTracker(const units::Pose& initialPose) : m_pose(initialPose) {
    m_pose.orientation = utils::wrapAngle360(m_pose.orientation);
}

void PoseTracker::setHeading(Angle heading) {
    if (!std::isfinite(to_stDeg(heading))) {
        throw control::ConfigurationError("Heading must be finite");
    }
    m_pose.orientation = utils::wrapAngle360(heading);
}

void PoseTracker::setPosition(Length x, Length y) {
    if (!std::isfinite(to_mm(x)) || !std::isfinite(to_mm(y))) {
        throw control::ConfigurationError("Position must be finite");
    }
    m_pose.x = x;
    m_pose.y = y;
}

void PoseTracker::reset() {
    m_pose = units::Pose(0_mm, 0_mm, from_cDeg(0));
}

void PoseTracker::applyStraightMove(Angle heading, Length distance) {
    m_pose.orientation = utils::wrapAngle360(heading);
    double cosHeading = units::cos(m_pose.orientation);
    double sinHeading = units::sin(m_pose.orientation);
    m_pose.x += distance * cosHeading;
    m_pose.y += distance * sinHeading;
}

Angle PoseTracker::headingTo(Length x, Length y) const {
    return utils::wrapAngle360(m_pose.angleTo(units::Vector2D<Length>(x, y)));
}

Length PoseTracker::distanceTo(Length x, Length y) const {
    return m_pose.distanceTo(units::Vector2D<Length>(x, y));
}

} // namespace odometry
