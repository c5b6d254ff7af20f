#pragma once

#include "units/Angle.hpp"
#include "units/Pose.hpp"
#include "units/units.hpp"

namespace odometry {

/**
 * @brief Dead-reckoned pose of the chassis
 *
 * Field frame: +y is compass heading 0 and +x is compass heading 90. The
 * orientation is kept in the library's standard frame, use to_cDeg() or
 * utils::toCompassDegrees() to read it as a compass heading. Updated once
 * per completed maneuver rather than continuously. Not synchronized, mutate
 * it only from the task running the motions.
 */
class PoseTracker {
public:
    /**
     * @brief Start at the origin facing compass heading 0
     */
    PoseTracker();

    explicit PoseTracker(const units::Pose& initialPose);

    units::Pose getPose() const { return m_pose; }

    Angle getHeading() const { return m_pose.orientation; }

    Length getX() const { return m_pose.x; }

    Length getY() const { return m_pose.y; }

    /**
     * @throws control::ConfigurationError if heading is not finite
     */
    void setHeading(Angle heading);

    /**
     * @brief Set the position without touching the heading
     *
     * @throws control::ConfigurationError if either coordinate is not finite
     */
    void setPosition(Length x, Length y);

    /**
     * @brief Return to compass heading 0 at the origin
     */
    void reset();

    /**
     * @brief Record a straight move along a heading
     *
     * Assumes the chassis travelled in a straight line along heading. The
     * path actually driven while correcting is not integrated, so this is a
     * first-order estimate.
     *
     * @param heading Heading driven along
     * @param distance Signed distance, negative when driven in reverse
     */
    void applyStraightMove(Angle heading, Length distance);

    /**
     * @brief Heading from the current position to a point
     */
    Angle headingTo(Length x, Length y) const;

    /**
     * @brief Straight-line distance from the current position to a point
     */
    Length distanceTo(Length x, Length y) const;

private:
    units::Pose m_pose;
};

} // namespace odometry
