#include "utils/AngleUtils.hpp"

namespace utils {

Angle wrapAngle360(Angle angle) {
    Angle wrapped = units::constrainAngle360(angle);
    if (wrapped < 0_stDeg) {
        wrapped += 360_stDeg;
    }
    // A tiny negative value can round up to a full turn
    if (wrapped >= 360_stDeg) {
        wrapped = 0_stDeg;
    }
    return wrapped;
}

double toCompassDegrees(Angle heading) {
    return to_stDeg(wrapAngle360(from_stDeg(to_cDeg(heading))));
}

TurnDelta computeTurnDelta(Angle currentHeading, Angle desiredHeading) {
    // Clockwise on the compass is a decreasing standard angle
    Angle left = wrapAngle360(desiredHeading - currentHeading);
    Angle right = wrapAngle360(currentHeading - desiredHeading);
    return {left, right};
}

} // namespace utils
