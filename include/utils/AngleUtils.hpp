#pragma once

#include "units/Angle.hpp"
#include "units/units.hpp"

namespace utils {

/**
 * @brief Direction of an in-place turn
 *
 * LEFT is counterclockwise (compass heading decreasing), RIGHT is clockwise.
 */
enum class TurnDirection {
    LEFT,
    RIGHT
};

/**
 * @brief Both candidate turns from one heading to another
 */
struct TurnDelta {
    Angle left;  // Counterclockwise turn, [0, 360) degrees
    Angle right; // Clockwise turn, [0, 360) degrees

    /**
     * @brief The shorter of the two turns, RIGHT on a tie
     */
    TurnDirection shortest() const {
        return left < right ? TurnDirection::LEFT : TurnDirection::RIGHT;
    }

    /**
     * @brief Size of the shorter turn
     */
    Angle magnitude() const {
        return left < right ? left : right;
    }

    /**
     * @brief +1 if the shorter turn is clockwise, -1 otherwise
     */
    double sign() const {
        return shortest() == TurnDirection::RIGHT ? 1.0 : -1.0;
    }
};

/**
 * @brief Wrap an angle into [0, 360) degrees
 */
Angle wrapAngle360(Angle angle);

/**
 * @brief Compass reading of an angle, degrees in [0, 360)
 *
 * 0 points along +y and the reading grows clockwise.
 */
double toCompassDegrees(Angle heading);

/**
 * @brief Compute both turns that take current onto desired
 *
 * @param currentHeading Heading now
 * @param desiredHeading Heading wanted
 */
TurnDelta computeTurnDelta(Angle currentHeading, Angle desiredHeading);

} // namespace utils
