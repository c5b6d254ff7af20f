#pragma once

namespace hardware {

/**
 * @brief Joystick axes, named as on the V5 controller
 */
enum class Axis {
    AXIS1, // Right stick, horizontal
    AXIS2, // Right stick, vertical
    AXIS3, // Left stick, vertical
    AXIS4  // Left stick, horizontal
};

/**
 * @brief Capability contract for a two-stick driver controller
 */
class Controller {
public:
    virtual ~Controller() = default;

    /**
     * @brief Read one joystick axis
     *
     * @return Deflection in percent, roughly -100 to 100
     */
    virtual double getAxis(Axis axis) const = 0;
};

} // namespace hardware
