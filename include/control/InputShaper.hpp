#pragma once

#include <cstdint>
#include <functional>

namespace control {

/**
 * @brief Zero small inputs and rescale the rest
 *
 * Inputs with |value| below the deadzone return 0. The surviving range
 * [deadzone, 1] is mapped back onto [0, 1] with the sign preserved, so the
 * output is continuous at the deadzone edge.
 *
 * @param value Input, -1.0 to 1.0
 * @param deadzone Fraction of the range treated as zero, 0.0 to 1.0
 * @return Shaped input, -1.0 to 1.0
 */
double applyDeadzone(double value, double deadzone);

/**
 * @brief Map an input across a cubic curve blended with a linear term
 *
 * Small deflections produce proportionally smaller output than a linear
 * mapping. The endpoints are fixed: 0 maps to 0 and +-1 maps to +-1.
 *
 * @param value Input, -1.0 to 1.0
 * @param linearity 0.0 is a pure cubic, larger values approach linear (0.0 to 3.0)
 */
double cubicResponse(double value, double linearity);

/**
 * @brief Limits how fast a commanded value may change
 */
class SlewLimiter {
public:
    /**
     * @brief Construct a slew limiter
     *
     * @param maxRatePerSecond Largest allowed change per second, <= 0 disables limiting
     * @param clock Millisecond clock used by update(double)
     */
    SlewLimiter(double maxRatePerSecond, std::function<uint32_t()> clock);

    /**
     * @brief Step toward newValue, using the clock for the elapsed time
     */
    double update(double newValue);

    /**
     * @brief Step toward newValue over an explicit time step
     *
     * @param newValue Requested value
     * @param dtSeconds Time since the previous update
     * @return The rate limited value
     */
    double update(double newValue, double dtSeconds);

    /**
     * @brief Forget the history and start from value
     */
    void reset(double value = 0.0);

    double getValue() const { return m_previousValue; }

    double getMaxRate() const { return m_maxRate; }

private:
    double m_maxRate;
    std::function<uint32_t()> m_clock;
    double m_previousValue = 0.0;
    uint32_t m_previousTime = 0;
};

} // namespace control
