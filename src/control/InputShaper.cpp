#include "control/InputShaper.hpp"
#include "control/PID.hpp"
#include <algorithm>
#include <cmath>

namespace control {

double applyDeadzone(double value, double deadzone) {
    if (std::abs(value) < deadzone) {
        return 0.0;
    }
    if (deadzone >= 1.0) {
        return 0.0;
    }
    // Preserve a "live" zone of 0.0 to 1.0
    return (value - std::copysign(deadzone, value)) / (1.0 - deadzone);
}

double cubicResponse(double value, double linearity) {
    return (value * value * value + linearity * value) / (1.0 + linearity);
}

SlewLimiter::SlewLimiter(double maxRatePerSecond, std::function<uint32_t()> clock)
    : m_maxRate(maxRatePerSecond), m_clock(std::move(clock)) {
    m_previousTime = m_clock ? m_clock() : 0;
}

double SlewLimiter::update(double newValue) {
    uint32_t now = m_clock ? m_clock() : m_previousTime;
    double dt = (now - m_previousTime) / 1000.0;
    m_previousTime = now;
    return update(newValue, dt);
}

double SlewLimiter::update(double newValue, double dtSeconds) {
    if (m_maxRate <= 0.0) {
        m_previousValue = newValue;
        return newValue;
    }
    double maxStep = m_maxRate * std::max(dtSeconds, 0.0);
    double delta = clamp(newValue - m_previousValue, -maxStep, maxStep);
    m_previousValue += delta;
    return m_previousValue;
}

void SlewLimiter::reset(double value) {
    m_previousValue = value;
    m_previousTime = m_clock ? m_clock() : 0;
}

} // namespace control
