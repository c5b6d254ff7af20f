#pragma once

#include <algorithm>
#include <cmath>

namespace control {

// Fallback implementation of clamp for older C++ standards
template<typename T>
T clamp(const T& value, const T& low, const T& high) {
    return std::max(low, std::min(value, high));
}

/**
 * @brief Fixed-period proportional-derivative controller working on error
 *
 * The first step after construction or reset() seeds the previous error with
 * the current one, so a large initial error does not produce a derivative kick.
 */
class PID {
private:
    // Gains
    double kP; // Proportional gain
    double kD; // Derivative gain
    double period; // Seconds between steps

    // Controller state
    double previousError;
    double derivative;
    double output;
    bool initialized;

public:
    /**
     * @brief Construct a new PD controller
     *
     * @param kP Proportional gain
     * @param kD Derivative gain
     * @param period Time between calls to step(), in seconds
     */
    PID(double kP, double kD, double period)
        : kP(kP), kD(kD), period(period),
          previousError(0), derivative(0), output(0), initialized(false) {}

    /**
     * @brief Reset the controller state
     */
    void reset() {
        previousError = 0.0;
        derivative = 0.0;
        output = 0.0;
        initialized = false;
    }

    /**
     * @brief Advance the controller by one period
     *
     * @param error Setpoint minus measurement
     * @return Output value
     */
    double step(double error) {
        if (!initialized) {
            previousError = error;
            initialized = true;
        }

        derivative = period > 0.0 ? (error - previousError) / period : 0.0;
        output = kP * error + kD * derivative;

        previousError = error;
        return output;
    }

    /**
     * @brief Update controller gains
     */
    void setGains(double kP, double kD) {
        this->kP = kP;
        this->kD = kD;
    }

    double getKp() const {
        return kP;
    }

    double getKd() const {
        return kD;
    }

    double getPeriod() const {
        return period;
    }

    /**
     * @brief Error passed to the most recent step
     */
    double getPreviousError() const {
        return previousError;
    }

    double getDerivative() const {
        return derivative;
    }

    double getOutput() const {
        return output;
    }

    /**
     * @brief False until the first step after construction or reset()
     */
    bool isInitialized() const {
        return initialized;
    }
};

} // namespace control
