#pragma once

#include "hardware/Controller.hpp"
#include "hardware/IMU.hpp"
#include "hardware/Motor.hpp"
#include "rtos/Scheduler.hpp"
#include "utils/AngleUtils.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sim {

// 200 rpm cartridge at 100 percent
constexpr double ENCODER_DEG_PER_SEC_PER_PERCENT = 12.0;
// Heading rate for one percent of (left - right) / 2
constexpr double TURN_DEG_PER_SEC_PER_PERCENT = 10.0;

/**
 * @brief Degrees between a heading and a compass reading, always in [0, 180]
 *
 * Compares around the circle, so 359.9999 and 0 are a hair apart.
 */
inline double headingError(Angle actual, double expectedCompassDegrees) {
    return to_stDeg(utils::computeTurnDelta(actual, from_cDeg(expectedCompassDegrees)).magnitude());
}

/**
 * @brief Motor whose velocity follows the command with an optional first-order lag
 */
class SimMotor : public hardware::Motor {
public:
    /**
     * @param efficiency Fraction of the command actually delivered
     * @param response Fraction of the velocity gap closed every 10 ms, 1.0 is instant
     */
    explicit SimMotor(double efficiency = 1.0, double response = 1.0)
        : m_efficiency(efficiency), m_response(response) {}

    void setVelocity(double value, hardware::VelocityUnit unit = hardware::VelocityUnit::PERCENT) override {
        ++setVelocityCalls;
        m_commanded = unit == hardware::VelocityUnit::PERCENT ? value : value / 2.0;
    }

    void spin(hardware::SpinDirection direction) override {
        ++spinCalls;
        m_direction = direction == hardware::SpinDirection::FORWARD ? 1.0 : -1.0;
        m_spinning = true;
    }

    void stop() override {
        ++stopCalls;
        m_spinning = false;
    }

    Angle getPosition() const override {
        return from_stDeg(m_position);
    }

    double getVelocity(hardware::VelocityUnit unit = hardware::VelocityUnit::PERCENT) const override {
        return unit == hardware::VelocityUnit::PERCENT ? m_velocity : m_velocity * 2.0;
    }

    void setBrakeMode(hardware::BrakeMode mode) override {
        brakeMode = mode;
    }

    void advance(double dtSeconds) {
        double target = m_spinning ? m_direction * m_commanded * m_efficiency : 0.0;
        double alpha = 1.0 - std::pow(1.0 - m_response, dtSeconds / 0.01);
        m_velocity += alpha * (target - m_velocity);
        m_position += m_velocity * ENCODER_DEG_PER_SEC_PER_PERCENT * dtSeconds;
    }

    double getCommanded() const { return m_commanded; }

    bool isSpinning() const { return m_spinning; }

    void setEfficiency(double efficiency) { m_efficiency = efficiency; }

    int setVelocityCalls = 0;
    int spinCalls = 0;
    int stopCalls = 0;
    hardware::BrakeMode brakeMode = hardware::BrakeMode::COAST;

private:
    double m_efficiency;
    double m_response;
    double m_commanded = 0.0;
    double m_direction = 1.0;
    bool m_spinning = false;
    double m_position = 0.0;
    double m_velocity = 0.0;
};

class SimChassis;

/**
 * @brief Inertial sensor reading the simulated chassis heading
 */
class SimIMU : public hardware::IMU {
public:
    explicit SimIMU(SimChassis& chassis) : m_chassis(chassis) {}

    Angle getHeading() const override;

    void setHeading(Angle heading) override;

    // Reads left before the sensor starts throwing, negative never throws
    mutable int readsBeforeFault = -1;
    mutable int reads = 0;

private:
    SimChassis& m_chassis;
};

/**
 * @brief Differential chassis driven by two simulated motors
 *
 * With mirroredRight set, the right motors are mounted reversed as on an
 * X-drive, so a positive right command drives the right wheels backward.
 */
class SimChassis {
public:
    explicit SimChassis(double rightEfficiency = 1.0)
        : right(rightEfficiency), imu(*this) {}

    void advance(double dtSeconds) {
        left.advance(dtSeconds);
        right.advance(dtSeconds);
        double leftVelocity = left.getVelocity();
        double rightVelocity = mirroredRight ? -right.getVelocity() : right.getVelocity();

        heading = wrapDegrees(
            heading + TURN_DEG_PER_SEC_PER_PERCENT * (leftVelocity - rightVelocity) / 2.0 * dtSeconds);

        double wheelMmPerDeg = 2.0 * M_PI * wheelRadiusMm / 360.0;
        double speed = (leftVelocity + rightVelocity) / 2.0 * ENCODER_DEG_PER_SEC_PER_PERCENT * wheelMmPerDeg;
        double headingRad = heading * M_PI / 180.0;
        x += std::sin(headingRad) * speed * dtSeconds;
        y += std::cos(headingRad) * speed * dtSeconds;
    }

    static double wrapDegrees(double degrees) {
        double wrapped = std::fmod(degrees, 360.0);
        return wrapped < 0 ? wrapped + 360.0 : wrapped;
    }

    SimMotor left;
    SimMotor right;
    SimIMU imu;
    bool mirroredRight = false;
    double wheelRadiusMm = 50.0;
    double heading = 0.0; // Compass degrees
    double x = 0.0;       // mm
    double y = 0.0;       // mm
};

inline Angle SimIMU::getHeading() const {
    if (readsBeforeFault == 0) {
        throw std::runtime_error("Inertial sensor disconnected");
    }
    if (readsBeforeFault > 0) {
        --readsBeforeFault;
    }
    ++reads;
    return from_cDeg(m_chassis.heading);
}

inline void SimIMU::setHeading(Angle heading) {
    m_chassis.heading = utils::toCompassDegrees(heading);
}

/**
 * @brief Scheduler whose clock only moves when delay() is called
 *
 * Each delay advances the chassis physics in steps of at most 10 ms.
 */
class SimScheduler : public rtos::Scheduler {
public:
    explicit SimScheduler(SimChassis& chassis) : m_chassis(chassis) {}

    std::unique_ptr<rtos::TaskHandle> spawn(std::function<void()>, const std::string& name) override {
        throw std::logic_error("SimScheduler cannot spawn " + name);
    }

    void delay(uint32_t ms) override {
        ++delayCalls;
        while (ms > 0) {
            uint32_t step = std::min<uint32_t>(ms, 10);
            m_chassis.advance(step / 1000.0);
            m_now += step;
            ms -= step;
        }
        if (onDelay) {
            onDelay(m_now);
        }
    }

    uint32_t millis() const override { return m_now; }

    std::function<void(uint32_t)> onDelay;
    int delayCalls = 0;

private:
    SimChassis& m_chassis;
    uint32_t m_now = 0;
};

class SimController : public hardware::Controller {
public:
    double getAxis(hardware::Axis axis) const override {
        return m_axes[static_cast<int>(axis)];
    }

    void setAxis(hardware::Axis axis, double percent) {
        m_axes[static_cast<int>(axis)] = percent;
    }

private:
    double m_axes[4] = {0.0, 0.0, 0.0, 0.0};
};

/**
 * @brief Keeps every message for inspection
 */
class RecordingLogger : public utils::Logger {
public:
    void log(const std::string& message, const std::string& tag) override {
        entries.emplace_back(tag, message);
    }

    bool contains(const std::string& tag, const std::string& fragment) const {
        return std::any_of(entries.begin(), entries.end(), [&](const std::pair<std::string, std::string>& entry) {
            return entry.first == tag && entry.second.find(fragment) != std::string::npos;
        });
    }

    std::vector<std::pair<std::string, std::string>> entries;
};

class ThrowingLogger : public utils::Logger {
public:
    void log(const std::string&, const std::string&) override {
        throw std::runtime_error("log storage full");
    }
};

} // namespace sim
