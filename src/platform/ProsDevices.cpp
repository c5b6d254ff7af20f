#include "platform/ProsDevices.hpp"
#include "pros/error.h"
#include "utils/AngleUtils.hpp"
#include <cerrno>
#include <cstdint>
#include <cmath>
#include <cstring>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace platform {

namespace {

void checkStatus(int32_t status, const char* what) {
    if (status == PROS_ERR) {
        throw std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
    }
}

double checkReading(double value, const char* what) {
    if (value == PROS_ERR_F) {
        throw std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
    }
    return value;
}

double average(const std::vector<double>& values, const char* what) {
    if (values.empty()) {
        throw std::runtime_error(std::string(what) + " failed: motor group is empty");
    }
    for (double value : values) {
        checkReading(value, what);
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace

ProsMotorGroup::ProsMotorGroup(pros::MotorGroup& motors, double maxRpm)
    : m_motors(motors), m_maxRpm(maxRpm) {
    checkStatus(m_motors.set_encoder_units_all(pros::MotorEncoderUnits::degrees), "set_encoder_units");
}

void ProsMotorGroup::setVelocity(double value, hardware::VelocityUnit unit) {
    m_velocityRpm = unit == hardware::VelocityUnit::PERCENT ? value / 100.0 * m_maxRpm : value;
    if (m_spinning) {
        apply();
    }
}

void ProsMotorGroup::spin(hardware::SpinDirection direction) {
    m_direction = direction == hardware::SpinDirection::FORWARD ? 1.0 : -1.0;
    m_spinning = true;
    apply();
}

void ProsMotorGroup::stop() {
    m_spinning = false;
    checkStatus(m_motors.brake(), "brake");
}

void ProsMotorGroup::apply() {
    auto rpm = static_cast<int32_t>(std::lround(m_direction * m_velocityRpm));
    checkStatus(m_motors.move_velocity(rpm), "move_velocity");
}

Angle ProsMotorGroup::getPosition() const {
    return from_stDeg(average(m_motors.get_position_all(), "get_position"));
}

double ProsMotorGroup::getVelocity(hardware::VelocityUnit unit) const {
    double rpm = average(m_motors.get_actual_velocity_all(), "get_actual_velocity");
    return unit == hardware::VelocityUnit::RPM ? rpm : rpm / m_maxRpm * 100.0;
}

void ProsMotorGroup::setBrakeMode(hardware::BrakeMode mode) {
    switch (mode) {
        case hardware::BrakeMode::COAST:
            checkStatus(m_motors.set_brake_mode_all(pros::MotorBrake::coast), "set_brake_mode");
            break;
        case hardware::BrakeMode::BRAKE:
            checkStatus(m_motors.set_brake_mode_all(pros::MotorBrake::brake), "set_brake_mode");
            break;
        case hardware::BrakeMode::HOLD:
            checkStatus(m_motors.set_brake_mode_all(pros::MotorBrake::hold), "set_brake_mode");
            break;
    }
}

ProsInertial::ProsInertial(pros::Imu& imu) : m_imu(imu) {}

Angle ProsInertial::getHeading() const {
    // PROS reports a compass heading in [0, 360)
    return from_cDeg(checkReading(m_imu.get_heading(), "Inertial get_heading"));
}

void ProsInertial::setHeading(Angle heading) {
    checkStatus(m_imu.set_heading(utils::toCompassDegrees(heading)), "Inertial set_heading");
}

void ProsInertial::calibrate() {
    checkStatus(m_imu.reset(true), "Inertial calibrate");
}

ProsController::ProsController(pros::Controller& controller) : m_controller(controller) {}

double ProsController::getAxis(hardware::Axis axis) const {
    pros::controller_analog_e_t channel = pros::E_CONTROLLER_ANALOG_LEFT_Y;
    switch (axis) {
        case hardware::Axis::AXIS1:
            channel = pros::E_CONTROLLER_ANALOG_RIGHT_X;
            break;
        case hardware::Axis::AXIS2:
            channel = pros::E_CONTROLLER_ANALOG_RIGHT_Y;
            break;
        case hardware::Axis::AXIS3:
            channel = pros::E_CONTROLLER_ANALOG_LEFT_Y;
            break;
        case hardware::Axis::AXIS4:
            channel = pros::E_CONTROLLER_ANALOG_LEFT_X;
            break;
    }
    // Raw range is -127 to 127
    return m_controller.get_analog(channel) / 127.0 * 100.0;
}

} // namespace platform
