#include "regulation/VelocityRegulator.hpp"
#include <cmath>
#include <exception>
#include <stdexcept>

namespace regulation {

VelocityRegulator::VelocityRegulator(hardware::Motor& motor, double kp, double kd, Time period)
    : m_motor(motor), m_pid(kp, kd, to_sec(period)) {
    if (!(period > 0_msec)) {
        throw std::invalid_argument("Velocity loop period must be greater than 0");
    }
    m_state.kp = kp;
    m_state.kd = kd;
    m_state.period = period;
}

VelocityRegulator::~VelocityRegulator() {
    detach();
}

void VelocityRegulator::attach(rtos::Scheduler& scheduler) {
    if (m_isRunning && !m_faulted) {
        return;
    }
    detach();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pid.reset();
        m_state.faulted = false;
        m_state.faultMessage.clear();
    }
    m_faulted = false;
    m_cancelToken.reset();
    m_isRunning = true;
    m_task = scheduler.spawn([this, &scheduler]() { taskUpdate(scheduler); }, "Velocity Regulator");
}

void VelocityRegulator::detach() {
    if (!m_isRunning) {
        return;
    }
    m_cancelToken.cancel();
    if (m_task != nullptr) {
        m_task->join();
        m_task.reset();
    }
    m_isRunning = false;
}

bool VelocityRegulator::isRunning() const {
    return m_isRunning && !m_faulted;
}

void VelocityRegulator::taskUpdate(rtos::Scheduler& scheduler) {
    uint32_t periodMs = rtos::toMillis(m_state.period);
    if (periodMs == 0) {
        periodMs = 1;
    }
    while (!m_cancelToken.isCancelled()) {
        // A motor fault stops the motor and ends the loop
        try {
            update();
        } catch (const std::exception& e) {
            recordFault(e.what());
            return;
        } catch (...) {
            recordFault("unknown motor fault");
            return;
        }
        scheduler.delay(periodMs);
    }
}

void VelocityRegulator::recordFault(std::string message) {
    try {
        m_motor.stop();
    } catch (const std::exception& e) {
        message += ", stop also failed: ";
        message += e.what();
    } catch (...) {
        message += ", stop also failed";
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.faulted = true;
        m_state.faultMessage = message;
    }
    m_faulted = true;
}

void VelocityRegulator::update() {
    std::lock_guard<std::mutex> lock(m_mutex);

    double target = m_targetVelocity.load();
    double measured = std::abs(m_motor.getVelocity(hardware::VelocityUnit::PERCENT));

    // Regulate the magnitude, then apply the requested direction
    double error = std::abs(target) - measured;
    double previousError = m_pid.isInitialized() ? m_pid.getPreviousError() : error;
    double output = m_pid.step(error);
    double direction = target < 0 ? -1.0 : 1.0;
    double command = control::clamp(direction * (measured + output), -100.0, 100.0);

    m_motor.setVelocity(command, hardware::VelocityUnit::PERCENT);

    m_state.targetVelocity = target;
    m_state.measuredVelocity = measured;
    m_state.error = error;
    m_state.previousError = previousError;
    m_state.derivative = m_pid.getDerivative();
    m_state.output = output;
    m_state.command = command;
}

VelocityLoopState VelocityRegulator::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    VelocityLoopState state = m_state;
    state.running = m_isRunning && !m_faulted;
    return state;
}

double VelocityRegulator::getTargetVelocity() const {
    return m_targetVelocity.load();
}

void VelocityRegulator::setVelocity(double value, hardware::VelocityUnit unit) {
    if (unit != hardware::VelocityUnit::PERCENT) {
        throw std::invalid_argument("Velocity unit not implemented, use VelocityUnit::PERCENT");
    }
    m_targetVelocity.store(value);
}

void VelocityRegulator::spin(hardware::SpinDirection direction) {
    m_motor.spin(direction);
}

void VelocityRegulator::stop() {
    m_motor.stop();
}

Angle VelocityRegulator::getPosition() const {
    return m_motor.getPosition();
}

double VelocityRegulator::getVelocity(hardware::VelocityUnit unit) const {
    return m_motor.getVelocity(unit);
}

void VelocityRegulator::setBrakeMode(hardware::BrakeMode mode) {
    m_motor.setBrakeMode(mode);
}

} // namespace regulation
