#pragma once

#include "control/PID.hpp"
#include "hardware/Motor.hpp"
#include "rtos/CancellationToken.hpp"
#include "rtos/Scheduler.hpp"
#include "units/units.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace regulation {

/**
 * @brief Snapshot of one velocity loop
 */
struct VelocityLoopState {
    double targetVelocity = 0.0;   // Percent, signed
    double measuredVelocity = 0.0; // Percent, magnitude
    double error = 0.0;
    double previousError = 0.0;
    double derivative = 0.0;
    double output = 0.0;
    double command = 0.0;          // Percent sent to the motor
    double kp = 0.0;
    double kd = 0.0;
    Time period = 0_msec;
    bool running = false;
    bool faulted = false;          // The loop stopped the motor and exited
    std::string faultMessage;
};

/**
 * @brief Wraps a motor in a PD velocity loop
 *
 * setVelocity() only stores the target, the loop writes the motor. Nothing
 * happens until attach() starts the loop task; call detach() before the
 * motor goes away. Spinning, stopping and readings are passed straight
 * through to the wrapped motor. While attached, nothing else should command
 * the wrapped motor's velocity.
 *
 * If the motor throws inside the loop task, the loop stops the motor, records
 * the fault in getState() and exits. attach() again to restart it.
 */
class VelocityRegulator : public hardware::Motor {
public:
    /**
     * @param motor Motor or motor group to regulate
     * @param kp How quickly to close the gap to the target velocity
     * @param kd Damping, higher values slow the response and limit overshoot
     * @param period Time between loop updates
     * @throws std::invalid_argument if period is not positive
     */
    VelocityRegulator(hardware::Motor& motor, double kp = 0.4, double kd = 0.05, Time period = 10_msec);

    /**
     * @brief Detaches the loop if it is still running
     */
    ~VelocityRegulator() override;

    VelocityRegulator(const VelocityRegulator&) = delete;
    VelocityRegulator& operator=(const VelocityRegulator&) = delete;

    /**
     * @brief Start the loop task, does nothing if already running
     *
     * A loop that stopped on a fault is joined, cleared and started again.
     */
    void attach(rtos::Scheduler& scheduler);

    /**
     * @brief Cancel the loop task and wait for it to finish
     */
    void detach();

    /**
     * @brief True while the loop task is regulating, false after a fault
     */
    bool isRunning() const;

    /**
     * @brief Run one loop iteration
     *
     * Called by the loop task every period, exposed for callers that drive
     * the loop themselves.
     */
    void update();

    VelocityLoopState getState() const;

    double getTargetVelocity() const;

    /**
     * @brief Set the target velocity for the loop
     *
     * @throws std::invalid_argument for units other than PERCENT
     */
    void setVelocity(double value, hardware::VelocityUnit unit = hardware::VelocityUnit::PERCENT) override;

    void spin(hardware::SpinDirection direction) override;

    void stop() override;

    Angle getPosition() const override;

    double getVelocity(hardware::VelocityUnit unit = hardware::VelocityUnit::PERCENT) const override;

    void setBrakeMode(hardware::BrakeMode mode) override;

private:
    hardware::Motor& m_motor;
    control::PID m_pid;
    std::atomic<double> m_targetVelocity{0.0};

    mutable std::mutex m_mutex;
    VelocityLoopState m_state;

    rtos::CancellationToken m_cancelToken;
    std::unique_ptr<rtos::TaskHandle> m_task;
    std::atomic<bool> m_isRunning{false};
    std::atomic<bool> m_faulted{false};

    void taskUpdate(rtos::Scheduler& scheduler);

    void recordFault(std::string message);
};

} // namespace regulation
