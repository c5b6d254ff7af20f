#pragma once

#include "units/units.hpp"
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rtos {

/**
 * @brief Handle to a task started by a Scheduler
 */
class TaskHandle {
public:
    virtual ~TaskHandle() = default;

    /**
     * @brief Block until the task body returns
     */
    virtual void join() = 0;
};

/**
 * @brief Tasking and timing services used by the control loops
 *
 * On the V5 this is backed by PROS tasks, on a host by std::thread.
 * Tests substitute a simulated clock that advances the chassis model.
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /**
     * @brief Start a concurrent task running body
     *
     * @param body Task body, must return once its cancellation token is set
     * @param name Task name for diagnostics
     */
    virtual std::unique_ptr<TaskHandle> spawn(std::function<void()> body, const std::string& name) = 0;

    /**
     * @brief Suspend the calling task
     */
    virtual void delay(uint32_t ms) = 0;

    /**
     * @brief Milliseconds since the scheduler started
     */
    virtual uint32_t millis() const = 0;
};

/**
 * @brief Round a duration to whole milliseconds for Scheduler::delay()
 *
 * Negative durations give 0.
 */
inline uint32_t toMillis(Time duration) {
    double ms = std::round(to_msec(duration));
    return ms > 0.0 ? static_cast<uint32_t>(ms) : 0;
}

} // namespace rtos
