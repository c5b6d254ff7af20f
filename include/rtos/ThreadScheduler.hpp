#pragma once

#include "rtos/Scheduler.hpp"
#include <chrono>

namespace rtos {

/**
 * @brief Scheduler for host builds, one std::thread per task
 */
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();

    std::unique_ptr<TaskHandle> spawn(std::function<void()> body, const std::string& name) override;

    void delay(uint32_t ms) override;

    uint32_t millis() const override;

private:
    std::chrono::steady_clock::time_point m_start;
};

} // namespace rtos
