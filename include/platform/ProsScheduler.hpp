#pragma once

#include "rtos/Scheduler.hpp"

namespace platform {

/**
 * @brief Scheduler backed by PROS tasks
 */
class ProsScheduler : public rtos::Scheduler {
public:
    std::unique_ptr<rtos::TaskHandle> spawn(std::function<void()> body, const std::string& name) override;

    void delay(uint32_t ms) override;

    uint32_t millis() const override;
};

} // namespace platform
