#include "platform/ProsScheduler.hpp"
#include "pros/rtos.hpp"
#include <utility>

namespace platform {

namespace {

class ProsTaskHandle : public rtos::TaskHandle {
public:
    ProsTaskHandle(std::function<void()> body, const std::string& name)
        : m_task(std::move(body), name.c_str()) {}

    void join() override {
        m_task.join();
    }

private:
    pros::Task m_task;
};

} // namespace

std::unique_ptr<rtos::TaskHandle> ProsScheduler::spawn(std::function<void()> body, const std::string& name) {
    return std::make_unique<ProsTaskHandle>(std::move(body), name);
}

void ProsScheduler::delay(uint32_t ms) {
    pros::delay(ms);
}

uint32_t ProsScheduler::millis() const {
    return pros::millis();
}

} // namespace platform
