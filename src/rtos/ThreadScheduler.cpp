#include "rtos/ThreadScheduler.hpp"
#include <thread>

namespace rtos {

namespace {

class ThreadHandle : public TaskHandle {
public:
    explicit ThreadHandle(std::function<void()> body) : m_thread(std::move(body)) {}

    ~ThreadHandle() override {
        join();
    }

    void join() override {
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

private:
    std::thread m_thread;
};

} // namespace

ThreadScheduler::ThreadScheduler() : m_start(std::chrono::steady_clock::now()) {}

std::unique_ptr<TaskHandle> ThreadScheduler::spawn(std::function<void()> body, const std::string& /*name*/) {
    return std::make_unique<ThreadHandle>(std::move(body));
}

void ThreadScheduler::delay(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

uint32_t ThreadScheduler::millis() const {
    auto elapsed = std::chrono::steady_clock::now() - m_start;
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

} // namespace rtos
