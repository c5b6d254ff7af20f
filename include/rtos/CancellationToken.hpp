#pragma once

#include <atomic>

namespace rtos {

/**
 * @brief Cooperative cancellation flag shared between tasks
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }

    void reset() { m_cancelled.store(false); }

    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace rtos
