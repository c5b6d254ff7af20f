#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace utils {

/**
 * @brief Diagnostic sink injected into the drivetrain
 *
 * The core never opens files itself; where messages end up is up to the
 * application.
 */
class Logger {
public:
    virtual ~Logger() = default;

    /**
     * @brief Emit one diagnostic message
     *
     * @param message Message text
     * @param tag Name of the operation that produced it
     */
    virtual void log(const std::string& message, const std::string& tag) = 0;
};

/**
 * @brief Writes "[tag]:millis:message" lines to a stream
 */
class ConsoleLogger : public Logger {
public:
    /**
     * @param clock Millisecond clock used to timestamp each line
     * @param out Destination stream
     */
    explicit ConsoleLogger(std::function<uint32_t()> clock, std::ostream& out = std::cout);

    void log(const std::string& message, const std::string& tag) override;

private:
    std::function<uint32_t()> m_clock;
    std::ostream& m_out;
};

/**
 * @brief Log a message, dropping any failure of the sink
 *
 * Diagnostics must never abort a motion in progress.
 */
void logQuietly(Logger& logger, const std::string& message, const std::string& tag) noexcept;

} // namespace utils
