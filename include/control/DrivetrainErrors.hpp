#pragma once

#include <stdexcept>
#include <string>

namespace control {

/**
 * @brief Invalid configuration or motion command, raised before any motion starts
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A control loop ran out of its time budget, motors were stopped first
 */
class MotionTimeout : public std::runtime_error {
public:
    explicit MotionTimeout(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A control loop was cancelled, motors were stopped first
 */
class MotionCancelled : public std::runtime_error {
public:
    explicit MotionCancelled(const std::string& what) : std::runtime_error(what) {}
};

} // namespace control
