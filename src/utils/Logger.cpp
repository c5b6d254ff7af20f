#include "utils/Logger.hpp"
#include <exception>

namespace utils {

ConsoleLogger::ConsoleLogger(std::function<uint32_t()> clock, std::ostream& out)
    : m_clock(std::move(clock)), m_out(out) {}

void ConsoleLogger::log(const std::string& message, const std::string& tag) {
    uint32_t now = m_clock ? m_clock() : 0;
    m_out << "[" << tag << "]:" << now << ":" << message << "\n";
}

void logQuietly(Logger& logger, const std::string& message, const std::string& tag) noexcept {
    try {
        logger.log(message, tag);
    } catch (const std::exception&) {
        // Lost diagnostic, the motion carries on
    } catch (...) {
        // Same for sinks that throw non-standard types
    }
}

} // namespace utils
