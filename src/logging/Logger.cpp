#include "trellis/logger/Logger.hpp"
#include "trellis/logger/ConsoleLogger.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace {
    std::atomic<trellis::Logger*> global_logger{nullptr};
}

namespace trellis {

void Logger::logCurrentError(std::string_view context_msg) {
    std::string full_message(context_msg);

    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            full_message += ": ";
            full_message += e.what();
        } catch (...) {
            full_message += ": non-standard exception";
        }
    } else {
        full_message += ": no active exception";
    }

    logError(full_message);
}

void Logger::setGlobalLogger(Logger* ptr) {
    global_logger.store(ptr, std::memory_order_release);
}

Logger& Logger::getInstance() {
    auto* ptr = global_logger.load(std::memory_order_acquire);
    if (!ptr) {
        // Nobody installed a logger yet: fall back to the console
        static ConsoleLogger fallback_logger;
        return fallback_logger;
    }
    return *ptr;
}

} // namespace trellis
