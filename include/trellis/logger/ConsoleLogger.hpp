#pragma once

#include "trellis/logger/Logger.hpp"

namespace trellis {

/**
 * Writes messages to stdout and errors to stderr, one line each.
 */
class ConsoleLogger : public Logger {
  public:
    void logMessage(std::string_view msg) override;
    void logError(std::string_view msg) override;
};

} // namespace trellis
