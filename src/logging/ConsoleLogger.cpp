#include "trellis/logger/ConsoleLogger.hpp"

#include <iostream>

namespace trellis {

void ConsoleLogger::logMessage(std::string_view msg) {
    std::cout << "[trellis] " << msg << std::endl;
}

void ConsoleLogger::logError(std::string_view msg) {
    std::cerr << "[trellis] error: " << msg << std::endl;
}

} // namespace trellis
