#pragma once

#include "trellis/logger/Logger.hpp"
#include <fstream>
#include <string>

namespace trellis {

/**
 * File logger that appends timestamped lines to a file.
 * NOT thread-safe; the serve loop only logs from its own thread.
 */
class FileLogger : public Logger {
  public:
    /**
     * @param filepath Path to log file (created or appended to)
     * @param auto_flush Flush after each line
     */
    explicit FileLogger(const std::string& filepath, bool auto_flush = true);
    ~FileLogger() override;

    void logMessage(std::string_view msg) override;
    void logError(std::string_view msg) override;

    void flush();

    // Reopen the log file after an external rename (log rotation)
    void reopen();

  private:
    void writeLine(std::string_view level, std::string_view msg);

    std::ofstream file_;
    bool auto_flush_;
    std::string filepath_;
};

} // namespace trellis
