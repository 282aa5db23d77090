#pragma once

#include <cstddef>
#include <string>

// Debug configuration
// Set to 1 to enable per-request trace output, 0 for production builds
#ifndef TRELLIS_DEBUG
#define TRELLIS_DEBUG 0
#endif

// Debug logging macro - compiles to nothing when TRELLIS_DEBUG is 0
#if TRELLIS_DEBUG
#include "trellis/logger/Logger.hpp"
#include <sstream>
#define TRELLIS_DEBUG_LOG(msg) \
    do { \
        std::ostringstream oss; \
        oss << msg; \
        trellis::Logger::getInstance().logMessage(oss.str()); \
    } while(0)
#else
#define TRELLIS_DEBUG_LOG(msg) ((void)0)
#endif

namespace trellis {

/**
 * Limits applied while reading the request line, header block and form body.
 * Exceeding any of them fails the exchange with ErrorKind::LimitExceeded.
 */
struct ParserLimits {
    size_t max_request_line = 8 * 1024;   // 8 KiB
    size_t max_header_line = 16 * 1024;   // 16 KiB per header
    size_t max_headers = 200;             // max header count
    size_t max_body = 1024 * 1024;        // 1 MiB Content-Length for readFormData()
};

/**
 * Settings for the outer serve loop. Nothing here is consulted by the
 * dispatcher itself.
 */
struct ServerConfig {
    std::string bind_addr = "0.0.0.0";
    int port = 8080;
    unsigned queue_depth = 256;
    bool lazy_init = false;     // init mounted applications on first request only
    std::string log_file;       // empty = console
};

} // namespace trellis
