#pragma once

#include <string>

namespace trellis {

/**
 * Failure categories reaching the exception hook.
 *
 * Peer-closed-before-request, unmatched routes, missing static resources and
 * forbidden paths are not here: they are handled where they occur and never
 * reach the hook.
 */
enum class ErrorKind {
    MalformedRequestLine,   // not exactly METHOD SP target SP proto
    MalformedHeaderLine,    // header line without ':'
    LimitExceeded,          // request line, header line or header count over ParserLimits
    ReadFailure,            // recv failed (errnum set)
    WriteFailure,           // send failed (errnum set)
    HandlerFailure,         // handler threw or completed with failure()
    RouteFailure,           // pattern matching or Application::init() threw
    ResourceIOError         // backing resource failed other than not-found
};

const char* toString(ErrorKind kind);

struct DispatchError {
    ErrorKind kind;
    std::string detail;
    int errnum = 0;

    std::string describe() const;
};

} // namespace trellis
