#include "trellis/http/DispatchError.hpp"
#include <cstring>

namespace trellis {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedRequestLine: return "MalformedRequestLine";
        case ErrorKind::MalformedHeaderLine: return "MalformedHeaderLine";
        case ErrorKind::LimitExceeded: return "LimitExceeded";
        case ErrorKind::ReadFailure: return "ReadFailure";
        case ErrorKind::WriteFailure: return "WriteFailure";
        case ErrorKind::HandlerFailure: return "HandlerFailure";
        case ErrorKind::RouteFailure: return "RouteFailure";
        case ErrorKind::ResourceIOError: return "ResourceIOError";
    }
    return "Unknown";
}

std::string DispatchError::describe() const {
    std::string out = toString(kind);
    if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    if (errnum != 0) {
        out += " (";
        out += std::strerror(errnum);
        out += ")";
    }
    return out;
}

} // namespace trellis
