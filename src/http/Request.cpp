#include "trellis/http/Request.hpp"
#include <charconv>
#include <string>

namespace trellis {

void Request::parseQs() {
    form = parseQueryString(qs);
}

void Request::readFormData(FormCallback on_done, FailureCallback on_error) {
    std::string length_value = header("content-length");
    if (length_value.empty()) {
        on_error(DispatchError{ErrorKind::HandlerFailure, "form data without Content-Length"});
        return;
    }

    size_t length = 0;
    auto [end, ec] = std::from_chars(length_value.data(), length_value.data() + length_value.size(), length);
    if (ec != std::errc() || end != length_value.data() + length_value.size()) {
        on_error(DispatchError{ErrorKind::HandlerFailure, "bad Content-Length '" + length_value + "'"});
        return;
    }

    if (length > max_body) {
        on_error(DispatchError{ErrorKind::LimitExceeded,
                               "form body of " + std::to_string(length) + " bytes"});
        return;
    }

    if (!reader) {
        on_error(DispatchError{ErrorKind::HandlerFailure, "request has no reader"});
        return;
    }

    reader->readExactly(
        length,
        [this, on_done, on_error](std::string body) {
            try {
                form = parseQueryString(body);
            } catch (const DecodeError& e) {
                on_error(DispatchError{ErrorKind::HandlerFailure, e.what()});
                return;
            }
            on_done();
        },
        [on_error](int error) {
            on_error(DispatchError{ErrorKind::ReadFailure, "reading form body", error});
        });
}

} // namespace trellis
