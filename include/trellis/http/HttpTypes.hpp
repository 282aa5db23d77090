#pragma once
#include "trellis/http/DispatchError.hpp"
#include "trellis/http/Request.hpp"
#include "trellis/http/Response.hpp"
#include "trellis/io/StreamWriter.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace trellis {

/**
 * What the dispatcher does with the header block before invoking a handler.
 */
enum class HeaderPolicy {
    Parse,  // read into Request::headers
    Skip,   // read and discard up to the blank line
    Leave   // stop after the request line; the handler drains the rest
};

const char* toString(HeaderPolicy policy);

// Accepts "parse", "skip" and "leave"
std::optional<HeaderPolicy> headerPolicyFromString(std::string_view name);

/**
 * How a handler finished: close the connection (the default), keep it open
 * (the handler now owns the writer), or fail into the exception hook.
 */
class HandlerResult {
public:
    static HandlerResult close() { return HandlerResult(true, std::nullopt); }
    static HandlerResult keepOpen() { return HandlerResult(false, std::nullopt); }
    static HandlerResult failure(DispatchError error) { return HandlerResult(true, std::move(error)); }
    static HandlerResult failure(ErrorKind kind, std::string detail, int errnum = 0) {
        return failure(DispatchError{kind, std::move(detail), errnum});
    }

    bool failed() const { return error_.has_value(); }
    bool shouldClose() const { return close_ || failed(); }

    // Only valid when failed()
    const DispatchError& error() const { return *error_; }

private:
    HandlerResult(bool close, std::optional<DispatchError> error)
        : close_(close), error_(std::move(error)) {}

    bool close_;
    std::optional<DispatchError> error_;
};

/**
 * Terminal state of one connection.
 */
enum class DispatchOutcome {
    ClosedEmpty,    // peer closed before sending a request line
    Dispatched,     // a handler ran to completion
    NotFound,       // no route matched, 404 sent
    HandlerError    // the exception hook ran
};

const char* toString(DispatchOutcome outcome);

using WriterPtr = std::shared_ptr<StreamWriter>;

/**
 * Continuation handed to the exception hook. Copies share one state; the
 * wrapped callback runs once, either when a copy is called or when the last
 * copy is released without having been called.
 */
class ErrorDone {
public:
    ErrorDone() = default;
    explicit ErrorDone(std::function<void()> on_done);

    void operator()() const;

private:
    struct State {
        std::function<void()> on_done;
        bool fired = false;

        void fire();
        ~State();
    };

    std::shared_ptr<State> state_;
};

// Must be called exactly once, possibly after further suspension points
using HandlerDone = std::function<void(HandlerResult result)>;

using Handler = std::function<void(Request& req, const WriterPtr& writer, HandlerDone done)>;

// Synchronous handler filling a buffered Response; the connection is closed after it is sent
using ResponseHandler = std::function<void(const Request& req, Response& res)>;

struct RouteOptions {
    // Unset: use the owning application's default policy
    std::optional<HeaderPolicy> headers;
};

} // namespace trellis
