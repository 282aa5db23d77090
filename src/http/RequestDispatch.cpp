#include "trellis/http/RequestDispatch.hpp"
#include "trellis/http/RequestParser.hpp"
#include "trellis/logger/Logger.hpp"
#include <exception>

namespace trellis {

const char* toString(RequestDispatch::State state) {
    switch (state) {
        case RequestDispatch::State::AwaitRequestLine: return "await-request-line";
        case RequestDispatch::State::ResolveMounts: return "resolve-mounts";
        case RequestDispatch::State::ResolveRoute: return "resolve-route";
        case RequestDispatch::State::ApplyHeaderPolicy: return "apply-header-policy";
        case RequestDispatch::State::Invoke: return "invoke";
        case RequestDispatch::State::Close: return "close";
    }
    return "unknown";
}

template <typename Fn>
void RequestDispatch::runGuarded(const std::weak_ptr<RequestDispatch>& owner, Fn&& fn) {
    std::string what;
    try {
        fn();
        return;
    } catch (const std::exception& e) {
        what = e.what();
    } catch (...) {
        what = "unknown exception";
    }

    if (auto self = owner.lock()) {
        self->onHandlerThrew(what);
    } else {
        Logger::getInstance().logError("handler continuation threw after its connection finished: " + what);
    }
}

class RequestDispatch::GuardedReader : public StreamReader {
  public:
    GuardedReader(std::shared_ptr<StreamReader> inner, std::weak_ptr<RequestDispatch> owner)
        : inner_(std::move(inner)), owner_(std::move(owner)) {}

    void readLine(LineCallback on_line, ErrorCallback on_error) override {
        inner_->readLine(
            [owner = owner_, on_line = std::move(on_line)](std::string line) {
                runGuarded(owner, [&]() { on_line(std::move(line)); });
            },
            [owner = owner_, on_error = std::move(on_error)](int error) {
                runGuarded(owner, [&]() { on_error(error); });
            });
    }

    void readExactly(size_t n, DataCallback on_data, ErrorCallback on_error) override {
        inner_->readExactly(n,
            [owner = owner_, on_data = std::move(on_data)](std::string data) {
                runGuarded(owner, [&]() { on_data(std::move(data)); });
            },
            [owner = owner_, on_error = std::move(on_error)](int error) {
                runGuarded(owner, [&]() { on_error(error); });
            });
    }

  private:
    std::shared_ptr<StreamReader> inner_;
    // Weak: the dispatch owns the request, which owns this reader
    std::weak_ptr<RequestDispatch> owner_;
};

class RequestDispatch::GuardedWriter : public StreamWriter {
  public:
    GuardedWriter(WriterPtr inner, std::weak_ptr<RequestDispatch> owner)
        : inner_(std::move(inner)), owner_(std::move(owner)) {}

    void write(std::string data, DoneCallback on_done, ErrorCallback on_error) override {
        inner_->write(std::move(data),
            [owner = owner_, on_done = std::move(on_done)]() {
                runGuarded(owner, [&]() { on_done(); });
            },
            [owner = owner_, on_error = std::move(on_error)](int error) {
                runGuarded(owner, [&]() { on_error(error); });
            });
    }

    void close() override { inner_->close(); }
    bool isClosed() const override { return inner_->isClosed(); }

  private:
    WriterPtr inner_;
    std::weak_ptr<RequestDispatch> owner_;
};

RequestDispatch::RequestDispatch(std::shared_ptr<Application> root,
                                 std::shared_ptr<StreamReader> reader,
                                 WriterPtr writer,
                                 Application::DispatchCallback on_finish)
    : root_(std::move(root))
    , app_(root_)
    , reader_(std::move(reader))
    , writer_(std::move(writer))
    , on_finish_(std::move(on_finish)) {}

void RequestDispatch::start() {
    state_ = State::AwaitRequestLine;
    auto self = shared_from_this();
    reader_->readLine(
        [self](std::string line) { self->onRequestLine(std::move(line)); },
        [self](int error) { self->fail(RequestParser::readError(error, "reading request line")); });
}

void RequestDispatch::onRequestLine(std::string line) {
    if (line.empty()) {
        // Peer closed before sending anything
        TRELLIS_DEBUG_LOG("RequestDispatch: empty read, closing");
        finish(DispatchOutcome::ClosedEmpty, true);
        return;
    }

    req_ = std::make_unique<Request>();
    req_->max_body = root_->limits().max_body;
    if (line.size() > root_->limits().max_request_line) {
        fail(DispatchError{ErrorKind::LimitExceeded,
                           "request line of " + std::to_string(line.size()) + " bytes"});
        return;
    }
    if (!RequestParser::parseRequestLine(line, *req_)) {
        fail(DispatchError{ErrorKind::MalformedRequestLine, "expected METHOD PATH PROTO"});
        return;
    }

    TRELLIS_DEBUG_LOG("RequestDispatch: " << req_->method << " " << req_->path);
    resolveMounts();
}

void RequestDispatch::resolveMounts() {
    state_ = State::ResolveMounts;

    // Terminates: mounts are acyclic, so every step moves to a different application
    std::string path = req_->path;
    while (const MountEntry* mount = app_->mounts().resolve(path)) {
        app_ = mount->app;
        path.erase(0, mount->prefix.size());
        if (path.empty() || path.front() != '/') {
            path.insert(path.begin(), '/');
        }
        TRELLIS_DEBUG_LOG("RequestDispatch: mount " << mount->prefix << " -> " << path);
    }
    req_->path = std::move(path);

    try {
        app_->init();
    } catch (const std::exception& e) {
        fail(DispatchError{ErrorKind::RouteFailure, std::string("init: ") + e.what()});
        return;
    } catch (...) {
        fail(DispatchError{ErrorKind::RouteFailure, "init: unknown exception"});
        return;
    }

    resolveRoute();
}

void RequestDispatch::resolveRoute() {
    state_ = State::ResolveRoute;

    try {
        route_ = app_->routes().resolve(req_->path, req_->url_match);
    } catch (const std::exception& e) {
        fail(DispatchError{ErrorKind::RouteFailure, std::string("matching route: ") + e.what()});
        return;
    }

    if (route_) {
        policy_ = route_->options.headers.value_or(app_->defaultHeaderPolicy());
    } else {
        // The exchange is abandoned, just drain the header block
        policy_ = HeaderPolicy::Skip;
    }
    applyHeaderPolicy();
}

void RequestDispatch::applyHeaderPolicy() {
    state_ = State::ApplyHeaderPolicy;
    TRELLIS_DEBUG_LOG("RequestDispatch: headers " << toString(policy_));

    auto self = shared_from_this();
    RequestParser::applyHeaderPolicy(reader_, policy_, root_->limits(),
        [self](std::optional<HeaderMap> headers) {
            self->req_->headers = std::move(headers);
            if (self->route_) {
                self->invoke();
            } else {
                self->sendNotFound();
            }
        },
        [self](DispatchError error) { self->fail(std::move(error)); });
}

void RequestDispatch::invoke() {
    state_ = State::Invoke;

    auto self = shared_from_this();
    std::weak_ptr<RequestDispatch> owner = self;
    req_->reader = std::make_shared<GuardedReader>(reader_, owner);
    WriterPtr writer = std::make_shared<GuardedWriter>(writer_, owner);

    HandlerDone done = [self](HandlerResult result) {
        if (self->handler_completed_) {
            Logger::getInstance().logError("handler for " + self->req_->path + " completed more than once");
            return;
        }
        self->handler_completed_ = true;
        self->onHandlerDone(std::move(result));
    };

    runGuarded(owner, [&]() { route_->handler(*req_, writer, done); });
}

void RequestDispatch::onHandlerDone(HandlerResult result) {
    if (result.failed()) {
        fail(result.error());
        return;
    }
    finish(DispatchOutcome::Dispatched, result.shouldClose());
}

void RequestDispatch::onHandlerThrew(const std::string& what) {
    if (handler_completed_) {
        Logger::getInstance().logError("handler for " + (req_ ? req_->path : std::string("?")) +
                                       " threw after completing: " + what);
        return;
    }
    handler_completed_ = true;
    fail(DispatchError{ErrorKind::HandlerFailure, what});
}

void RequestDispatch::sendNotFound() {
    TRELLIS_DEBUG_LOG("RequestDispatch: no route for " << req_->path);
    std::string out = formatResponseHead("404");
    out += "404\r\n";

    auto self = shared_from_this();
    writer_->write(std::move(out),
        [self]() { self->finish(DispatchOutcome::NotFound, true); },
        [self](int error) { self->fail(DispatchError{ErrorKind::WriteFailure, "sending 404", error}); });
}

void RequestDispatch::fail(DispatchError error) {
    if (failed_ || finished_) {
        return;
    }
    failed_ = true;
    state_ = State::Close;
    TRELLIS_DEBUG_LOG("RequestDispatch: " << error.describe());

    // Fires when the hook calls it, or when the last copy is released
    auto self = shared_from_this();
    ErrorDone done([self]() { self->finish(DispatchOutcome::HandlerError, true); });
    try {
        root_->handleError(req_.get(), *writer_, error, done);
    } catch (...) {
        Logger::getInstance().logCurrentError("exception hook threw");
        done();
    }
}

void RequestDispatch::finish(DispatchOutcome outcome, bool close) {
    if (finished_) {
        return;
    }
    finished_ = true;
    state_ = State::Close;

    if (close) {
        writer_->close();
    }
    TRELLIS_DEBUG_LOG("RequestDispatch: " << toString(outcome) << (close ? ", closed" : ", kept open"));
    if (on_finish_) {
        on_finish_(outcome);
    }
}

} // namespace trellis
