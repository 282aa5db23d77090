#include "trellis/http/Application.hpp"
#include "trellis/http/RequestDispatch.hpp"
#include <cerrno>
#include <stdexcept>

namespace trellis {

Application::Application(std::string bundle, std::vector<RouteEntry> routes, bool serve_static)
    : bundle_(std::move(bundle))
    , provider_(std::make_shared<FileSystemResourceProvider>(".")) {
    for (auto& entry : routes) {
        routes_.add(std::move(entry));
    }
    if (serve_static) {
        routes_.add(RouteEntry{
            RouteMatcher::pattern("^/(static/.+)"),
            [this](Request& req, const WriterPtr& writer, HandlerDone done) {
                handleStatic(req, writer, std::move(done));
            },
            RouteOptions{}});
    }
}

void Application::requireConfigurable(const char* operation) const {
    if (initialized()) {
        throw std::logic_error(std::string(operation) + " after init()");
    }
}

void Application::addRoute(RouteEntry entry) {
    requireConfigurable("addRoute");
    routes_.add(std::move(entry));
}

void Application::route(const std::string& path, Handler handler, RouteOptions options) {
    addRoute(RouteEntry{RouteMatcher::exact(path), std::move(handler), options});
}

void Application::routePattern(const std::string& regex, Handler handler, RouteOptions options) {
    addRoute(RouteEntry{RouteMatcher::pattern(regex), std::move(handler), options});
}

void Application::addResponseRoute(RouteMatcher matcher, ResponseHandler handler, RouteOptions options) {
    auto wrapped = [handler = std::move(handler)](Request& req, const WriterPtr& writer, HandlerDone done) {
        Response res;
        handler(req, res);
        writer->write(res.serialize(),
            [done]() { done(HandlerResult::close()); },
            [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "sending response", error)); });
    };
    addRoute(RouteEntry{std::move(matcher), std::move(wrapped), options});
}

bool Application::contains(const Application* other) const {
    if (this == other) {
        return true;
    }
    for (const auto& mount : mounts_) {
        if (mount.app->contains(other)) {
            return true;
        }
    }
    return false;
}

void Application::mount(std::string prefix, std::shared_ptr<Application> app) {
    requireConfigurable("mount");
    if (prefix.empty()) {
        throw std::invalid_argument("mount prefix must not be empty");
    }
    if (!app) {
        throw std::invalid_argument("cannot mount a null application");
    }
    if (app->contains(this)) {
        throw std::invalid_argument("mounting at " + prefix + " would create a cycle");
    }
    mounts_.add(std::move(prefix), std::move(app));
}

void Application::init() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    try {
        onInit();
    } catch (...) {
        // Not ready; the next request retries
        initialized_.store(false, std::memory_order_release);
        throw;
    }
}

void Application::initTree() {
    init();
    for (const auto& mount : mounts_) {
        mount.app->initTree();
    }
}

void Application::setDefaultHeaderPolicy(HeaderPolicy policy) {
    requireConfigurable("setDefaultHeaderPolicy");
    default_headers_ = policy;
}

void Application::setLimits(const ParserLimits& limits) {
    requireConfigurable("setLimits");
    limits_ = limits;
}

void Application::setResourceProvider(std::shared_ptr<ResourceProvider> provider) {
    requireConfigurable("setResourceProvider");
    if (!provider) {
        throw std::invalid_argument("resource provider must not be null");
    }
    provider_ = std::move(provider);
}

void Application::handleConnection(std::shared_ptr<StreamReader> reader, WriterPtr writer, DispatchCallback on_finish) {
    auto dispatch = std::make_shared<RequestDispatch>(shared_from_this(), std::move(reader), std::move(writer),
                                                      std::move(on_finish));
    dispatch->start();
}

void Application::handleError(const Request*, StreamWriter&, const DispatchError&, ErrorDone done) {
    done();
}

void Application::sendFile(const WriterPtr& writer,
                           const std::string& relpath,
                           const std::string& content_type,
                           const ResponseHeaders& headers,
                           HandlerDone done) {
    OpenedResource resource = provider_->open(bundle_, relpath);
    if (!resource.stream) {
        if (resource.error == ENOENT) {
            httpError(*writer, "404",
                [done]() { done(HandlerResult::close()); },
                [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "sending 404", error)); });
            return;
        }
        done(HandlerResult::failure(ErrorKind::ResourceIOError, "opening " + relpath, resource.error));
        return;
    }

    std::string type = content_type.empty() ? getMimeType(relpath) : content_type;
    std::shared_ptr<ResourceStream> stream = std::move(resource.stream);
    startResponse(*writer, type, "200", headers,
        [writer, stream, done]() { streamResource(writer, stream, done); },
        [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "sending response head", error)); });
}

void Application::handleStatic(Request& req, const WriterPtr& writer, HandlerDone done) {
    const std::string& path = req.group(1);
    TRELLIS_DEBUG_LOG("Application: static request for " << path);
    // Any "..", even inside a file name, is refused
    if (path.find("..") != std::string::npos) {
        httpError(*writer, "403",
            [done]() { done(HandlerResult::close()); },
            [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "sending 403", error)); });
        return;
    }
    sendFile(writer, path, "", {}, std::move(done));
}

} // namespace trellis
