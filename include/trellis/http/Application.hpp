#pragma once
#include "trellis/Config.hpp"
#include "trellis/http/HttpTypes.hpp"
#include "trellis/http/MountTable.hpp"
#include "trellis/http/RouteTable.hpp"
#include "trellis/http/StaticResources.hpp"
#include "trellis/io/StreamReader.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace trellis {

/**
 * A route table, a mount table and the settings applied to requests that
 * resolve to this application.
 *
 * Registration (routes, mounts, settings) happens before init(); once
 * initialized the tables are read-only and further registration throws
 * std::logic_error. The root application of a server also owns the
 * exception hook and the parser limits used for every connection.
 */
class Application : public std::enable_shared_from_this<Application> {
  public:
    using DispatchCallback = std::function<void(DispatchOutcome outcome)>;

    /**
     * @param bundle       Identity used to look up static resources
     * @param routes       Initial route table
     * @param serve_static Append the "^/(static/.+)" route after `routes`
     */
    explicit Application(std::string bundle = "", std::vector<RouteEntry> routes = {}, bool serve_static = true);
    virtual ~Application() = default;

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Route registration, appended in call order
    void addRoute(RouteEntry entry);
    void route(const std::string& path, Handler handler, RouteOptions options = {});
    void routePattern(const std::string& regex, Handler handler, RouteOptions options = {});
    void addResponseRoute(RouteMatcher matcher, ResponseHandler handler, RouteOptions options = {});

    /**
     * Attach `app` at `prefix`. Throws std::invalid_argument for an empty
     * prefix or when `app` already (transitively) contains this application.
     */
    void mount(std::string prefix, std::shared_ptr<Application> app);

    /**
     * Mark the application ready and run onInit() once. Safe to call any
     * number of times, from any connection.
     */
    void init();
    bool initialized() const { return initialized_.load(std::memory_order_acquire); }

    // init() on this application and, recursively, everything mounted on it
    void initTree();

    void setDefaultHeaderPolicy(HeaderPolicy policy);
    HeaderPolicy defaultHeaderPolicy() const { return default_headers_; }

    void setLimits(const ParserLimits& limits);
    const ParserLimits& limits() const { return limits_; }

    void setResourceProvider(std::shared_ptr<ResourceProvider> provider);
    ResourceProvider& resourceProvider() const { return *provider_; }

    const std::string& bundle() const { return bundle_; }
    const RouteTable& routes() const { return routes_; }
    const MountTable& mounts() const { return mounts_; }

    /**
     * Run one request/response exchange on a connection. `on_finish` runs
     * once after the writer has been closed (or handed to a keep-open
     * handler).
     */
    void handleConnection(std::shared_ptr<StreamReader> reader, WriterPtr writer, DispatchCallback on_finish = nullptr);

    /**
     * Exception hook. Called at most once per connection with whatever part
     * of the request was parsed (null before the request line was read).
     * The connection is closed once `done` is called, or as soon as every
     * copy of `done` has been released. A hook that only logs can simply
     * return; one that writes a response keeps `done` until the write
     * completes. The default does nothing.
     */
    virtual void handleError(const Request* req, StreamWriter& writer, const DispatchError& error, ErrorDone done);

    /**
     * Open `relpath` in this application's bundle and stream it as a 200
     * response. A missing resource produces a 404 instead. An empty
     * `content_type` is guessed from the file name.
     */
    void sendFile(const WriterPtr& writer,
                  const std::string& relpath,
                  const std::string& content_type,
                  const ResponseHeaders& headers,
                  HandlerDone done);

  protected:
    // One-time setup, run by the first init()
    virtual void onInit() {}

  private:
    void requireConfigurable(const char* operation) const;
    bool contains(const Application* other) const;
    void handleStatic(Request& req, const WriterPtr& writer, HandlerDone done);

    std::string bundle_;
    RouteTable routes_;
    MountTable mounts_;
    HeaderPolicy default_headers_ = HeaderPolicy::Parse;
    ParserLimits limits_;
    std::shared_ptr<ResourceProvider> provider_;
    std::atomic<bool> initialized_{false};
};

} // namespace trellis
