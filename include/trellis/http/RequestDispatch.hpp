#pragma once
#include "trellis/http/Application.hpp"
#include "trellis/http/HttpTypes.hpp"
#include "trellis/http/RouteTable.hpp"
#include <memory>
#include <string>

namespace trellis {

/**
 * Drives one connection from the request line to close:
 *
 *   AwaitRequestLine -> ResolveMounts -> ResolveRoute -> ApplyHeaderPolicy
 *   -> Invoke -> Close
 *
 * Every read and write is a suspension point; the dispatch keeps itself
 * alive through the continuations it hands out, so the owner only needs to
 * call start(). Failures at any step go to the root application's exception
 * hook exactly once, then the connection is closed. The close decision is
 * made exactly once per connection.
 *
 * The handler sees the connection through guarded streams: an exception
 * thrown from any continuation it passed to a read or write is caught there
 * and fails the exchange, however many suspension points came before.
 */
class RequestDispatch : public std::enable_shared_from_this<RequestDispatch> {
  public:
    enum class State {
        AwaitRequestLine,
        ResolveMounts,
        ResolveRoute,
        ApplyHeaderPolicy,
        Invoke,
        Close
    };

    RequestDispatch(std::shared_ptr<Application> root,
                    std::shared_ptr<StreamReader> reader,
                    WriterPtr writer,
                    Application::DispatchCallback on_finish);

    void start();

    State state() const { return state_; }

  private:
    class GuardedReader;
    class GuardedWriter;

    // Runs a handler continuation; exceptions fail the owning dispatch
    template <typename Fn>
    static void runGuarded(const std::weak_ptr<RequestDispatch>& owner, Fn&& fn);

    void onRequestLine(std::string line);
    void resolveMounts();
    void resolveRoute();
    void applyHeaderPolicy();
    void invoke();
    void onHandlerDone(HandlerResult result);
    void onHandlerThrew(const std::string& what);
    void sendNotFound();

    void fail(DispatchError error);
    void finish(DispatchOutcome outcome, bool close);

    std::shared_ptr<Application> root_;
    std::shared_ptr<Application> app_;
    std::shared_ptr<StreamReader> reader_;
    WriterPtr writer_;
    Application::DispatchCallback on_finish_;

    // Null until a request line has been read
    std::unique_ptr<Request> req_;
    const RouteEntry* route_ = nullptr;
    HeaderPolicy policy_ = HeaderPolicy::Skip;
    State state_ = State::AwaitRequestLine;
    bool handler_completed_ = false;
    bool failed_ = false;
    bool finished_ = false;
};

const char* toString(RequestDispatch::State state);

} // namespace trellis
