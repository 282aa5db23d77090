#pragma once

#include "trellis/EventLoop.hpp"
#include "trellis/http/Application.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace trellis {

/**
 * Outer serve loop: accepts connections on one listening socket and runs a
 * request dispatch for each of them on the event loop.
 *
 * Usage:
 *   EventLoop loop;
 *   loop.init(config.queue_depth);
 *   HttpServer server(loop, app);
 *   server.listen(config.port, config.bind_addr);
 *   server.run(config.lazy_init);   // blocks until stop()
 */
class HttpServer {
public:
    HttpServer(EventLoop& loop, std::shared_ptr<Application> app);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * Bind and listen. Port 0 picks an ephemeral port, see port().
     * @return false if the socket could not be set up (logged)
     */
    bool listen(int port, const std::string& bind_addr = "0.0.0.0");

    /**
     * Initialize the root application (and, unless lazy_init, every mounted
     * application), start accepting and run the event loop until stop().
     */
    void run(bool lazy_init = false);

    /**
     * Ask the loop to exit; safe to call from another thread
     */
    void stop();

    // Bound port, or -1 before listen()
    int port() const { return port_; }

    // Connections accepted whose dispatch has not finished yet
    size_t activeConnections() const { return active_connections_.load(); }

private:
    int createServerSocket(int port, const std::string& bind_addr);
    void startAccepting();
    void handleNewConnection(int client_fd);
    void closeServerSocket();

    EventLoop& loop_;
    std::shared_ptr<Application> app_;
    int server_fd_;
    int port_;
    std::atomic<size_t> active_connections_;
};

} // namespace trellis
