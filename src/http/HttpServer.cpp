#include "trellis/http/HttpServer.hpp"
#include "trellis/io/SocketStreams.hpp"
#include "trellis/jobs/AcceptJob.hpp"
#include "trellis/logger/Logger.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace trellis {

HttpServer::HttpServer(EventLoop& loop, std::shared_ptr<Application> app)
    : loop_(loop),
      app_(std::move(app)),
      server_fd_(-1),
      port_(-1),
      active_connections_(0) {
    if (!app_) {
        throw std::invalid_argument("HttpServer needs an application");
    }
}

HttpServer::~HttpServer() {
    closeServerSocket();
}

bool HttpServer::listen(int port, const std::string& bind_addr) {
    if (server_fd_ >= 0) {
        Logger::getInstance().logError("HttpServer: Already listening on port " + std::to_string(port_));
        return false;
    }

    server_fd_ = createServerSocket(port, bind_addr);
    if (server_fd_ < 0) {
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = port;
    }

    Logger::getInstance().logMessage("HttpServer: Listening on " + bind_addr + ":" + std::to_string(port_));
    return true;
}

void HttpServer::run(bool lazy_init) {
    if (server_fd_ < 0) {
        Logger::getInstance().logError("HttpServer: run() called before listen()");
        return;
    }

    if (lazy_init) {
        app_->init();
    } else {
        app_->initTree();
    }

    startAccepting();
    loop_.run();

    closeServerSocket();
    Logger::getInstance().logMessage("HttpServer: Stopped with " + std::to_string(active_connections_.load()) +
                                     " connections still open");
}

void HttpServer::stop() {
    loop_.stop();
}

void HttpServer::startAccepting() {
    auto* accept_job = AcceptJob::create(
        server_fd_,
        [this](int client_fd) { handleNewConnection(client_fd); },
        [](int error) {
            if (error != ECANCELED) {
                Logger::getInstance().logError("HttpServer: Accept failed: " + std::string(strerror(error)));
            }
        });

    if (!accept_job) {
        throw std::runtime_error("HttpServer: AcceptJob pool exhausted");
    }
    accept_job->start(loop_);
}

void HttpServer::handleNewConnection(int client_fd) {
    auto reader = std::make_shared<SocketReader>(loop_, client_fd);
    const ParserLimits& limits = app_->limits();
    reader->setMaxLineLength(std::max(limits.max_request_line, limits.max_header_line));
    auto writer = std::make_shared<SocketWriter>(loop_, client_fd);

    ++active_connections_;
    app_->handleConnection(std::move(reader), std::move(writer), [this](DispatchOutcome) {
        --active_connections_;
    });
}

void HttpServer::closeServerSocket() {
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

int HttpServer::createServerSocket(int port, const std::string& bind_addr) {
    int server_fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd < 0) {
        Logger::getInstance().logError("HttpServer: Failed to create socket: " +
                                      std::string(strerror(errno)));
        return -1;
    }

    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        Logger::getInstance().logError("HttpServer: Failed to set SO_REUSEADDR");
        close(server_fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) <= 0) {
        Logger::getInstance().logError("HttpServer: Invalid bind address: " + bind_addr);
        close(server_fd);
        return -1;
    }

    if (bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        Logger::getInstance().logError("HttpServer: Failed to bind to port " +
                                      std::to_string(port) + ": " + std::string(strerror(errno)));
        close(server_fd);
        return -1;
    }

    if (::listen(server_fd, SOMAXCONN) < 0) {
        Logger::getInstance().logError("HttpServer: Failed to listen: " +
                                      std::string(strerror(errno)));
        close(server_fd);
        return -1;
    }

    return server_fd;
}

} // namespace trellis
