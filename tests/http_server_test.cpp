#include <gtest/gtest.h>
#include "trellis/EventLoop.hpp"
#include "trellis/http/HttpServer.hpp"
#include "trellis/io/SocketStreams.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace trellis;

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            loop_.init(128);
        } catch (const std::runtime_error& e) {
            GTEST_SKIP() << "io_uring unavailable: " << e.what();
        }

        app_ = std::make_shared<Application>("", std::vector<RouteEntry>{}, false);
        app_->addResponseRoute(RouteMatcher::exact("/hello"), [](const Request& req, Response& res) {
            res.text("hello " + req.header("user-agent"));
        });
        app_->route("/boom", [](Request&, const WriterPtr&, HandlerDone) {
            throw std::runtime_error("boom");
        });

        auto api = std::make_shared<Application>("", std::vector<RouteEntry>{}, false);
        api->addResponseRoute(RouteMatcher::pattern(R"(/items/(\d+)$)"), [](const Request& req, Response& res) {
            res.text("item " + req.group(1));
        });
        app_->mount("/api", api);

        server_ = std::make_unique<HttpServer>(loop_, app_);
        ASSERT_TRUE(server_->listen(0, "127.0.0.1"));

        loop_thread_ = std::thread([this]() { server_->run(); });
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        if (loop_thread_.joinable()) {
            loop_thread_.join();
        }
    }

    int connectClient() {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            return -1;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(server_->port());
        addr.sin_addr.s_addr = inet_addr("127.0.0.1");
        if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            return -1;
        }
        return fd;
    }

    // Poll until the server reports `expected` open connections
    bool waitForConnections(size_t expected) {
        for (int i = 0; i < 200; ++i) {
            if (server_->activeConnections() == expected) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    // Send `request` on a fresh connection and read until the server closes it
    std::string exchange(const std::string& request) {
        int fd = connectClient();
        if (fd < 0) {
            return "<connect failed>";
        }

        timeval timeout{};
        timeout.tv_sec = 2;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        if (!request.empty()) {
            send(fd, request.data(), request.size(), MSG_NOSIGNAL);
        } else {
            shutdown(fd, SHUT_WR);
        }

        std::string response;
        char buffer[4096];
        while (true) {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            response.append(buffer, static_cast<size_t>(n));
        }
        close(fd);
        return response;
    }

    EventLoop loop_;
    std::shared_ptr<Application> app_;
    std::unique_ptr<HttpServer> server_;
    std::thread loop_thread_;
};

TEST_F(HttpServerTest, ServesRouteAndCloses) {
    std::string response = exchange("GET /hello HTTP/1.0\r\nUser-Agent: gtest\r\n\r\n");
    EXPECT_EQ(response, "HTTP/1.0 200 NA\r\nContent-Type: text/plain\r\n\r\nhello gtest");
}

TEST_F(HttpServerTest, UnknownPathIs404) {
    std::string response = exchange("GET /missing HTTP/1.0\r\n\r\n");
    EXPECT_EQ(response, formatResponseHead("404") + "404\r\n");
}

TEST_F(HttpServerTest, MountedApplicationAnswers) {
    std::string response = exchange("GET /api/items/9 HTTP/1.0\r\n\r\n");
    EXPECT_NE(response.find("item 9"), std::string::npos);
}

TEST_F(HttpServerTest, HandlerFailureClosesWithoutResponse) {
    EXPECT_EQ(exchange("GET /boom HTTP/1.0\r\n\r\n"), "");
    EXPECT_TRUE(waitForConnections(0));
    // The server keeps serving afterwards
    EXPECT_NE(exchange("GET /hello HTTP/1.0\r\n\r\n").find("200"), std::string::npos);
}

TEST_F(HttpServerTest, EmptyConnectionGetsNoBytes) {
    EXPECT_EQ(exchange(""), "");
    EXPECT_NE(exchange("GET /hello HTTP/1.0\r\n\r\n").find("200"), std::string::npos);
}

TEST_F(HttpServerTest, RunInitializesMountedApplications) {
    exchange("GET /hello HTTP/1.0\r\n\r\n");
    EXPECT_TRUE(loop_.isRunning());
    EXPECT_TRUE(app_->initialized());
    EXPECT_TRUE(app_->mounts().at(0).app->initialized());
}

TEST_F(HttpServerTest, IdleConnectionIsCountedUntilPeerCloses) {
    int fd = connectClient();
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(waitForConnections(1));

    close(fd);
    EXPECT_TRUE(waitForConnections(0));
}

TEST(SocketWriterTest, CloseKeepsDescriptorUntilSendCompletes) {
    EventLoop loop;
    try {
        loop.init(8);
    } catch (const std::runtime_error& e) {
        GTEST_SKIP() << "io_uring unavailable: " << e.what();
    }

    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
    auto writer = std::make_shared<SocketWriter>(loop, fds[0]);

    bool sent = false;
    writer->write("payload",
        [&sent, &loop]() {
            sent = true;
            loop.stop();
        },
        [&loop](int) { loop.stop(); });
    writer->close();

    EXPECT_TRUE(writer->isClosed());
    EXPECT_EQ(writer->fd(), fds[0]);
    EXPECT_NE(fcntl(fds[0], F_GETFD), -1);

    int late_error = 0;
    writer->write("late", []() { FAIL(); }, [&late_error](int e) { late_error = e; });
    EXPECT_EQ(late_error, EBADF);

    loop.run();

    EXPECT_TRUE(sent);
    EXPECT_EQ(writer->fd(), -1);
    EXPECT_EQ(fcntl(fds[0], F_GETFD), -1);

    char buffer[16];
    ssize_t n = recv(fds[1], buffer, sizeof(buffer), 0);
    ASSERT_GT(n, 0);
    EXPECT_EQ(std::string(buffer, static_cast<size_t>(n)), "payload");
    close(fds[1]);
}
