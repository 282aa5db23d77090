/**
 * Demo application
 *
 * A root application with a few routes, a sub-application mounted at /api
 * (plain text and JSON), static files under /static/ and an exception hook
 * that logs the failure and answers 500.
 *
 * Usage: ./trellis_demo [docroot] [port] [log_file] [--lazy]
 *
 * Files are served from <docroot>/static/<name>. SIGHUP reopens the log
 * file; SIGINT / SIGTERM stop the server.
 */

#include "trellis/Config.hpp"
#include "trellis/EventLoop.hpp"
#include "trellis/http/Application.hpp"
#include "trellis/http/HttpServer.hpp"
#include "trellis/http/Json.hpp"
#include "trellis/logger/ConsoleLogger.hpp"
#include "trellis/logger/FileLogger.hpp"
#include <iostream>
#include <memory>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>

using namespace trellis;

namespace {

class DemoApp : public Application {
  public:
    using Application::Application;

    void handleError(const Request* req, StreamWriter& writer, const DispatchError& error, ErrorDone done) override {
        std::string where = req ? req->method + " " + req->path : "<no request>";
        Logger::getInstance().logError("DemoApp: " + where + ": " + error.describe());
        if (writer.isClosed()) {
            done();
            return;
        }
        httpError(writer, "500", done, [done](int) { done(); });
    }

  protected:
    void onInit() override {
        Logger::getInstance().logMessage("DemoApp: initialized");
    }
};

std::string describeForm(const QueryMap& form) {
    std::string out;
    for (const auto& [key, value] : form) {
        out += key + " = ";
        if (value.isFlag()) {
            out += "(flag)";
        } else if (value.isScalar()) {
            out += value.scalar();
        } else {
            for (const auto& item : value.values()) {
                out += "[" + item + "]";
            }
        }
        out += "\n";
    }
    return out;
}

std::shared_ptr<Application> buildApi() {
    auto api = std::make_shared<Application>("", std::vector<RouteEntry>{}, false);
    api->setDefaultHeaderPolicy(HeaderPolicy::Skip);

    api->addResponseRoute(RouteMatcher::exact("/status"), [](const Request&, Response& res) {
        res.text("ok\n");
    });

    api->addResponseRoute(RouteMatcher::pattern(R"(/items/(\d+)$)"), [](const Request& req, Response& res) {
        res.text("item " + req.group(1) + "\n");
    });

    api->route("/info", [](Request& req, const WriterPtr& writer, HandlerDone done) {
        nlohmann::json info = {
            {"server", "trellis"},
            {"path", req.path},
            {"query", req.qs},
        };
        jsonify(*writer, info,
            [done]() { done(HandlerResult::close()); },
            [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "info", error)); });
    });

    return api;
}

} // namespace

int main(int argc, char** argv) {
    try {
        ServerConfig config;
        std::string docroot = argc > 1 ? argv[1] : ".";
        config.port = argc > 2 ? std::stoi(argv[2]) : config.port;
        config.log_file = argc > 3 ? argv[3] : "";
        config.lazy_init = argc > 4 && std::string(argv[4]) == "--lazy";

        static std::unique_ptr<FileLogger> file_logger;
        static std::unique_ptr<ConsoleLogger> console_logger;

        if (!config.log_file.empty()) {
            std::cout << "Logging to: " << config.log_file << "\n";
            file_logger = std::make_unique<FileLogger>(config.log_file, true);
            Logger::setGlobalLogger(file_logger.get());
        } else {
            console_logger = std::make_unique<ConsoleLogger>();
            Logger::setGlobalLogger(console_logger.get());
        }

        static EventLoop loop;
        loop.init(config.queue_depth);

        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);

        std::thread([set]() {
            int sig = 0;
            while (sigwait(&set, &sig) == 0) {
                if (sig == SIGHUP) {
                    if (file_logger) {
                        file_logger->reopen();
                    }
                    continue;
                }
                loop.stop();
                return;
            }
        }).detach();

        auto app = std::make_shared<DemoApp>();
        app->setResourceProvider(std::make_shared<FileSystemResourceProvider>(docroot));

        app->addResponseRoute(RouteMatcher::exact("/"), [](const Request& req, Response& res) {
            res.html("<h1>trellis</h1><p>" + req.header("User-Agent") + "</p>\n");
        });

        app->route("/query", [](Request& req, const WriterPtr& writer, HandlerDone done) {
            req.parseQs();
            std::string out = formatResponseHead("200", "text/plain") + describeForm(*req.form);
            writer->write(std::move(out),
                [done]() { done(HandlerResult::close()); },
                [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "query", error)); });
        });

        app->route("/form", [](Request& req, const WriterPtr& writer, HandlerDone done) {
            Request* request = &req;
            req.readFormData(
                [request, writer, done]() {
                    std::string out = formatResponseHead("200", "text/plain") + describeForm(*request->form);
                    writer->write(std::move(out),
                        [done]() { done(HandlerResult::close()); },
                        [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "form", error)); });
                },
                [done](DispatchError error) { done(HandlerResult::failure(std::move(error))); });
        });

        app->route("/boom", [](Request&, const WriterPtr&, HandlerDone) {
            throw std::runtime_error("boom");
        });

        app->mount("/api", buildApi());

        HttpServer server(loop, app);
        if (!server.listen(config.port, config.bind_addr)) {
            std::cerr << "Failed to start HTTP server on port " << config.port << std::endl;
            return 1;
        }

        std::cout << "Listening on http://" << config.bind_addr << ":" << server.port() << "\n";
        std::cout << "Press Ctrl+C to stop\n";
        server.run(config.lazy_init);

        std::cout << "Shutdown complete" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Logger::getInstance().logError("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
