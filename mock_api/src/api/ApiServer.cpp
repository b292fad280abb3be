#include "ApiServer.hpp"
#include "utils/Logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

namespace mockapi {

    ApiServer::ApiServer(const ServerConfig& config)
        : config_(config)
        , store_(config.fixtures.rootDir)
        , router_(store_, config.fixtures.rootDescriptor, config.fixtures.indexFile)
        , generator_(config.marketData)
        , staticFiles_(store_)
        , host_(config.server.host)
        , port_(config.server.port)
    {
        int poolSize = config_.server.threadPoolSize > 0 ? config_.server.threadPoolSize : 1;
        server_.new_task_queue = [poolSize] { return new httplib::ThreadPool(poolSize); };

        server_.set_read_timeout(config_.server.readTimeoutSec, 0);
        server_.set_write_timeout(config_.server.writeTimeoutSec, 0);

        setupRoutes();
    }

    ApiServer::~ApiServer() {
        stop();
    }

    bool ApiServer::start() {
        if (running_.load()) return true;

        if (port_ == 0) {
            int bound = server_.bind_to_any_port(host_.c_str());
            if (bound < 0) {
                Logger::error("Failed to bind {} to any port", host_);
                return false;
            }
            port_ = bound;
        }
        else if (!server_.bind_to_port(host_.c_str(), port_)) {
            Logger::error("Failed to bind {}:{}", host_, port_);
            return false;
        }

        running_ = true;

        serverThread_ = std::thread([this]() {
            Logger::info("API server listening on {}:{}, fixtures at {}", host_, port_, store_.getRoot().string());
            if (!server_.listen_after_bind()) {
                Logger::error("API server on {}:{} stopped unexpectedly", host_, port_);
            }
            running_ = false;
            });

        // httplib ignores stop() until its accept loop is up
        for (int i = 0; i < 500 && running_.load() && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        return true;
    }

    void ApiServer::stop() {
        if (running_.exchange(false)) {
            server_.stop();
        }

        if (serverThread_.joinable()) {
            serverThread_.join();
            Logger::info("API server stopped");
        }
    }

    std::string ApiServer::errorResponse(int status, const std::string& message) {
        return nlohmann::json{ {"error", message}, {"status", status} }.dump();
    }

    void ApiServer::setupRoutes() {
        // CORS header on every response, errors included
        server_.set_default_headers({
            {"Access-Control-Allow-Origin", "*"}
            });

        server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            Logger::debug("{} {} -> {} ({} bytes)", req.method, req.path, res.status, res.body.size());
            });

        // GET (and HEAD, which httplib answers through the GET route)
        server_.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
            handleGet(req, res);
            });

        auto unsupported = [this](const httplib::Request& req, httplib::Response& res) {
            handleUnsupported(req, res);
            };
        server_.Post(".*", unsupported);
        server_.Put(".*", unsupported);
        server_.Patch(".*", unsupported);
        server_.Delete(".*", unsupported);
        server_.Options(".*", unsupported);
    }

    void ApiServer::handleGet(const httplib::Request& req, httplib::Response& res) {
        Resolution route = router_.resolve(req.path);
        Logger::trace("{} resolved to {} '{}'", req.path, routeActionToString(route.action),
            route.action == RouteAction::SERVE_SYNTHETIC ? route.symbol : route.target);

        try {
            switch (route.action) {
            case RouteAction::SERVE_FIXTURE:
                res.status = 200;
                res.set_content(store_.read(route.target), "application/json");
                break;

            case RouteAction::SERVE_SYNTHETIC:
                res.status = 200;
                res.set_content(generator_.generateEnvelope(route.symbol), "application/json");
                break;

            case RouteAction::DELEGATE: {
                StaticFile file = staticFiles_.serve(route.target);
                res.status = 200;
                res.set_content(file.content, file.contentType);
                break;
            }

            case RouteAction::NOT_FOUND:
                throw NotFoundError(route.requestPath);
            }
        }
        catch (const NotFoundError& e) {
            Logger::info("404 {}: {}", req.path, e.what());
            res.status = 404;
            res.set_content(errorResponse(404, e.what()), "application/json");
        }
        catch (const std::exception& e) {
            Logger::error("500 {}: {}", req.path, e.what());
            res.status = 500;
            res.set_content(errorResponse(500, e.what()), "application/json");
        }
    }

    void ApiServer::handleUnsupported(const httplib::Request& req, httplib::Response& res) {
        res.status = 501;
        res.set_content(errorResponse(501, "Unsupported method ('" + req.method + "')"), "application/json");
    }

} // namespace mockapi
