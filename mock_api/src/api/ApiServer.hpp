#pragma once

#include "core/ServerConfig.hpp"
#include "engine/FixtureStore.hpp"
#include "engine/RouteResolver.hpp"
#include "engine/QuoteGenerator.hpp"
#include "StaticFileHandler.hpp"
#include <httplib.h>
#include <thread>
#include <atomic>
#include <string>

namespace mockapi {

class ApiServer {
public:
    explicit ApiServer(const ServerConfig& config);
    ~ApiServer();

    // Binds synchronously, then serves on a background thread.
    // Returns false if the port cannot be bound.
    bool start();
    void stop();

    bool isRunning() const { return running_.load(); }

    // Actual port, resolved after start() when configured as 0
    int getPort() const { return port_; }
    const std::string& getHost() const { return host_; }

private:
    ServerConfig config_;
    FixtureStore store_;
    RouteResolver router_;
    QuoteGenerator generator_;
    StaticFileHandler staticFiles_;
    httplib::Server server_;
    std::string host_;
    int port_;

    std::thread serverThread_;
    std::atomic<bool> running_{false};

    void setupRoutes();

    void handleGet(const httplib::Request& req, httplib::Response& res);
    void handleUnsupported(const httplib::Request& req, httplib::Response& res);

    // Helper for JSON error bodies
    static std::string errorResponse(int status, const std::string& message);
};

} // namespace mockapi
