#pragma once

#include <string>
#include <cstdint>
#include <stdexcept>

namespace mockapi {

    using Price = double;
    using Timestamp = uint64_t;   // epoch microseconds

    // Randomly generated top-of-book snapshot, never persisted
    struct MarketQuote {
        std::string symbol;
        Price price = 0.0;
        Price bid = 0.0;
        Price ask = 0.0;
        double volume = 0.0;
        std::string timestamp;
        std::string exchange;
    };

    enum class RouteAction {
        SERVE_FIXTURE,    // Serve a JSON file from the fixture tree
        SERVE_SYNTHETIC,  // Generate a market quote for `symbol`
        DELEGATE,         // Extension-bearing path, static file handler
        NOT_FOUND
    };

    struct Resolution {
        RouteAction action = RouteAction::NOT_FOUND;
        std::string requestPath;  // Path as received, used in error messages
        std::string target;       // Fixture or file path relative to the root
        std::string symbol;
    };

    inline const char* routeActionToString(RouteAction action) {
        switch (action) {
        case RouteAction::SERVE_FIXTURE: return "fixture";
        case RouteAction::SERVE_SYNTHETIC: return "synthetic";
        case RouteAction::DELEGATE: return "delegate";
        case RouteAction::NOT_FOUND: return "not_found";
        }
        return "unknown";
    }

    // The only request-time failure: nothing to serve for `path`
    class NotFoundError : public std::runtime_error {
    public:
        explicit NotFoundError(const std::string& path)
            : std::runtime_error("File not found: " + path)
            , path_(path) {}

        const std::string& getPath() const { return path_; }

    private:
        std::string path_;
    };

} // namespace mockapi
