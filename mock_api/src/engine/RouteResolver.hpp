#pragma once

#include "core/Types.hpp"
#include "FixtureStore.hpp"
#include <string>
#include <vector>

namespace mockapi {

    // Decides what a GET path is answered with. Rules, first match wins:
    //   1. ""                          -> root descriptor fixture
    //   2. final segment without '.'   -> <route>/index.json if present,
    //                                     else api/...market/data/<symbol>
    //                                     -> synthetic quote, else not found
    //   3. final segment with '.'      -> static file handler
    class RouteResolver {
    public:
        RouteResolver(const FixtureStore& store,
                      std::string rootDescriptor = "index.json",
                      std::string indexFile = "index.json");

        Resolution resolve(const std::string& requestPath) const;

        // "/api/health/" -> "api/health"
        static std::string normalize(const std::string& requestPath);

        // Split keeping empty segments: "a//b" -> {"a", "", "b"}
        static std::vector<std::string> split(const std::string& route, char sep = '/');

        static std::string lastSegment(const std::string& route);

    private:
        const FixtureStore& store_;
        std::string rootDescriptor_;
        std::string indexFile_;

        static constexpr const char* API_PREFIX = "api/";
        static constexpr const char* MARKET_DATA_MARKER = "market/data";
        static constexpr size_t SYMBOL_SEGMENT = 3;
    };

} // namespace mockapi
