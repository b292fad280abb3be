#include "RouteResolver.hpp"

namespace mockapi {

    RouteResolver::RouteResolver(const FixtureStore& store,
                                 std::string rootDescriptor,
                                 std::string indexFile)
        : store_(store)
        , rootDescriptor_(std::move(rootDescriptor))
        , indexFile_(std::move(indexFile))
    {
    }

    std::string RouteResolver::normalize(const std::string& requestPath) {
        size_t begin = requestPath.find_first_not_of('/');
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = requestPath.find_last_not_of('/');
        return requestPath.substr(begin, end - begin + 1);
    }

    std::vector<std::string> RouteResolver::split(const std::string& route, char sep) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t pos = route.find(sep, start);
            if (pos == std::string::npos) {
                parts.push_back(route.substr(start));
                break;
            }
            parts.push_back(route.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    std::string RouteResolver::lastSegment(const std::string& route) {
        size_t pos = route.rfind('/');
        return pos == std::string::npos ? route : route.substr(pos + 1);
    }

    Resolution RouteResolver::resolve(const std::string& requestPath) const {
        Resolution res;
        res.requestPath = requestPath;

        std::string route = normalize(requestPath);

        if (route.empty()) {
            res.action = RouteAction::SERVE_FIXTURE;
            res.target = rootDescriptor_;
            return res;
        }

        if (lastSegment(route).find('.') != std::string::npos) {
            res.action = RouteAction::DELEGATE;
            res.target = route;
            return res;
        }

        // A directory holding the index and a bare "<route>/index.json" are
        // the same lookup on disk
        std::string indexPath = route + "/" + indexFile_;
        if (store_.exists(indexPath)) {
            res.action = RouteAction::SERVE_FIXTURE;
            res.target = indexPath;
            return res;
        }

        if (route.rfind(API_PREFIX, 0) == 0 && route.find(MARKET_DATA_MARKER) != std::string::npos) {
            auto parts = split(route);
            if (parts.size() > SYMBOL_SEGMENT) {
                res.action = RouteAction::SERVE_SYNTHETIC;
                res.symbol = parts[SYMBOL_SEGMENT];
                return res;
            }
        }

        res.action = RouteAction::NOT_FOUND;
        return res;
    }

} // namespace mockapi
