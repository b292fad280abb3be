#include "StaticFileHandler.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace mockapi {

    StaticFileHandler::StaticFileHandler(const FixtureStore& store)
        : store_(store)
    {
    }

    std::string StaticFileHandler::contentTypeFor(const std::string& path) {
        static const std::map<std::string, std::string> types = {
            {"json", "application/json"},
            {"txt",  "text/plain"},
            {"html", "text/html"},
            {"htm",  "text/html"},
            {"css",  "text/css"},
            {"js",   "text/javascript"},
            {"mjs",  "text/javascript"},
            {"csv",  "text/csv"},
            {"xml",  "application/xml"},
            {"svg",  "image/svg+xml"},
            {"png",  "image/png"},
            {"jpg",  "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"gif",  "image/gif"},
            {"ico",  "image/x-icon"},
            {"webp", "image/webp"},
            {"pdf",  "application/pdf"},
            {"wasm", "application/wasm"},
            {"map",  "application/json"}
        };

        size_t slash = path.find_last_of('/');
        size_t dot = path.find_last_of('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
            return "application/octet-stream";
        }

        std::string ext = path.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto it = types.find(ext);
        return it != types.end() ? it->second : "application/octet-stream";
    }

    StaticFile StaticFileHandler::serve(const std::string& relPath) const {
        StaticFile file;
        file.content = store_.read(relPath);
        file.contentType = contentTypeFor(relPath);
        return file;
    }

} // namespace mockapi
