#pragma once

#include "engine/FixtureStore.hpp"
#include <string>

namespace mockapi {

    struct StaticFile {
        std::string content;
        std::string contentType;
    };

    // Serves extension-bearing paths straight from the fixture root.
    // Directory listings are not produced.
    class StaticFileHandler {
    public:
        explicit StaticFileHandler(const FixtureStore& store);

        // Throws NotFoundError when `relPath` is not a readable file
        StaticFile serve(const std::string& relPath) const;

        // MIME type from the extension, application/octet-stream if unknown
        static std::string contentTypeFor(const std::string& path);

    private:
        const FixtureStore& store_;
    };

} // namespace mockapi
