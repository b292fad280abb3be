#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace mockapi {

    // Read-only view of the fixture tree. Every lookup is confined to the
    // root directory; paths escaping it behave as if they did not exist.
    class FixtureStore {
    public:
        explicit FixtureStore(const std::filesystem::path& root);

        // Absolute on-disk path for a root-relative path, or nullopt if
        // the path would leave the root
        std::optional<std::filesystem::path> resolve(const std::string& relPath) const;

        bool exists(const std::string& relPath) const;
        bool isFile(const std::string& relPath) const;

        // Raw bytes of a fixture. Throws NotFoundError naming `relPath` when
        // the file is missing, is not a regular file, or cannot be read.
        std::string read(const std::string& relPath) const;

        const std::filesystem::path& getRoot() const { return root_; }

    private:
        std::filesystem::path root_;
    };

} // namespace mockapi
