#include "FixtureStore.hpp"
#include "core/Types.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mockapi {

    FixtureStore::FixtureStore(const fs::path& root)
        : root_(fs::absolute(root).lexically_normal()) {
        // "/srv/fixtures/" and "/srv/fixtures" must compare the same below
        if (!root_.has_filename() && root_.has_relative_path()) {
            root_ = root_.parent_path();
        }
    }

    std::optional<fs::path> FixtureStore::resolve(const std::string& relPath) const {
        fs::path rel(relPath);
        if (rel.is_absolute()) {
            rel = rel.relative_path();
        }

        fs::path candidate = (root_ / rel).lexically_normal();

        auto mismatch = std::mismatch(root_.begin(), root_.end(), candidate.begin(), candidate.end());
        if (mismatch.first != root_.end()) {
            return std::nullopt;
        }
        return candidate;
    }

    bool FixtureStore::exists(const std::string& relPath) const {
        auto path = resolve(relPath);
        std::error_code ec;
        return path && fs::exists(*path, ec);
    }

    bool FixtureStore::isFile(const std::string& relPath) const {
        auto path = resolve(relPath);
        std::error_code ec;
        return path && fs::is_regular_file(*path, ec);
    }

    std::string FixtureStore::read(const std::string& relPath) const {
        if (!isFile(relPath)) {
            throw NotFoundError(relPath);
        }

        // Can still fail if the file went away after the check
        std::ifstream file(*resolve(relPath), std::ios::binary);
        if (!file.is_open()) {
            throw NotFoundError(relPath);
        }

        std::ostringstream content;
        content << file.rdbuf();
        if (file.bad()) {
            throw NotFoundError(relPath);
        }
        return content.str();
    }

} // namespace mockapi
