#pragma once

#include "core/ServerConfig.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace mockapi {

    // Prepares the fixture tree before the listener starts: the directory
    // layout, the root descriptor and, on request, a sample fixture set.
    // Existing files are never overwritten.
    class FixtureProvisioner {
    public:
        FixtureProvisioner(const std::filesystem::path& root,
                           const ServerConfig::FixtureParams& params);

        // Directories + root descriptor, plus samples if enabled
        void run();

        // Creates every configured directory; throws std::runtime_error
        void ensureLayout();

        // Returns true if the descriptor had to be written
        bool ensureRootDescriptor();

        // Returns the number of fixture files written
        size_t seedSamples();

        static nlohmann::ordered_json defaultRootDescriptor();

    private:
        std::filesystem::path root_;
        ServerConfig::FixtureParams params_;

        bool writeIfMissing(const std::string& relPath, const nlohmann::ordered_json& content);
    };

} // namespace mockapi
