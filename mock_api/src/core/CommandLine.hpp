#pragma once

#include "ServerConfig.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mockapi {

    // Options given on the command line. Unset fields leave the
    // config file (or default) value untouched.
    struct CommandLineOptions {
        std::string configPath;
        std::optional<std::string> host;
        std::optional<int> port;
        std::optional<std::string> rootDir;
        std::optional<std::string> logLevel;
        std::optional<std::string> logFile;
        bool seedSamples = false;
        bool noProvision = false;
        bool showHelp = false;

        // Problems found while parsing, reported once logging is up
        std::vector<std::string> warnings;

        void applyTo(ServerConfig& config) const;
    };

    // Strict port parse: the whole string must be an integer in 1..65535
    std::optional<int> parsePort(const std::string& text);

    // `mock_api_server [port] [--option value ...]`
    CommandLineOptions parseCommandLine(int argc, const char* const argv[]);

    std::string usageText();

} // namespace mockapi
