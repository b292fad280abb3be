#include "CommandLine.hpp"
#include <stdexcept>

namespace mockapi {

    std::optional<int> parsePort(const std::string& text) {
        try {
            size_t consumed = 0;
            int value = std::stoi(text, &consumed);
            if (consumed != text.size() || value < 1 || value > 65535) {
                return std::nullopt;
            }
            return value;
        }
        catch (const std::logic_error&) {
            // invalid_argument and out_of_range
            return std::nullopt;
        }
    }

    CommandLineOptions parseCommandLine(int argc, const char* const argv[]) {
        CommandLineOptions opts;
        const int defaultPort = ServerConfig{}.server.port;

        int i = 1;

        // Positional port comes first, before any named option
        if (argc > 1 && std::string(argv[1]).rfind("--", 0) != 0) {
            std::string arg = argv[1];
            if (auto port = parsePort(arg)) {
                opts.port = *port;
            }
            else {
                opts.port = defaultPort;
                opts.warnings.push_back("Invalid port: " + arg + ", using default: " + std::to_string(defaultPort));
            }
            i = 2;
        }

        for (; i < argc; ++i) {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;

            if (arg == "--config" && hasValue) {
                opts.configPath = argv[++i];
            }
            else if (arg == "--host" && hasValue) {
                opts.host = argv[++i];
            }
            else if (arg == "--port" && hasValue) {
                std::string value = argv[++i];
                if (auto port = parsePort(value)) {
                    opts.port = *port;
                }
                else {
                    opts.port = defaultPort;
                    opts.warnings.push_back("Invalid port: " + value + ", using default: " + std::to_string(defaultPort));
                }
            }
            else if (arg == "--root" && hasValue) {
                opts.rootDir = argv[++i];
            }
            else if (arg == "--log-level" && hasValue) {
                opts.logLevel = argv[++i];
            }
            else if (arg == "--log-file" && hasValue) {
                opts.logFile = argv[++i];
            }
            else if (arg == "--seed") {
                opts.seedSamples = true;
            }
            else if (arg == "--no-provision") {
                opts.noProvision = true;
            }
            else if (arg == "--help") {
                opts.showHelp = true;
            }
            else {
                opts.warnings.push_back("Ignoring unknown argument: " + arg);
            }
        }

        return opts;
    }

    void CommandLineOptions::applyTo(ServerConfig& config) const {
        if (host) config.server.host = *host;
        if (port) config.server.port = *port;
        if (rootDir) config.fixtures.rootDir = *rootDir;
        if (logLevel) config.logging.level = *logLevel;
        if (logFile) config.logging.file = *logFile;
        if (seedSamples) config.fixtures.seedSamples = true;
        if (noProvision) config.fixtures.provision = false;
    }

    std::string usageText() {
        return "ARB Platform Mock API Server\n"
            "Usage: mock_api_server [port] [options]\n"
            "Options:\n"
            "  --config <path>         JSON config file merged over the defaults\n"
            "  --host <host>           Bind address (default: 0.0.0.0)\n"
            "  --port <port>           Listen port (default: 8000)\n"
            "  --root <dir>            Fixture root directory (default: .)\n"
            "  --log-level <level>     trace, debug, info, warn or error (default: info)\n"
            "  --log-file <path>       Log file, empty for console only (default: mock_api.log)\n"
            "  --seed                  Write the sample fixture set where missing\n"
            "  --no-provision          Do not create directories or the root descriptor\n"
            "  --help                  Show this help\n";
    }

} // namespace mockapi
