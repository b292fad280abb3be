#include "api/ApiServer.hpp"
#include "core/CommandLine.hpp"
#include "core/ConfigFile.hpp"
#include "core/ServerConfig.hpp"
#include "engine/FixtureProvisioner.hpp"
#include "utils/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace mockapi;

static std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown = true;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CommandLineOptions opts = parseCommandLine(argc, argv);
    if (opts.showHelp) {
        std::cout << usageText();
        return 0;
    }

    ServerConfig config;

    try {
        // Console-only until the final logging settings are known
        Logger::init("", opts.logLevel.value_or(config.logging.level), true);

        bool configLoaded = !opts.configPath.empty() && loadConfigFile(opts.configPath, config);
        opts.applyTo(config);

        Logger::init(config.logging.file, config.logging.level, config.logging.console);

        for (const auto& warning : opts.warnings) {
            Logger::warn("{}", warning);
        }

        Logger::info("=== ARB Platform Mock API Server ===");
        Logger::info("Config: {}", configLoaded ? opts.configPath : std::string("built-in defaults"));
        Logger::info("API: {}:{}", config.server.host, config.server.port);
        Logger::info("Fixture root: {}", config.fixtures.rootDir);

        if (config.fixtures.provision) {
            FixtureProvisioner provisioner(config.fixtures.rootDir, config.fixtures);
            provisioner.run();
        }

        ApiServer api(config);
        if (!api.start()) {
            return 1;
        }

        Logger::info("Serving on port {}", api.getPort());
        Logger::info("Press Ctrl+C to exit");

        while (api.isRunning() && !g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        api.stop();
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    Logger::info("Server stopped.");
    return 0;
}
