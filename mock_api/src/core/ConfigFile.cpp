#include "ConfigFile.hpp"
#include "utils/Logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace mockapi {

    bool loadConfigFile(const std::string& path, ServerConfig& config) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", path);
            return false;
        }

        try {
            nlohmann::json j;
            file >> j;
            config.fromJson(j);
        }
        catch (const std::exception& e) {
            Logger::warn("Failed to load config {}: {}, using defaults", path, e.what());
            return false;
        }

        Logger::info("Loaded config from {}", path);
        return true;
    }

} // namespace mockapi
