#pragma once

#include "ServerConfig.hpp"
#include <string>

namespace mockapi {

    // Merge-patches the JSON file at `path` into `config`. A missing,
    // malformed or invalid file is logged and leaves `config` untouched.
    // Returns true if the file was applied.
    bool loadConfigFile(const std::string& path, ServerConfig& config);

} // namespace mockapi
