#pragma once
// Single Responsibility: Configuration file parsing

#include "Config.hpp"
#include <string>

namespace cliptrail {

// Load config from $XDG_CONFIG_HOME/cliptrail/cliptrail.toml
Config loadConfig();
Config loadConfig(const std::string& path);

// Save config to config.configPath
bool saveConfig(const Config& config);

// Get config file path
std::string getConfigPath();

// Get data directory path (created if missing)
std::string getDataDir();

// Resolved location of the history document
std::string getHistoryPath(const Config& config);

} // namespace cliptrail
