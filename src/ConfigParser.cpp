// Single Responsibility: Configuration file parsing

#include "cliptrail/ConfigParser.hpp"
#include <glib.h>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace cliptrail {

static constexpr int MIN_POLL_INTERVAL_MS = 50;

std::string getConfigPath() {
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    std::string configDir;

    if (xdgConfig && *xdgConfig) {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        configDir = home ? std::string(home) + "/.config" : "/tmp";
    }

    return configDir + "/cliptrail/cliptrail.toml";
}

std::string getDataDir() {
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    std::string dataDir;

    if (xdgData && *xdgData) {
        dataDir = xdgData;
    } else {
        const char* home = std::getenv("HOME");
        dataDir = home ? std::string(home) + "/.local/share" : "/tmp";
    }

    dataDir += "/cliptrail";

    // Create directory if it doesn't exist
    std::error_code ec;
    fs::create_directories(dataDir, ec);
    if (ec) {
        g_warning("config: cannot create %s: %s", dataDir.c_str(), ec.message().c_str());
    }

    return dataDir;
}

std::string getHistoryPath(const Config& config) {
    if (!config.historyFile.empty()) return config.historyFile;
    std::string dataDir = config.dataDir.empty() ? getDataDir() : config.dataDir;
    return dataDir + "/history.json";
}

// Simple TOML-like parser (manual, no external dependency)
static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    size_t end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

static std::string parseString(const std::string& value) {
    std::string v = trim(value);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

static bool parseInt(const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(trim(value), &used);
        if (used != trim(value).size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Config loadConfig() {
    return loadConfig(getConfigPath());
}

Config loadConfig(const std::string& path) {
    Config config;
    config.configPath = path;
    config.dataDir = getDataDir();

    std::ifstream file(config.configPath);
    if (!file.is_open()) {
        // Return defaults if config doesn't exist
        g_debug("config: %s not found, using defaults", config.configPath.c_str());
        return config;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        lineNo++;
        line = trim(line);

        // Skip comments, section headers and empty lines
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Parse known keys
        if (key == "poll_interval_ms") {
            int interval = 0;
            if (parseInt(value, interval) && interval >= MIN_POLL_INTERVAL_MS) {
                config.pollIntervalMs = interval;
            } else {
                g_warning("config: %s:%d: invalid poll_interval_ms '%s', keeping %d",
                          config.configPath.c_str(), lineNo, value.c_str(), config.pollIntervalMs);
            }
        }
        else if (key == "gdk_backends") config.gdkBackends = parseString(value);
        else if (key == "history_file") config.historyFile = parseString(value);
        else if (key == "socket_path") config.socketPath = parseString(value);
        else g_debug("config: %s:%d: unknown key '%s'", config.configPath.c_str(), lineNo, key.c_str());
    }

    return config;
}

bool saveConfig(const Config& config) {
    std::error_code ec;
    fs::path configPath(config.configPath);
    if (configPath.has_parent_path()) fs::create_directories(configPath.parent_path(), ec);

    std::ofstream file(config.configPath);
    if (!file.is_open()) {
        g_warning("config: cannot write %s", config.configPath.c_str());
        return false;
    }

    file << "# cliptrail configuration\n\n";
    file << "[general]\n";
    file << "poll_interval_ms = " << config.pollIntervalMs << "\n";
    file << "# \"wayland\" only sees copies made while cliptrail has focus\n";
    file << "gdk_backends = \"" << config.gdkBackends << "\"\n\n";

    file << "[paths]\n";
    file << "# history_file = \"" << getHistoryPath(config) << "\"\n";
    if (!config.historyFile.empty()) {
        file << "history_file = \"" << config.historyFile << "\"\n";
    }
    file << "socket_path = \"" << config.socketPath << "\"\n";

    return static_cast<bool>(file);
}

} // namespace cliptrail
