#pragma once
#include <string>

namespace cliptrail {

struct Config {
    // Polling (reference behavior: once per second)
    int pollIntervalMs = 1000;

    // GDK backends the daemon may open. Wayland only delivers selection
    // changes to a focused surface, so the windowless daemon defaults to
    // X11 (XWayland on Wayland sessions), where XFixes reports every change.
    std::string gdkBackends = "x11";

    // Paths
    std::string configPath;     // path to cliptrail.toml
    std::string dataDir;        // per-user data directory
    std::string historyFile;    // empty = <dataDir>/history.json
    std::string socketPath = "/tmp/cliptrail.sock";
};

} // namespace cliptrail
