#pragma once
// Single Responsibility: Text command handling (control socket integration)

#include "Forward.hpp"
#include <string>
#include <functional>
#include <unordered_map>

namespace cliptrail {

class IPCHandler {
public:
    using Handler = std::function<std::string(const std::string&)>;

    explicit IPCHandler(ClipboardManager& manager);
    ~IPCHandler();

    // Command registration
    void registerCommand(const std::string& name, Handler handler);

    // Command execution
    std::string handleCommand(const std::string& command, const std::string& args);
    // "<command> [args]" as received on the socket
    std::string handleRequest(const std::string& request);

private:
    ClipboardManager& m_manager;
    std::unordered_map<std::string, Handler> m_commands;

    // Standard commands
    std::string cmdList(const std::string& args);
    std::string cmdRestore(const std::string& args);
    std::string cmdClear(const std::string& args);
    std::string cmdPing(const std::string& args);
};

} // namespace cliptrail
