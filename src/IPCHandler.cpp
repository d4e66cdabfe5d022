// Single Responsibility: Text command handling

#include "cliptrail/IPCHandler.hpp"
#include "cliptrail/ClipboardManager.hpp"
#include "cliptrail/HistoryStore.hpp"
#include <stdexcept>
#include <utility>

namespace cliptrail {

static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    size_t end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

IPCHandler::IPCHandler(ClipboardManager& manager)
    : m_manager(manager) {
    // Register standard commands
    registerCommand("list", [this](const std::string& args) { return cmdList(args); });
    registerCommand("restore", [this](const std::string& args) { return cmdRestore(args); });
    registerCommand("clear", [this](const std::string& args) { return cmdClear(args); });
    registerCommand("ping", [this](const std::string& args) { return cmdPing(args); });
}

IPCHandler::~IPCHandler() = default;

void IPCHandler::registerCommand(const std::string& name, Handler handler) {
    m_commands[name] = std::move(handler);
}

std::string IPCHandler::handleCommand(const std::string& command,
                                      const std::string& args) {
    auto it = m_commands.find(command);
    if (it != m_commands.end()) {
        return it->second(args);
    }
    return "unknown command: " + command;
}

std::string IPCHandler::handleRequest(const std::string& request) {
    std::string cmd = trim(request);
    std::string args;

    size_t spacePos = cmd.find(' ');
    if (spacePos != std::string::npos) {
        args = trim(cmd.substr(spacePos + 1));
        cmd = cmd.substr(0, spacePos);
    }

    return handleCommand(cmd, args);
}

// list [limit]: "<uuid> | <date> | <type> | <first line>" per entry, newest first
std::string IPCHandler::cmdList(const std::string& args) {
    size_t limit = 0;
    if (!args.empty()) {
        try {
            int parsed = std::stoi(args);
            if (parsed <= 0) return "error: invalid limit";
            limit = static_cast<size_t>(parsed);
        } catch (const std::exception&) {
            return "error: invalid limit";
        }
    }

    auto items = m_manager.getItems();
    std::string result;
    size_t count = 0;
    for (const auto& item : items) {
        if (limit && count++ >= limit) break;
        result += item.uuid + " | " + HistoryStore::formatTimestamp(item.createdAt) + " | " +
                  toString(item.content.type()) + " | " + item.content.preview(1) + "\n";
    }
    return result.empty() ? "no items" : result;
}

std::string IPCHandler::cmdRestore(const std::string& args) {
    if (args.empty()) return "error: no uuid provided";
    if (m_manager.restore(args)) return "restored";
    if (m_manager.findItem(args)) return "error: clipboard write failed";
    return "error: item not found";
}

std::string IPCHandler::cmdClear(const std::string& /*args*/) {
    m_manager.clearAll();
    std::string error = m_manager.lastError();
    return error.empty() ? "cleared" : "cleared (not saved: " + error + ")";
}

std::string IPCHandler::cmdPing(const std::string& /*args*/) {
    return "pong";
}

} // namespace cliptrail
