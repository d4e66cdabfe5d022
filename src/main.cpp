// cliptrail - clipboard history daemon
// Runs as a windowless X11 client (XWayland under Wayland compositors)
// on the GLib main loop.
// Control commands reach the running instance via a Unix socket.

#include "cliptrail/ClipboardManager.hpp"
#include "cliptrail/ConfigParser.hpp"
#include "cliptrail/GtkClipboardBackend.hpp"
#include "cliptrail/HistoryStore.hpp"
#include "cliptrail/IPCHandler.hpp"
#include <gtk/gtk.h>
#include <glib-unix.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>

using namespace cliptrail;

static IPCHandler* g_ipcHandler = nullptr;
static int g_listenSock = -1;

// ============================================================================
// Send command to the running instance (returns false if none is listening)
// ============================================================================

static bool sendCommand(const std::string& socketPath, const std::string& cmd, std::string& response) {
    int sock = socket(AF_UNIX, SOCK_STREAM, 0);
    if (sock == -1) return false;

    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    // Timeout (5 seconds)
    struct timeval tv{5, 0};
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        close(sock);
        return false;
    }

    if (write(sock, cmd.c_str(), cmd.size()) != static_cast<ssize_t>(cmd.size())) {
        close(sock);
        return false;
    }
    shutdown(sock, SHUT_WR);

    char buf[4096];
    ssize_t n;
    while ((n = read(sock, buf, sizeof(buf))) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    close(sock);
    return true;
}

// ============================================================================
// Socket listener (one request, one response per connection)
// ============================================================================

static gboolean onSocketAccept(GIOChannel*, GIOCondition, gpointer) {
    struct sockaddr_un clientAddr{};
    socklen_t clientLen = sizeof(clientAddr);
    int clientSock = accept(g_listenSock,
        reinterpret_cast<struct sockaddr*>(&clientAddr), &clientLen);
    if (clientSock == -1) return TRUE;

    struct timeval tv{2, 0};
    setsockopt(clientSock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    char buf[512] = {};
    ssize_t n = read(clientSock, buf, sizeof(buf) - 1);

    if (n > 0 && g_ipcHandler) {
        std::string response = g_ipcHandler->handleRequest(std::string(buf, static_cast<size_t>(n)));
        if (write(clientSock, response.c_str(), response.size()) == -1) {
            g_debug("ipc: client went away before the response: %s", g_strerror(errno));
        }
    }
    close(clientSock);

    return TRUE;
}

static bool createSocketListener(const std::string& socketPath) {
    unlink(socketPath.c_str());

    g_listenSock = socket(AF_UNIX, SOCK_STREAM, 0);
    if (g_listenSock == -1) return false;

    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(g_listenSock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1 ||
        listen(g_listenSock, 5) == -1) {
        close(g_listenSock);
        g_listenSock = -1;
        return false;
    }

    GIOChannel* channel = g_io_channel_unix_new(g_listenSock);
    g_io_add_watch(channel, G_IO_IN, onSocketAccept, nullptr);
    g_io_channel_unref(channel);

    return true;
}

// ============================================================================
// Signal handler (clean shutdown)
// ============================================================================

static gboolean onSignal(gpointer data) {
    g_main_loop_quit(static_cast<GMainLoop*>(data));
    return G_SOURCE_REMOVE;
}

static void printUsage(const char* argv0) {
    std::printf("usage: %s [--list [N] | --restore UUID | --clear | --ping]\n"
                "       without arguments, run the clipboard history daemon\n", argv0);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    // Parse command
    std::string cmd;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::string next = (i + 1 < argc) ? argv[i + 1] : "";
        if (arg == "--list") {
            cmd = "list";
            if (!next.empty() && next[0] != '-') { cmd += " " + next; i++; }
        }
        else if (arg == "--restore" && !next.empty()) { cmd = "restore " + next; i++; }
        else if (arg == "--clear") cmd = "clear";
        else if (arg == "--ping") cmd = "ping";
        else { printUsage(argv[0]); return arg == "--help" ? 0 : 2; }
    }

    // Load config
    Config config = loadConfig();

    // Command mode: talk to the running daemon and exit
    if (!cmd.empty()) {
        std::string response;
        if (!sendCommand(config.socketPath, cmd, response)) {
            std::fprintf(stderr, "cliptrail is not running (%s)\n", config.socketPath.c_str());
            return 1;
        }
        std::printf("%s\n", response.c_str());
        return response.rfind("error", 0) == 0 ? 1 : 0;
    }

    // Initialize GTK for display access only; no windows are created
    gdk_set_allowed_backends(config.gdkBackends.c_str());
    gtk_init();
    GdkDisplay* display = gdk_display_get_default();
    if (!display) {
        g_critical("no display available for backends '%s', cannot watch the clipboard",
                   config.gdkBackends.c_str());
        return 1;
    }

    // Create components
    GtkClipboardBackend backend(gdk_display_get_clipboard(display));
    HistoryStore store([&config]() { return std::filesystem::path(getHistoryPath(config)); });
    ClipboardManager manager(config, backend, store);
    IPCHandler ipcHandler(manager);
    g_ipcHandler = &ipcHandler;

    // Set up socket listener for control commands
    if (!createSocketListener(config.socketPath)) {
        g_warning("cannot listen on %s: %s", config.socketPath.c_str(), g_strerror(errno));
    }

    if (!manager.startMonitoring()) {
        g_warning("starting with an empty history: %s", manager.lastError().c_str());
    }

    // Run GLib main loop
    GMainLoop* mainLoop = g_main_loop_new(nullptr, FALSE);
    g_unix_signal_add(SIGINT, onSignal, mainLoop);
    g_unix_signal_add(SIGTERM, onSignal, mainLoop);
    g_main_loop_run(mainLoop);
    g_main_loop_unref(mainLoop);

    // Cleanup
    manager.stopMonitoring();
    g_ipcHandler = nullptr;
    if (g_listenSock >= 0) {
        close(g_listenSock);
        unlink(config.socketPath.c_str());
    }

    return 0;
}
