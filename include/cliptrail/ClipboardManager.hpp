#pragma once
// Single Responsibility: Clipboard history (capture, restore, clear, persistence, observers)

#include "Forward.hpp"
#include "ClipboardEntry.hpp"
#include "ChangeDetector.hpp"
#include "Config.hpp"
#include <glib.h>
#include <vector>
#include <string>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace cliptrail {

class ClipboardManager {
public:
    using Observer = std::function<void(const std::vector<ClipboardEntry>&)>;
    using SubscriptionId = int;

    // context == nullptr polls on the default main context
    ClipboardManager(const Config& config, ClipboardBackend& backend, HistoryStore& store,
                     GMainContext* context = nullptr);
    ~ClipboardManager();

    ClipboardManager(const ClipboardManager&) = delete;
    ClipboardManager& operator=(const ClipboardManager&) = delete;

    // History operations
    bool capture(ClipboardPayload payload);
    // false: unknown id, or the backend could not take the payload
    bool restore(const std::string& uuid);
    void clearAll();

    // Queries (newest first)
    std::vector<ClipboardEntry> getItems() const;
    std::optional<ClipboardEntry> findItem(const std::string& uuid) const;
    size_t size() const;

    // Monitoring
    bool startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const;
    void poll();

    // Observers, called synchronously after every mutation
    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);

    // Persistence
    bool loadFromDisk();
    bool saveToDisk();
    std::string lastError() const;

private:
    const Config& m_config;
    ClipboardBackend& m_backend;
    HistoryStore& m_store;
    GMainContext* m_context = nullptr;

    std::vector<ClipboardEntry> m_entries;
    ChangeDetector m_detector;
    std::unique_ptr<PollScheduler> m_scheduler;
    mutable std::recursive_mutex m_mutex;

    std::map<SubscriptionId, Observer> m_observers;
    SubscriptionId m_nextSubscription = 1;
    std::string m_lastError;
    bool m_loaded = false;

    std::string generateUUID() const;
    bool persistLocked();
    void notifyLocked();
};

} // namespace cliptrail
