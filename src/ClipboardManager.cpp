// Single Responsibility: Clipboard history (capture, restore, clear, persistence, observers)
// All mutations, persistence and notifications run under one lock, on one main context

#include "cliptrail/ClipboardManager.hpp"
#include "cliptrail/ClipboardBackend.hpp"
#include "cliptrail/HistoryStore.hpp"
#include "cliptrail/PollScheduler.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

namespace cliptrail {

ClipboardManager::ClipboardManager(const Config& config, ClipboardBackend& backend,
                                   HistoryStore& store, GMainContext* context)
    : m_config(config)
    , m_backend(backend)
    , m_store(store)
    , m_context(context) {
}

ClipboardManager::~ClipboardManager() {
    stopMonitoring();
}

// ============================================================================
// History operations
// ============================================================================

bool ClipboardManager::capture(ClipboardPayload payload) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (m_detector.isIgnoringNextChange()) {
        g_debug("capture skipped: self-write suppression armed");
        return false;
    }

    ClipboardEntry entry{
        generateUUID(),
        std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now()),
        std::move(payload),
    };
    g_debug("captured %s entry %s", toString(entry.content.type()), entry.uuid.c_str());

    m_entries.insert(m_entries.begin(), std::move(entry));
    persistLocked();
    notifyLocked();
    return true;
}

bool ClipboardManager::restore(const std::string& uuid) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&uuid](const ClipboardEntry& e) { return e.uuid == uuid; });
    if (it == m_entries.end()) {
        g_message("restore: no entry %s", uuid.c_str());
        return false;
    }

    // Arm before writing so the resulting change is never recaptured
    m_detector.ignoreNextChange();

    m_backend.clear();
    bool written = it->isText() ? m_backend.writeText(it->content.text())
                                : m_backend.writeImageBytes(it->content.imageBytes());
    if (!written) {
        g_warning("restore: could not write %s entry %s, the clipboard was left cleared",
                  toString(it->content.type()), uuid.c_str());
        return false;
    }

    g_debug("restored %s entry %s", toString(it->content.type()), uuid.c_str());
    return true;
}

void ClipboardManager::clearAll() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    m_entries.clear();
    persistLocked();
    notifyLocked();
    g_message("history cleared");
}

// ============================================================================
// Queries
// ============================================================================

std::vector<ClipboardEntry> ClipboardManager::getItems() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_entries;
}

std::optional<ClipboardEntry> ClipboardManager::findItem(const std::string& uuid) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&uuid](const ClipboardEntry& e) { return e.uuid == uuid; });
    if (it == m_entries.end()) return std::nullopt;
    return *it;
}

size_t ClipboardManager::size() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_entries.size();
}

// ============================================================================
// Monitoring
// ============================================================================

bool ClipboardManager::startMonitoring() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_scheduler && m_scheduler->isRunning()) return true;

    // Load once per manager: after that memory is authoritative
    bool loaded = m_loaded ? true : loadFromDisk();

    // Whatever is on the clipboard right now predates us
    m_detector.prime(m_backend);

    if (!m_scheduler) {
        m_scheduler = std::make_unique<PollScheduler>(
            std::chrono::milliseconds(m_config.pollIntervalMs), [this]() { poll(); }, m_context);
    }
    m_scheduler->start();

    g_message("monitoring clipboard every %d ms (%zu entries)", m_config.pollIntervalMs, m_entries.size());
    return loaded;
}

void ClipboardManager::stopMonitoring() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    // Keep the scheduler object: this may run from inside a tick
    if (m_scheduler) m_scheduler->stop();
}

bool ClipboardManager::isMonitoring() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_scheduler && m_scheduler->isRunning();
}

void ClipboardManager::poll() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (auto payload = m_detector.check(m_backend)) {
        capture(std::move(*payload));
    }
}

// ============================================================================
// Observers
// ============================================================================

ClipboardManager::SubscriptionId ClipboardManager::subscribe(Observer observer) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    SubscriptionId id = m_nextSubscription++;
    m_observers.emplace(id, std::move(observer));
    return id;
}

void ClipboardManager::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_observers.erase(id);
}

void ClipboardManager::notifyLocked() {
    // Copy: observers may unsubscribe from inside their callback
    auto observers = m_observers;
    for (const auto& [id, observer] : observers) {
        if (observer) observer(m_entries);
    }
}

// ============================================================================
// Persistence
// ============================================================================

bool ClipboardManager::loadFromDisk() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    std::vector<ClipboardEntry> loaded;
    std::string error;
    bool ok = m_store.load(loaded, error);
    m_loaded = true;

    // A broken file means an empty history, never a crash
    m_entries = std::move(loaded);
    m_lastError = ok ? std::string() : error;

    notifyLocked();
    return ok;
}

bool ClipboardManager::saveToDisk() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return persistLocked();
}

bool ClipboardManager::persistLocked() {
    // No rollback, no retry: memory stays authoritative
    std::string error;
    if (!m_store.save(m_entries, error)) {
        m_lastError = error;
        return false;
    }
    m_lastError.clear();
    return true;
}

std::string ClipboardManager::lastError() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_lastError;
}

std::string ClipboardManager::generateUUID() const {
    g_autofree gchar* uuid = g_uuid_string_random();
    return uuid;
}

} // namespace cliptrail
