// Single Responsibility: Fixed-period, non-reentrant poll timer on a GLib main context
// Replaces the toolkit timer loop with one explicit GSource

#include "cliptrail/PollScheduler.hpp"
#include <exception>
#include <utility>

namespace cliptrail {

PollScheduler::PollScheduler(std::chrono::milliseconds interval, Tick tick, GMainContext* context)
    : m_interval(interval)
    , m_tick(std::move(tick))
    , m_context(context ? g_main_context_ref(context) : nullptr) {
}

PollScheduler::~PollScheduler() {
    stop();
    if (m_context) g_main_context_unref(m_context);
}

void PollScheduler::start() {
    if (m_source) return;

    guint intervalMs = m_interval.count() > 0 ? static_cast<guint>(m_interval.count()) : 1;
    m_source = g_timeout_source_new(intervalMs);
    g_source_set_name(m_source, "cliptrail-poll");
    g_source_set_callback(m_source, onTimeout, this, nullptr);
    g_source_attach(m_source, m_context);

    g_debug("poll timer started (%u ms)", intervalMs);
}

void PollScheduler::stop() {
    if (!m_source) return;

    g_source_destroy(m_source);
    g_source_unref(m_source);
    m_source = nullptr;

    g_debug("poll timer stopped after %" G_GUINT64_FORMAT " ticks",
            static_cast<guint64>(m_tickCount));
}

gboolean PollScheduler::onTimeout(gpointer data) {
    static_cast<PollScheduler*>(data)->runTick();
    return G_SOURCE_CONTINUE;
}

void PollScheduler::runTick() {
    // GLib never recurses into a non-recursive source, but a tick that
    // iterates the context itself must not start a second one
    if (m_inTick) return;
    m_inTick = true;

    // A failed tick is isolated; the timer keeps running
    try {
        m_tick();
    } catch (const std::exception& e) {
        m_failedTickCount++;
        g_warning("poll tick failed: %s", e.what());
    }

    m_tickCount++;
    m_inTick = false;
}

} // namespace cliptrail
