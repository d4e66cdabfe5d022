#pragma once
// Single Responsibility: Fixed-period, non-reentrant poll timer on a GLib main context

#include <glib.h>
#include <chrono>
#include <cstdint>
#include <functional>

namespace cliptrail {

class PollScheduler {
public:
    using Tick = std::function<void()>;

    // context == nullptr attaches to the default main context
    PollScheduler(std::chrono::milliseconds interval, Tick tick, GMainContext* context = nullptr);
    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_source != nullptr; }

    std::chrono::milliseconds interval() const { return m_interval; }
    std::uint64_t tickCount() const { return m_tickCount; }
    std::uint64_t failedTickCount() const { return m_failedTickCount; }

private:
    std::chrono::milliseconds m_interval;
    Tick m_tick;
    GMainContext* m_context = nullptr;
    GSource* m_source = nullptr;
    bool m_inTick = false;
    std::uint64_t m_tickCount = 0;
    std::uint64_t m_failedTickCount = 0;

    static gboolean onTimeout(gpointer data);
    void runTick();
};

} // namespace cliptrail
