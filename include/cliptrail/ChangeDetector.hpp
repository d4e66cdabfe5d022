#pragma once
// Single Responsibility: Mutation-counter change detection + self-write suppression

#include "Forward.hpp"
#include "ClipboardPayload.hpp"
#include <cstdint>
#include <optional>

namespace cliptrail {

class ChangeDetector {
public:
    // Adopt the backend's current counter without capturing anything
    void prime(const ClipboardBackend& backend);

    // One poll tick. Returns the payload of an external change, or nullopt when
    // the counter is unchanged, the change was our own write, or nothing is representable.
    std::optional<ClipboardPayload> check(const ClipboardBackend& backend);

    // Single-shot: the next detected change is swallowed whatever its content
    void ignoreNextChange() { m_ignoreNextChange = true; }
    bool isIgnoringNextChange() const { return m_ignoreNextChange; }

    std::int64_t lastMutationCount() const { return m_lastMutationCount; }

private:
    std::int64_t m_lastMutationCount = 0;
    bool m_ignoreNextChange = false;
};

} // namespace cliptrail
