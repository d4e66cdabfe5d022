// Single Responsibility: Mutation-counter change detection + self-write suppression

#include "cliptrail/ChangeDetector.hpp"
#include "cliptrail/ClipboardBackend.hpp"
#include <glib.h>

namespace cliptrail {

void ChangeDetector::prime(const ClipboardBackend& backend) {
    m_lastMutationCount = backend.currentMutationCount();
}

std::optional<ClipboardPayload> ChangeDetector::check(const ClipboardBackend& backend) {
    std::int64_t current = backend.currentMutationCount();
    if (current == m_lastMutationCount) return std::nullopt;
    m_lastMutationCount = current;

    // Our own restore: consume the flag, record nothing
    if (m_ignoreNextChange) {
        m_ignoreNextChange = false;
        g_debug("clipboard change %" G_GINT64_FORMAT " suppressed (self-write)",
                static_cast<gint64>(current));
        return std::nullopt;
    }

    // Text wins over image
    if (auto text = ClipboardPayload::fromText(backend.readText())) {
        return text;
    }
    if (auto image = ClipboardPayload::fromImageBytes(backend.readImageBytes())) {
        return image;
    }

    g_debug("clipboard change %" G_GINT64_FORMAT " has no representable content",
            static_cast<gint64>(current));
    return std::nullopt;
}

} // namespace cliptrail
