#pragma once
// Single Responsibility: Data structure for clipboard history items

#include "ClipboardPayload.hpp"
#include <string>
#include <chrono>

namespace cliptrail {

struct ClipboardEntry {
    std::string uuid;
    std::chrono::system_clock::time_point createdAt;
    ClipboardPayload content;

    // Helpers
    bool isText() const { return content.isText(); }
    bool isImage() const { return content.isImage(); }

    bool operator==(const ClipboardEntry& other) const = default;
};

} // namespace cliptrail
