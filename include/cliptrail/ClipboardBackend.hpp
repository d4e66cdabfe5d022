#pragma once
// Single Responsibility: Abstract access to the shared system clipboard

#include "ClipboardPayload.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace cliptrail {

class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    // Opaque counter, increases on every write by any process
    virtual std::int64_t currentMutationCount() const = 0;

    virtual std::optional<std::string> readText() const = 0;
    virtual std::optional<Bytes> readImageBytes() const = 0;

    // false when the payload could not be placed on the clipboard
    virtual bool writeText(const std::string& text) = 0;
    virtual bool writeImageBytes(const Bytes& bytes) = 0;
    virtual void clear() = 0;
};

} // namespace cliptrail
