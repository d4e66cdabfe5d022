#pragma once
// Single Responsibility: Captured clipboard content (text or image bytes)

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cliptrail {

using Bytes = std::vector<std::uint8_t>;

enum class EntryType {
    Text,
    Image
};

// Closed variant over the two kinds the history records.
// Never holds an empty string or zero-length bytes.
class ClipboardPayload {
public:
    // Classification: nullopt means "not representable" (absent or empty)
    static std::optional<ClipboardPayload> fromText(std::optional<std::string> text);
    static std::optional<ClipboardPayload> fromImageBytes(std::optional<Bytes> bytes);

    EntryType type() const;
    bool isText() const { return type() == EntryType::Text; }
    bool isImage() const { return type() == EntryType::Image; }

    // Only valid for the matching kind (std::bad_variant_access otherwise)
    const std::string& text() const;
    const Bytes& imageBytes() const;

    // First maxLines lines for text, "Image (N bytes)" for images
    std::string preview(std::size_t maxLines = 5) const;

    bool operator==(const ClipboardPayload& other) const = default;

private:
    explicit ClipboardPayload(std::variant<std::string, Bytes> data);

    std::variant<std::string, Bytes> m_data;
};

const char* toString(EntryType type);

} // namespace cliptrail
