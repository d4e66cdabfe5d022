// Single Responsibility: Clipboard content classification and previews

#include "cliptrail/ClipboardPayload.hpp"
#include <format>
#include <utility>

namespace cliptrail {

ClipboardPayload::ClipboardPayload(std::variant<std::string, Bytes> data)
    : m_data(std::move(data)) {
}

std::optional<ClipboardPayload> ClipboardPayload::fromText(std::optional<std::string> text) {
    if (!text || text->empty()) return std::nullopt;
    return ClipboardPayload(std::move(*text));
}

std::optional<ClipboardPayload> ClipboardPayload::fromImageBytes(std::optional<Bytes> bytes) {
    if (!bytes || bytes->empty()) return std::nullopt;
    return ClipboardPayload(std::move(*bytes));
}

EntryType ClipboardPayload::type() const {
    return std::holds_alternative<std::string>(m_data) ? EntryType::Text : EntryType::Image;
}

const std::string& ClipboardPayload::text() const {
    return std::get<std::string>(m_data);
}

const Bytes& ClipboardPayload::imageBytes() const {
    return std::get<Bytes>(m_data);
}

std::string ClipboardPayload::preview(std::size_t maxLines) const {
    if (isImage()) {
        return std::format("Image ({} bytes)", imageBytes().size());
    }

    // Keep the first maxLines lines, empty lines included
    const std::string& value = text();
    if (maxLines == 0) return "";
    size_t pos = 0;
    for (size_t line = 0; line < maxLines; line++) {
        pos = value.find('\n', pos);
        if (pos == std::string::npos) return value;
        pos++;
    }
    return value.substr(0, pos - 1);
}

const char* toString(EntryType type) {
    switch (type) {
        case EntryType::Text: return "text";
        case EntryType::Image: return "image";
    }
    return "unknown";
}

} // namespace cliptrail
