// Single Responsibility: Durable storage of the full history as one JSON document
//
// Format:
// [
//   { "id": "<uuid>", "date": "<iso-8601>",
//     "content": { "type": "text",  "value": "..." } },
//   { "id": "<uuid>", "date": "<iso-8601>",
//     "content": { "type": "image", "bytes": "<base64>" } }
// ]

#include "cliptrail/HistoryStore.hpp"
#include <glib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace cliptrail {

HistoryStore::HistoryStore(PathResolver resolver)
    : m_resolver(std::move(resolver)) {
}

// ============================================================================
// Timestamps
// ============================================================================

std::string HistoryStore::formatTimestamp(std::chrono::system_clock::time_point time) {
    auto usec = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
    gint64 seconds = usec / G_USEC_PER_SEC;
    gint64 remainder = usec % G_USEC_PER_SEC;
    if (remainder < 0) {
        remainder += G_USEC_PER_SEC;
        seconds--;
    }

    g_autoptr(GDateTime) base = g_date_time_new_from_unix_utc(seconds);
    if (!base) throw std::out_of_range("timestamp outside the representable range");
    g_autoptr(GDateTime) precise = g_date_time_add(base, remainder);
    g_autofree gchar* text = g_date_time_format(precise, "%Y-%m-%dT%H:%M:%S.%fZ");
    return text ? std::string(text) : std::string();
}

std::optional<std::chrono::system_clock::time_point> HistoryStore::parseTimestamp(const std::string& text) {
    // GLib reads fractional seconds as a double; take the digits ourselves
    // so microseconds round-trip exactly
    std::string whole = text;
    gint64 fraction = 0;
    size_t timePos = text.find('T');
    size_t dot = timePos == std::string::npos ? std::string::npos : text.find('.', timePos);
    if (dot != std::string::npos) {
        size_t end = dot + 1;
        while (end < text.size() && g_ascii_isdigit(text[end])) end++;
        if (end == dot + 1) return std::nullopt;

        std::string digits = text.substr(dot + 1, std::min<size_t>(end - dot - 1, 6));
        digits.resize(6, '0');
        fraction = g_ascii_strtoll(digits.c_str(), nullptr, 10);
        whole = text.substr(0, dot) + text.substr(end);
    }

    // Strings without a zone designator are read as UTC
    g_autoptr(GTimeZone) utc = g_time_zone_new_utc();
    g_autoptr(GDateTime) parsed = g_date_time_new_from_iso8601(whole.c_str(), utc);
    if (!parsed) return std::nullopt;

    gint64 usec = g_date_time_to_unix(parsed) * G_USEC_PER_SEC + fraction;
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(usec)));
}

// ============================================================================
// Document codec
// ============================================================================

static json encodeContent(const ClipboardPayload& content) {
    if (content.isText()) {
        return {{"type", "text"}, {"value", content.text()}};
    }

    const Bytes& bytes = content.imageBytes();
    g_autofree gchar* encoded = g_base64_encode(bytes.data(), bytes.size());
    return {{"type", "image"}, {"bytes", std::string(encoded)}};
}

// nullopt for unknown kinds and empty payloads (skipped by the caller)
static std::optional<ClipboardPayload> decodeContent(const json& content) {
    const std::string type = content.at("type").get<std::string>();

    if (type == "text") {
        return ClipboardPayload::fromText(content.at("value").get<std::string>());
    }
    if (type == "image") {
        const std::string encoded = content.at("bytes").get<std::string>();
        gsize length = 0;
        g_autofree guchar* raw = g_base64_decode(encoded.c_str(), &length);
        if (!raw) return std::nullopt;
        return ClipboardPayload::fromImageBytes(Bytes(raw, raw + length));
    }

    g_warning("history: skipping entry with unknown content type '%s'", type.c_str());
    return std::nullopt;
}

std::string HistoryStore::serialize(const std::vector<ClipboardEntry>& entries) {
    json document = json::array();
    for (const auto& entry : entries) {
        document.push_back(json{
            {"id", entry.uuid},
            {"date", formatTimestamp(entry.createdAt)},
            {"content", encodeContent(entry.content)},
        });
    }
    // Clipboard text is not guaranteed to be valid UTF-8
    return document.dump(2, ' ', false, json::error_handler_t::replace);
}

std::vector<ClipboardEntry> HistoryStore::deserialize(const std::string& document) {
    std::vector<ClipboardEntry> entries;

    // An empty file is an empty history
    if (document.find_first_not_of(" \t\r\n") == std::string::npos) return entries;

    json root = json::parse(document);
    if (!root.is_array()) {
        throw std::runtime_error("history document is not an array");
    }

    entries.reserve(root.size());
    for (const auto& item : root) {
        std::string uuid = item.at("id").get<std::string>();
        std::string date = item.at("date").get<std::string>();

        auto createdAt = parseTimestamp(date);
        if (!createdAt) {
            throw std::runtime_error("invalid date '" + date + "' in entry " + uuid);
        }

        auto content = decodeContent(item.at("content"));
        if (!content) {
            g_debug("history: entry %s has no usable content, skipped", uuid.c_str());
            continue;
        }

        entries.push_back(ClipboardEntry{std::move(uuid), *createdAt, std::move(*content)});
    }

    return entries;
}

// ============================================================================
// File I/O
// ============================================================================

bool HistoryStore::load(std::vector<ClipboardEntry>& entries, std::string& error) const {
    entries.clear();
    const fs::path file = path();

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        if (ec) {
            error = "cannot access " + file.string() + ": " + ec.message();
            g_warning("history: %s", error.c_str());
            return false;
        }
        g_debug("history: %s does not exist, starting empty", file.c_str());
        return true;
    }

    g_autofree gchar* contents = nullptr;
    gsize length = 0;
    g_autoptr(GError) gerror = nullptr;
    if (!g_file_get_contents(file.c_str(), &contents, &length, &gerror)) {
        error = gerror->message;
        g_warning("history: %s", error.c_str());
        return false;
    }

    try {
        entries = deserialize(std::string(contents, length));
    } catch (const std::exception& e) {
        entries.clear();
        error = "malformed history file " + file.string() + ": " + e.what();
        g_warning("history: %s", error.c_str());
        return false;
    }

    g_message("history: loaded %zu entries from %s", entries.size(), file.c_str());
    return true;
}

bool HistoryStore::save(const std::vector<ClipboardEntry>& entries, std::string& error) const {
    const fs::path file = path();

    if (file.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            error = "cannot create " + file.parent_path().string() + ": " + ec.message();
            g_warning("history: %s", error.c_str());
            return false;
        }
    }

    std::string document;
    try {
        document = serialize(entries);
    } catch (const std::exception& e) {
        error = std::string("cannot serialize history: ") + e.what();
        g_warning("history: %s", error.c_str());
        return false;
    }

    // Temp file + rename: the file is never left half-written
    g_autoptr(GError) gerror = nullptr;
    if (!g_file_set_contents(file.c_str(), document.data(),
                             static_cast<gssize>(document.size()), &gerror)) {
        error = gerror->message;
        g_warning("history: %s", error.c_str());
        return false;
    }

    g_debug("history: saved %zu entries to %s", entries.size(), file.c_str());
    return true;
}

} // namespace cliptrail
