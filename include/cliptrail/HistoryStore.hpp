#pragma once
// Single Responsibility: Durable storage of the full history as one JSON document

#include "ClipboardEntry.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cliptrail {

class HistoryStore {
public:
    using PathResolver = std::function<std::filesystem::path()>;

    explicit HistoryStore(PathResolver resolver);

    // Missing file loads as an empty history (true).
    // Unreadable or malformed file: entries cleared, error set, false.
    bool load(std::vector<ClipboardEntry>& entries, std::string& error) const;

    // Replaces the whole file atomically; creates the directory on first use
    bool save(const std::vector<ClipboardEntry>& entries, std::string& error) const;

    std::filesystem::path path() const { return m_resolver(); }

    // Document codec
    static std::string serialize(const std::vector<ClipboardEntry>& entries);
    // Throws std::exception subclasses on malformed documents
    static std::vector<ClipboardEntry> deserialize(const std::string& document);

    // ISO-8601 UTC with microseconds, e.g. 2026-10-19T08:15:30.123456Z
    static std::string formatTimestamp(std::chrono::system_clock::time_point time);
    static std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

private:
    PathResolver m_resolver;
};

} // namespace cliptrail
