#pragma once
// Single Responsibility: ClipboardBackend on top of GTK4's GdkClipboard
//
// GdkClipboard reads are asynchronous. External changes are read in full
// before the mutation counter moves, so a tick that sees the new count
// always reads the matching content. Our own writes update the snapshot
// and the counter synchronously.

#include "ClipboardBackend.hpp"
#include <gtk/gtk.h>
#include <cstdint>

namespace cliptrail {

class GtkClipboardBackend : public ClipboardBackend {
public:
    explicit GtkClipboardBackend(GdkClipboard* clipboard);
    ~GtkClipboardBackend() override;

    GtkClipboardBackend(const GtkClipboardBackend&) = delete;
    GtkClipboardBackend& operator=(const GtkClipboardBackend&) = delete;

    std::int64_t currentMutationCount() const override { return m_mutationCount; }

    std::optional<std::string> readText() const override { return m_text; }
    std::optional<Bytes> readImageBytes() const override { return m_image; }

    bool writeText(const std::string& text) override;
    bool writeImageBytes(const Bytes& bytes) override;
    void clear() override;

private:
    struct ReadRequest {
        GtkClipboardBackend* self;
        std::uint64_t serial;
    };

    GdkClipboard* m_clipboard = nullptr;
    GCancellable* m_cancellable = nullptr;
    gulong m_changedHandler = 0;

    std::int64_t m_mutationCount = 0;
    std::uint64_t m_readSerial = 0;     // newer reads make older ones stale
    std::optional<std::string> m_text;
    std::optional<Bytes> m_image;

    static void onChanged(GdkClipboard* clipboard, gpointer data);
    static void onTextRead(GObject* source, GAsyncResult* result, gpointer data);
    static void onTextureRead(GObject* source, GAsyncResult* result, gpointer data);

    void commitSnapshot(std::optional<std::string> text, std::optional<Bytes> image);
    void markLocalWrite();
};

} // namespace cliptrail
