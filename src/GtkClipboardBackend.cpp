// Single Responsibility: ClipboardBackend on top of GTK4's GdkClipboard

#include "cliptrail/GtkClipboardBackend.hpp"
#include <memory>
#include <utility>

namespace cliptrail {

GtkClipboardBackend::GtkClipboardBackend(GdkClipboard* clipboard)
    : m_clipboard(GDK_CLIPBOARD(g_object_ref(clipboard)))
    , m_cancellable(g_cancellable_new()) {
    m_changedHandler = g_signal_connect(m_clipboard, "changed", G_CALLBACK(onChanged), this);
}

GtkClipboardBackend::~GtkClipboardBackend() {
    // Pending reads complete later with G_IO_ERROR_CANCELLED and never touch us
    g_cancellable_cancel(m_cancellable);
    g_signal_handler_disconnect(m_clipboard, m_changedHandler);
    g_object_unref(m_cancellable);
    g_object_unref(m_clipboard);
}

// ============================================================================
// External changes
// ============================================================================

void GtkClipboardBackend::onChanged(GdkClipboard* clipboard, gpointer data) {
    auto* self = static_cast<GtkClipboardBackend*>(data);

    // Counted synchronously by the write itself
    if (gdk_clipboard_is_local(clipboard)) return;

    auto* request = new ReadRequest{self, ++self->m_readSerial};
    GdkContentFormats* formats = gdk_clipboard_get_formats(clipboard);

    if (gdk_content_formats_contain_gtype(formats, G_TYPE_STRING)) {
        gdk_clipboard_read_text_async(clipboard, self->m_cancellable, onTextRead, request);
    } else if (gdk_content_formats_contain_gtype(formats, GDK_TYPE_TEXTURE)) {
        gdk_clipboard_read_texture_async(clipboard, self->m_cancellable, onTextureRead, request);
    } else {
        // Emptied or unsupported kind: still a change, nothing representable
        delete request;
        self->commitSnapshot(std::nullopt, std::nullopt);
    }
}

void GtkClipboardBackend::onTextRead(GObject* source, GAsyncResult* result, gpointer data) {
    std::unique_ptr<ReadRequest> request(static_cast<ReadRequest*>(data));

    g_autoptr(GError) error = nullptr;
    g_autofree char* text = gdk_clipboard_read_text_finish(GDK_CLIPBOARD(source), result, &error);
    if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED)) return;

    GtkClipboardBackend* self = request->self;
    if (request->serial != self->m_readSerial) return;

    if (!text) {
        g_debug("clipboard: text read failed: %s", error ? error->message : "no data");
        self->commitSnapshot(std::nullopt, std::nullopt);
        return;
    }
    self->commitSnapshot(std::string(text), std::nullopt);
}

void GtkClipboardBackend::onTextureRead(GObject* source, GAsyncResult* result, gpointer data) {
    std::unique_ptr<ReadRequest> request(static_cast<ReadRequest*>(data));

    g_autoptr(GError) error = nullptr;
    g_autoptr(GdkTexture) texture = gdk_clipboard_read_texture_finish(GDK_CLIPBOARD(source), result, &error);
    if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED)) return;

    GtkClipboardBackend* self = request->self;
    if (request->serial != self->m_readSerial) return;

    if (!texture) {
        g_debug("clipboard: image read failed: %s", error ? error->message : "no data");
        self->commitSnapshot(std::nullopt, std::nullopt);
        return;
    }

    g_autoptr(GBytes) tiff = gdk_texture_save_to_tiff_bytes(texture);
    gsize size = 0;
    const auto* raw = static_cast<const std::uint8_t*>(g_bytes_get_data(tiff, &size));
    self->commitSnapshot(std::nullopt, Bytes(raw, raw + size));
}

void GtkClipboardBackend::commitSnapshot(std::optional<std::string> text, std::optional<Bytes> image) {
    m_text = std::move(text);
    m_image = std::move(image);
    m_mutationCount++;
}

// ============================================================================
// Local writes
// ============================================================================

void GtkClipboardBackend::markLocalWrite() {
    // Any read still in flight describes content we just replaced
    m_readSerial++;
    m_mutationCount++;
}

bool GtkClipboardBackend::writeText(const std::string& text) {
    markLocalWrite();
    m_text = text;
    m_image.reset();
    gdk_clipboard_set_text(m_clipboard, text.c_str());
    return true;
}

bool GtkClipboardBackend::writeImageBytes(const Bytes& bytes) {
    g_autoptr(GBytes) data = g_bytes_new(bytes.data(), bytes.size());
    g_autoptr(GError) error = nullptr;
    g_autoptr(GdkTexture) texture = gdk_texture_new_from_bytes(data, &error);
    if (!texture) {
        g_warning("clipboard: cannot decode image for restore: %s", error->message);
        return false;
    }

    markLocalWrite();
    m_text.reset();
    m_image = bytes;
    gdk_clipboard_set_texture(m_clipboard, texture);
    return true;
}

void GtkClipboardBackend::clear() {
    markLocalWrite();
    m_text.reset();
    m_image.reset();
    gdk_clipboard_set_content(m_clipboard, nullptr);
}

} // namespace cliptrail
