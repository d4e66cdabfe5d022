#pragma once
// Forward declarations for loose coupling (SOLID: Dependency Inversion)

namespace cliptrail {

// Data structures
class ClipboardPayload;
struct ClipboardEntry;
struct Config;

// Seams
class ClipboardBackend;

// Components (Single Responsibility each)
class ChangeDetector;
class PollScheduler;
class HistoryStore;
class ClipboardManager;
class IPCHandler;
class GtkClipboardBackend;

} // namespace cliptrail
