#pragma once

#include "clipboard/clipboard_source.hpp"
#include "storage/history_store.hpp"

#include <memory>

namespace clipstash {

/**
 * @brief Query surface over the history: list, search, delete, restore
 *
 * All calls are synchronous. Restore writes the entry's raw payload back to
 * the clipboard verbatim (artifact bytes for images, the path list for file
 * references). The monitor later sees that write as a bump of the same
 * fingerprint, never as a new entry.
 */
class HistoryService {
public:
    HistoryService(std::shared_ptr<HistoryStore> store, std::shared_ptr<IClipboardSink> sink);

    [[nodiscard]] Result<std::vector<ClipboardEntry>> search(const std::string& query, size_t limit) const;
    [[nodiscard]] Result<std::vector<ClipboardEntry>> recent(size_t limit) const;

    /// NOT_FOUND when the id does not exist
    [[nodiscard]] Result<ClipboardEntry> show(int64_t id) const;

    /// Nonexistent id is a no-op; returns whether a row was removed
    [[nodiscard]] Result<bool> remove(int64_t id);

    /// Pinned entries survive retention; NOT_FOUND when the id does not exist
    [[nodiscard]] Status set_pinned(int64_t id, bool pinned);

    [[nodiscard]] Result<int64_t> clear_all();

    /**
     * @brief Put an entry back on the clipboard
     * @return NOT_FOUND for unknown id, INTEGRITY_VIOLATION when an image's
     *         artifact is gone, CAPTURE_ERROR when the sink fails
     */
    [[nodiscard]] Status restore(int64_t id);

    [[nodiscard]] Result<HistoryStats> stats() const;

private:
    Result<RawCapture> payload_for(const ClipboardEntry& entry) const;

    std::shared_ptr<HistoryStore> store_;
    std::shared_ptr<IClipboardSink> sink_;
};

} // namespace clipstash
