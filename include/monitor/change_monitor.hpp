#pragma once

#include "classifier/content_classifier.hpp"
#include "clipboard/clipboard_source.hpp"
#include "security/redactor.hpp"
#include "storage/history_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace clipstash {

/**
 * @brief Polls the clipboard source and feeds changes through the pipeline
 *
 * Pipeline per detected change:
 *   read payload -> classify -> redact (text only) -> fingerprint -> upsert
 *
 * State machine: IDLE between ticks, CAPTURED while one change is being
 * processed. A tick always returns to IDLE.
 *
 * Change detection compares the source's counter with the last one this
 * monitor recorded. The baseline is taken at construction, so content that
 * is already on the clipboard at startup is not captured.
 *
 * Failure handling:
 * - Counter or payload read failure: the counter is not recorded, the same
 *   change is retried next tick
 * - Classification, redaction or storage failure: logged, capture skipped
 * - An artifact written for a capture the store then rejects is removed
 *
 * tick() is not reentrant; PeriodicTask guarantees one tick at a time.
 */
class ChangeMonitor {
public:
    enum class State {
        IDLE,
        CAPTURED
    };

    enum class TickOutcome {
        UNCHANGED,
        INSERTED,
        BUMPED,
        SKIPPED,        // empty, oversized or unsupported payload
        FAILED
    };

    struct Stats {
        uint64_t ticks = 0;
        uint64_t captures = 0;      // new entries
        uint64_t bumps = 0;
        uint64_t skips = 0;
        uint64_t failures = 0;
    };

    /// Runs after an insert or bump, on the ticking thread
    using ChangeCallback = std::function<void(const UpsertOutcome&)>;

    ChangeMonitor(std::shared_ptr<IClipboardSource> source,
                  std::shared_ptr<const ContentClassifier> classifier,
                  std::shared_ptr<const Redactor> redactor,
                  std::shared_ptr<HistoryStore> store);

    /**
     * @brief Check the source once and process a change if there is one
     */
    TickOutcome tick();

    void set_on_change(ChangeCallback callback);

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] State state() const { return state_.load(); }
    [[nodiscard]] std::optional<int64_t> last_change_count() const;

private:
    TickOutcome process_change(int64_t change_count);
    EntryCandidate build_candidate(const ClassifiedPayload& classified) const;
    void record(int64_t change_count);
    void notify(const UpsertOutcome& outcome);

    std::shared_ptr<IClipboardSource> source_;
    std::shared_ptr<const ContentClassifier> classifier_;
    std::shared_ptr<const Redactor> redactor_;
    std::shared_ptr<HistoryStore> store_;

    ChangeCallback on_change_;

    mutable std::mutex count_mutex_;
    std::optional<int64_t> last_count_;
    std::atomic<State> state_{State::IDLE};

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> captures_{0};
    std::atomic<uint64_t> bumps_{0};
    std::atomic<uint64_t> skips_{0};
    std::atomic<uint64_t> failures_{0};
};

[[nodiscard]] inline const char* tick_outcome_name(ChangeMonitor::TickOutcome outcome) {
    switch (outcome) {
        case ChangeMonitor::TickOutcome::UNCHANGED: return "unchanged";
        case ChangeMonitor::TickOutcome::INSERTED:  return "inserted";
        case ChangeMonitor::TickOutcome::BUMPED:    return "bumped";
        case ChangeMonitor::TickOutcome::SKIPPED:   return "skipped";
        case ChangeMonitor::TickOutcome::FAILED:    return "failed";
    }
    return "unknown";
}

} // namespace clipstash
