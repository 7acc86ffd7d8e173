#include "monitor/change_monitor.hpp"
#include "core/utils.hpp"

#include <format>

namespace clipstash {

ChangeMonitor::ChangeMonitor(std::shared_ptr<IClipboardSource> source,
                             std::shared_ptr<const ContentClassifier> classifier,
                             std::shared_ptr<const Redactor> redactor,
                             std::shared_ptr<HistoryStore> store)
    : source_(std::move(source)),
      classifier_(std::move(classifier)),
      redactor_(std::move(redactor)),
      store_(std::move(store)) {
    // Baseline: whatever is on the clipboard now is not a change
    auto initial = source_->current_change_count();
    if (initial.is_ok()) {
        last_count_ = initial.value();
    } else {
        utils::log::warn(std::format("Clipboard not readable at startup ({}); first readable state becomes the baseline",
                                     initial.error_message()));
    }
}

void ChangeMonitor::set_on_change(ChangeCallback callback) {
    on_change_ = std::move(callback);
}

ChangeMonitor::Stats ChangeMonitor::stats() const {
    Stats s;
    s.ticks = ticks_.load();
    s.captures = captures_.load();
    s.bumps = bumps_.load();
    s.skips = skips_.load();
    s.failures = failures_.load();
    return s;
}

std::optional<int64_t> ChangeMonitor::last_change_count() const {
    std::lock_guard<std::mutex> lock(count_mutex_);
    return last_count_;
}

void ChangeMonitor::record(int64_t change_count) {
    std::lock_guard<std::mutex> lock(count_mutex_);
    last_count_ = change_count;
}

ChangeMonitor::TickOutcome ChangeMonitor::tick() {
    ticks_.fetch_add(1);

    auto count = source_->current_change_count();
    if (count.is_error()) {
        failures_.fetch_add(1);
        utils::log::debug(std::format("Change counter unavailable: {}", count.error_message()));
        return TickOutcome::FAILED;
    }

    const int64_t current = count.value();
    {
        std::lock_guard<std::mutex> lock(count_mutex_);
        if (!last_count_) {
            last_count_ = current;
            return TickOutcome::UNCHANGED;
        }
        if (*last_count_ == current) {
            return TickOutcome::UNCHANGED;
        }
    }

    state_.store(State::CAPTURED);
    TickOutcome outcome;
    try {
        outcome = process_change(current);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Capture pipeline error: {}", e.what()));
        failures_.fetch_add(1);
        record(current);
        outcome = TickOutcome::FAILED;
    }
    state_.store(State::IDLE);
    return outcome;
}

ChangeMonitor::TickOutcome ChangeMonitor::process_change(int64_t change_count) {
    auto payload = source_->read_payload();
    if (payload.is_error()) {
        // Counter stays put so the same change is read again next tick
        failures_.fetch_add(1);
        utils::log::warn(std::format("Clipboard read failed, retrying: {}", payload.error_message()));
        return TickOutcome::FAILED;
    }

    auto classified = classifier_->classify(payload.value());
    if (classified.is_error()) {
        failures_.fetch_add(1);
        record(change_count);
        utils::log::error(std::format("Capture skipped ({}): {}",
            error_category_name(classified.error_category()), classified.error_message()));
        return TickOutcome::FAILED;
    }
    if (!classified.value()) {
        skips_.fetch_add(1);
        record(change_count);
        return TickOutcome::SKIPPED;
    }

    const ClassifiedPayload& item = *classified.value();
    if (item.degradation) {
        utils::log::warn(std::format("{}: {}",
            error_category_name(ErrorCategory::CLASSIFICATION_DEGRADED), *item.degradation));
    }

    const EntryCandidate candidate = build_candidate(item);
    auto upserted = store_->upsert(candidate);
    if (upserted.is_error()) {
        failures_.fetch_add(1);
        record(change_count);
        utils::log::error(std::format("Capture not stored: {}", upserted.error_message()));
        if (item.artifact_created) {
            const auto removed = store_->artifacts().remove(item.artifact_path);
            if (removed.is_error()) {
                utils::log::error(std::format("Orphaned artifact left behind: {}",
                                              removed.error_message()));
            }
        }
        return TickOutcome::FAILED;
    }

    record(change_count);
    const UpsertOutcome& outcome = upserted.value();
    if (outcome.bumped) {
        bumps_.fetch_add(1);
    } else {
        captures_.fetch_add(1);
        utils::log::info(std::format("Captured {} entry {}{}",
            content_type_name(candidate.content_type), outcome.id,
            candidate.is_sensitive ? std::format(" (sensitive: {})", candidate.sensitive_kinds) : ""));
    }
    notify(outcome);
    return outcome.bumped ? TickOutcome::BUMPED : TickOutcome::INSERTED;
}

EntryCandidate ChangeMonitor::build_candidate(const ClassifiedPayload& classified) const {
    EntryCandidate candidate;
    candidate.content_type = classified.content_type;
    candidate.raw_payload = classified.raw_payload;
    candidate.display_text = classified.display_text;
    candidate.content_hash = classified.fingerprint.hex;
    candidate.byte_size = static_cast<int64_t>(classified.normalized.size());
    candidate.captured_at = utils::now();

    if (classified.content_type == ContentType::TEXT) {
        const auto redaction = redactor_->redact(classified.normalized);
        candidate.is_sensitive = redaction.is_sensitive;
        candidate.masked_preview = redaction.masked_preview;
        candidate.sensitive_kinds = redaction.summary;
    }
    return candidate;
}

void ChangeMonitor::notify(const UpsertOutcome& outcome) {
    if (!on_change_) return;
    try {
        on_change_(outcome);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Change callback error: {}", e.what()));
    }
}

} // namespace clipstash
