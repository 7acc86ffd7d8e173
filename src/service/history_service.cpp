#include "service/history_service.hpp"
#include "core/utils.hpp"

#include <format>

namespace clipstash {

HistoryService::HistoryService(std::shared_ptr<HistoryStore> store, std::shared_ptr<IClipboardSink> sink)
    : store_(std::move(store)),
      sink_(std::move(sink)) {}

Result<std::vector<ClipboardEntry>> HistoryService::search(const std::string& query, size_t limit) const {
    return store_->search(query, limit);
}

Result<std::vector<ClipboardEntry>> HistoryService::recent(size_t limit) const {
    return store_->recent(limit);
}

Result<ClipboardEntry> HistoryService::show(int64_t id) const {
    auto found = store_->get(id);
    if (found.is_error()) {
        return Result<ClipboardEntry>::error_from(found);
    }
    if (!found.value()) {
        return Result<ClipboardEntry>::error(ErrorCategory::NOT_FOUND,
            std::format("No entry with id {}", id));
    }
    return Result<ClipboardEntry>::ok(std::move(*found.value()));
}

Result<bool> HistoryService::remove(int64_t id) {
    return store_->remove(id);
}

Status HistoryService::set_pinned(int64_t id, bool pinned) {
    auto updated = store_->set_pinned(id, pinned);
    if (updated.is_error()) {
        return Status::error_from(updated);
    }
    if (!updated.value()) {
        return Status::error(ErrorCategory::NOT_FOUND, std::format("No entry with id {}", id));
    }
    return ok_status();
}

Result<int64_t> HistoryService::clear_all() {
    return store_->clear_all();
}

Result<HistoryStats> HistoryService::stats() const {
    return store_->stats();
}

Result<RawCapture> HistoryService::payload_for(const ClipboardEntry& entry) const {
    switch (entry.content_type) {
        case ContentType::TEXT:
            return Result<RawCapture>::ok(TextPayload{entry.raw_payload});

        case ContentType::IMAGE: {
            if (entry.integrity_degraded) {
                return Result<RawCapture>::error(ErrorCategory::INTEGRITY_VIOLATION,
                    std::format("Entry {}: image artifact missing ({})", entry.id, entry.raw_payload));
            }
            auto bytes = store_->artifacts().read(entry.raw_payload);
            if (bytes.is_error()) {
                return Result<RawCapture>::error_from(bytes);
            }
            ImagePayload image;
            image.bytes = std::move(bytes.value());
            return Result<RawCapture>::ok(std::move(image));
        }

        case ContentType::FILE_REFERENCE:
            return Result<RawCapture>::ok(FilePayload{utils::split(entry.raw_payload, kPathSeparator)});
    }
    return Result<RawCapture>::error(ErrorCategory::INTERNAL_ERROR, "Unknown content type");
}

Status HistoryService::restore(int64_t id) {
    auto entry = show(id);
    if (entry.is_error()) {
        return Status::error_from(entry);
    }

    auto payload = payload_for(entry.value());
    if (payload.is_error()) {
        utils::log::error(std::format("Restore of entry {} failed: {}", id, payload.error_message()));
        return Status::error_from(payload);
    }

    auto written = sink_->write_payload(payload.value());
    if (written.is_error()) {
        return written;
    }
    utils::log::info(std::format("Restored entry {} ({})", id,
                                 content_type_name(entry.value().content_type)));
    return ok_status();
}

} // namespace clipstash
