#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "storage/artifact_store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace clipstash {

/**
 * @brief Outcome of inserting or bumping one candidate
 */
struct UpsertOutcome {
    int64_t id = 0;
    bool bumped = false;                    // existing entry moved to the front
    std::vector<int64_t> evicted_ids;       // removed by retention
};

struct HistoryStats {
    int64_t total_entries = 0;
    int64_t text_entries = 0;
    int64_t image_entries = 0;
    int64_t file_entries = 0;
    int64_t sensitive_entries = 0;
    int64_t pinned_entries = 0;
    uint64_t artifact_bytes = 0;
    size_t max_entries = 0;
};

/**
 * @brief Persistent clipboard history (SQLite + FTS5)
 *
 * Owns deduplication, recency ordering, retention and full-text search.
 * Image rows reference a file in the ArtifactStore; deleting or evicting the
 * row deletes the file in the same call.
 *
 * Recency is a store-wide monotonic touch_seq assigned on every insert and
 * bump, so "most recent first" is total even when timestamps tie.
 *
 * Pinned entries are never evicted. When pinned rows alone reach
 * max_entries, the history holds them plus the newest insert.
 *
 * Thread-safety: mutations take an exclusive lock and commit one
 * BEGIN IMMEDIATE transaction; reads take a shared lock.
 */
class HistoryStore {
public:
    struct Config {
        std::string db_path;
        size_t max_entries = 500;
    };

    /**
     * @brief Open (creating if needed) the database and schema
     * @return STORAGE_IO_ERROR if the file cannot be opened or migrated
     */
    [[nodiscard]] static Result<std::unique_ptr<HistoryStore>> open(
        const Config& config, std::shared_ptr<ArtifactStore> artifacts);

    ~HistoryStore();

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    /**
     * @brief Insert a new entry or bump the existing one with the same hash
     *
     * A bump updates last_seen_at and recency only; created_at, payload and
     * id stay as they were. An insert is followed by retention eviction.
     */
    [[nodiscard]] Result<UpsertOutcome> upsert(const EntryCandidate& candidate);

    /**
     * @brief Full-text search over display text and text content
     *
     * Tokens are matched as prefixes. Ordered by relevance, then recency.
     * Empty or whitespace-only query returns recent(limit).
     */
    [[nodiscard]] Result<std::vector<ClipboardEntry>> search(const std::string& query, size_t limit) const;

    /// Most-recent-first
    [[nodiscard]] Result<std::vector<ClipboardEntry>> recent(size_t limit) const;

    /// Full entry including raw payload of sensitive text
    [[nodiscard]] Result<std::optional<ClipboardEntry>> get(int64_t id) const;

    [[nodiscard]] Result<std::optional<ClipboardEntry>> find_by_hash(const std::string& content_hash) const;

    /// Delete row and artifact; returns false if the id did not exist
    [[nodiscard]] Result<bool> remove(int64_t id);

    /// Pin or unpin an entry; returns false if the id did not exist
    [[nodiscard]] Result<bool> set_pinned(int64_t id, bool pinned);

    /// Delete every entry, pinned ones included, and its artifact; returns number of rows removed
    [[nodiscard]] Result<int64_t> clear_all();

    [[nodiscard]] Result<int64_t> count() const;

    [[nodiscard]] Result<HistoryStats> stats() const;

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const ArtifactStore& artifacts() const { return *artifacts_; }

private:
    // Only open() can name the key, so only open() constructs
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    HistoryStore(Passkey, const Config& config, std::shared_ptr<ArtifactStore> artifacts, sqlite3* db);

private:
    struct Evicted {
        int64_t id = 0;
        std::string artifact_path;      // empty for non-image rows
    };

    Status init_schema();

    // Callers hold the exclusive lock inside an open transaction
    Result<std::vector<Evicted>> evict_over_capacity(int64_t keep_id);

    Result<std::vector<ClipboardEntry>> query_entries(const char* sql,
                                                     const std::string& match,
                                                     size_t limit) const;
    void delete_artifacts(const std::vector<Evicted>& rows) const;
    void mark_integrity(ClipboardEntry& entry) const;

    Config config_;
    std::shared_ptr<ArtifactStore> artifacts_;
    sqlite3* db_ = nullptr;
    mutable std::shared_mutex mutex_;
};

/// Quote each whitespace-separated token as an FTS5 prefix term; empty if no tokens
[[nodiscard]] std::string build_fts_query(const std::string& query);

} // namespace clipstash
