#include "storage/history_store.hpp"
#include "core/utils.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <format>
#include <mutex>
#include <sstream>

namespace clipstash {

namespace {

constexpr const char* kEntryColumns =
    "e.id, e.content_type, e.raw_payload, e.display_text, e.is_sensitive, "
    "e.masked_preview, e.sensitive_kinds, e.content_hash, e.byte_size, "
    "e.created_at, e.last_seen_at, e.pinned";

constexpr const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS clipboard_entries (
        id              INTEGER PRIMARY KEY AUTOINCREMENT,
        content_type    TEXT    NOT NULL CHECK (content_type IN ('text', 'image', 'file')),
        raw_payload     TEXT    NOT NULL,
        display_text    TEXT    NOT NULL,
        is_sensitive    INTEGER NOT NULL DEFAULT 0,
        masked_preview  TEXT    NOT NULL DEFAULT '',
        sensitive_kinds TEXT    NOT NULL DEFAULT '',
        content_hash    TEXT    NOT NULL,
        byte_size       INTEGER NOT NULL DEFAULT 0,
        created_at      INTEGER NOT NULL,
        last_seen_at    INTEGER NOT NULL,
        touch_seq       INTEGER NOT NULL,
        pinned          INTEGER NOT NULL DEFAULT 0
    );

    CREATE UNIQUE INDEX IF NOT EXISTS idx_entries_hash ON clipboard_entries(content_hash);
    CREATE INDEX IF NOT EXISTS idx_entries_touch ON clipboard_entries(touch_seq DESC);

    CREATE VIRTUAL TABLE IF NOT EXISTS clipboard_fts USING fts5(
        display_text,
        text_content,
        tokenize = 'unicode61'
    );

    -- Image rows index the display label only; the payload is a file path.
    -- File rows hold NUL-separated paths, and the tokenizer splits on NUL.
    CREATE TRIGGER IF NOT EXISTS clipboard_entries_ai AFTER INSERT ON clipboard_entries
    BEGIN
        INSERT INTO clipboard_fts(rowid, display_text, text_content)
        VALUES (NEW.id, NEW.display_text,
                CASE WHEN NEW.content_type IN ('text', 'file') THEN NEW.raw_payload ELSE '' END);
    END;

    CREATE TRIGGER IF NOT EXISTS clipboard_entries_ad AFTER DELETE ON clipboard_entries
    BEGIN
        DELETE FROM clipboard_fts WHERE rowid = OLD.id;
    END;
)";

/**
 * @brief RAII prepared statement
 *
 * Bind failures are sticky: the first non-OK code is kept and reported by ok().
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] bool ok() const { return rc_ == SQLITE_OK; }

    void bind(int index, int64_t value) {
        keep(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind(int index, const std::string& value) {
        keep(sqlite3_bind_text(stmt_, index, value.data(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(const char* name, int64_t value) {
        const int index = sqlite3_bind_parameter_index(stmt_, name);
        if (index > 0) bind(index, value);
    }

    void bind(const char* name, const std::string& value) {
        const int index = sqlite3_bind_parameter_index(stmt_, name);
        if (index > 0) bind(index, value);
    }

    /// SQLITE_ROW, SQLITE_DONE or an error code
    int step() { return sqlite3_step(stmt_); }

    [[nodiscard]] int64_t column_int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    [[nodiscard]] std::string column_text(int col) const {
        const auto* text = sqlite3_column_text(stmt_, col);
        if (!text) return {};
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

private:
    void keep(int rc) {
        if (rc_ == SQLITE_OK) rc_ = rc;
    }

    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

/**
 * @brief RAII write transaction; rolls back unless committed
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}

    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] bool begin() {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
        return active_;
    }

    [[nodiscard]] bool commit() {
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return false;
        }
        active_ = false;
        return true;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

template<typename T>
Result<T> db_error(sqlite3* db, std::string_view what) {
    return Result<T>::error(ErrorCategory::STORAGE_IO_ERROR,
        std::format("{}: {}", what, sqlite3_errmsg(db)));
}

ClipboardEntry read_entry(const Statement& stmt) {
    ClipboardEntry entry;
    entry.id = stmt.column_int64(0);
    entry.content_type = parse_content_type(stmt.column_text(1)).value_or(ContentType::TEXT);
    entry.raw_payload = stmt.column_text(2);
    entry.display_text = stmt.column_text(3);
    entry.is_sensitive = stmt.column_int64(4) != 0;
    entry.masked_preview = stmt.column_text(5);
    entry.sensitive_kinds = stmt.column_text(6);
    entry.content_hash = stmt.column_text(7);
    entry.byte_size = stmt.column_int64(8);
    entry.created_at = utils::from_micros(stmt.column_int64(9));
    entry.last_seen_at = utils::from_micros(stmt.column_int64(10));
    entry.pinned = stmt.column_int64(11) != 0;
    return entry;
}

// Listings never carry the secret: only the masked preview is exposed
void strip_sensitive(ClipboardEntry& entry) {
    if (!entry.is_sensitive) return;
    entry.raw_payload.clear();
    entry.display_text = entry.masked_preview;
}

int64_t next_touch_seq(sqlite3* db) {
    Statement stmt(db, "SELECT COALESCE(MAX(touch_seq), 0) + 1 FROM clipboard_entries");
    if (stmt.ok() && stmt.step() == SQLITE_ROW) {
        return stmt.column_int64(0);
    }
    return 1;
}

} // anonymous namespace

std::string build_fts_query(const std::string& query) {
    std::istringstream iss(query);
    std::string token;
    std::string out;
    while (iss >> token) {
        std::string quoted = "\"";
        for (const char c : token) {
            if (c == '"') quoted += '"';   // FTS5 escapes a quote by doubling it
            quoted += c;
        }
        quoted += "\"*";
        if (!out.empty()) out += ' ';
        out += quoted;
    }
    return out;
}

// ============================================================================
// Lifecycle
// ============================================================================

HistoryStore::HistoryStore(Passkey, const Config& config, std::shared_ptr<ArtifactStore> artifacts,
                           sqlite3* db)
    : config_(config),
      artifacts_(std::move(artifacts)),
      db_(db) {}

HistoryStore::~HistoryStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<std::unique_ptr<HistoryStore>> HistoryStore::open(const Config& config,
                                                        std::shared_ptr<ArtifactStore> artifacts) {
    using R = Result<std::unique_ptr<HistoryStore>>;

    if (!artifacts) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "History store needs an artifact store");
    }
    if (config.max_entries == 0) {
        return R::error(ErrorCategory::CONFIG_ERROR, "max_entries must be at least 1");
    }

    const auto dirs = artifacts->ensure_directory();
    if (dirs.is_error()) {
        return R::error_from(dirs);
    }

    const std::filesystem::path db_path(config.db_path);
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            return R::error(ErrorCategory::STORAGE_IO_ERROR,
                std::format("Cannot create database directory {}: {}",
                            db_path.parent_path().string(), ec.message()));
        }
    }

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(config.db_path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return R::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Cannot open database {}: {}", config.db_path, msg));
    }
    sqlite3_busy_timeout(db, 5000);

    auto store = std::make_unique<HistoryStore>(Passkey{}, config, std::move(artifacts), db);
    const auto schema = store->init_schema();
    if (schema.is_error()) {
        return R::error_from(schema);
    }

    utils::log::info(std::format("History store opened: {} (max {} entries)",
                                 config.db_path, config.max_entries));
    return R::ok(std::move(store));
}

Status HistoryStore::init_schema() {
    char* err = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, &err) != SQLITE_OK) {
        // In-memory and some network filesystems refuse WAL; rollback journal still works
        utils::log::warn(std::format("WAL mode unavailable: {}", err ? err : "unknown"));
        sqlite3_free(err);
        err = nullptr;
    }

    if (sqlite3_exec(db_, kSchemaSql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        return Status::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Schema creation failed: {}", msg));
    }

    // Databases created before pinning lack the column
    Statement columns(db_, "SELECT 1 FROM pragma_table_info('clipboard_entries') WHERE name = 'pinned'");
    if (!columns.ok()) {
        return db_error<Done>(db_, "Schema inspection failed");
    }
    const int rc = columns.step();
    if (rc == SQLITE_DONE) {
        if (sqlite3_exec(db_, "ALTER TABLE clipboard_entries ADD COLUMN pinned INTEGER NOT NULL DEFAULT 0",
                         nullptr, nullptr, nullptr) != SQLITE_OK) {
            return db_error<Done>(db_, "Schema migration failed");
        }
        utils::log::info("Added pinned column to clipboard_entries");
    } else if (rc != SQLITE_ROW) {
        return db_error<Done>(db_, "Schema inspection failed");
    }
    return ok_status();
}

// ============================================================================
// Mutations
// ============================================================================

Result<UpsertOutcome> HistoryStore::upsert(const EntryCandidate& candidate) {
    using R = Result<UpsertOutcome>;

    if (candidate.content_hash.empty()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "Candidate has no content hash");
    }

    const auto seen_at = candidate.captured_at.time_since_epoch().count() == 0
        ? utils::now() : candidate.captured_at;
    const int64_t seen_us = utils::to_micros(seen_at);

    std::unique_lock lock(mutex_);
    Transaction txn(db_);
    if (!txn.begin()) {
        return db_error<UpsertOutcome>(db_, "Cannot begin transaction");
    }

    UpsertOutcome outcome;
    const int64_t seq = next_touch_seq(db_);

    Statement find(db_, "SELECT id FROM clipboard_entries WHERE content_hash = ?1");
    find.bind(1, candidate.content_hash);
    if (!find.ok()) {
        return db_error<UpsertOutcome>(db_, "Hash lookup failed");
    }
    const int found = find.step();

    if (found == SQLITE_ROW) {
        outcome.id = find.column_int64(0);
        outcome.bumped = true;

        Statement bump(db_,
            "UPDATE clipboard_entries SET last_seen_at = ?1, touch_seq = ?2 WHERE id = ?3");
        bump.bind(1, seen_us);
        bump.bind(2, seq);
        bump.bind(3, outcome.id);
        if (!bump.ok() || bump.step() != SQLITE_DONE) {
            return db_error<UpsertOutcome>(db_, "Bump failed");
        }
        if (!txn.commit()) {
            return db_error<UpsertOutcome>(db_, "Commit failed");
        }
        utils::log::debug(std::format("Bumped entry {}", outcome.id));
        return R::ok(std::move(outcome));
    }
    if (found != SQLITE_DONE) {
        return db_error<UpsertOutcome>(db_, "Hash lookup failed");
    }

    Statement insert(db_, R"(
        INSERT INTO clipboard_entries
            (content_type, raw_payload, display_text, is_sensitive, masked_preview,
             sensitive_kinds, content_hash, byte_size, created_at, last_seen_at, touch_seq)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?9, ?10)
    )");
    insert.bind(1, std::string(content_type_name(candidate.content_type)));
    insert.bind(2, candidate.raw_payload);
    insert.bind(3, candidate.display_text);
    insert.bind(4, int64_t{candidate.is_sensitive ? 1 : 0});
    insert.bind(5, candidate.masked_preview);
    insert.bind(6, candidate.sensitive_kinds);
    insert.bind(7, candidate.content_hash);
    insert.bind(8, candidate.byte_size);
    insert.bind(9, seen_us);
    insert.bind(10, seq);
    if (!insert.ok() || insert.step() != SQLITE_DONE) {
        return db_error<UpsertOutcome>(db_, "Insert failed");
    }
    outcome.id = sqlite3_last_insert_rowid(db_);

    auto evicted = evict_over_capacity(outcome.id);
    if (evicted.is_error()) {
        return R::error_from(evicted);
    }
    if (!txn.commit()) {
        return db_error<UpsertOutcome>(db_, "Commit failed");
    }

    // Rows are gone; their artifacts follow
    delete_artifacts(evicted.value());
    for (const auto& row : evicted.value()) {
        outcome.evicted_ids.push_back(row.id);
    }

    utils::log::debug(std::format("Inserted entry {} ({}, {} bytes{})",
        outcome.id, content_type_name(candidate.content_type), candidate.byte_size,
        candidate.is_sensitive ? ", sensitive" : ""));
    if (!outcome.evicted_ids.empty()) {
        utils::log::info(std::format("Retention evicted {} entries", outcome.evicted_ids.size()));
    }
    return R::ok(std::move(outcome));
}

Result<std::vector<HistoryStore::Evicted>> HistoryStore::evict_over_capacity(int64_t keep_id) {
    using R = Result<std::vector<Evicted>>;

    Statement total(db_, "SELECT COUNT(*) FROM clipboard_entries");
    if (!total.ok() || total.step() != SQLITE_ROW) {
        return db_error<std::vector<Evicted>>(db_, "Eviction count failed");
    }
    const int64_t excess = total.column_int64(0) - static_cast<int64_t>(config_.max_entries);
    if (excess <= 0) {
        return R::ok({});
    }

    // Pinned rows and the row just inserted are never candidates
    Statement select(db_,
        "SELECT id, content_type, raw_payload FROM clipboard_entries "
        "WHERE pinned = 0 AND id != ?2 ORDER BY touch_seq ASC LIMIT ?1");
    select.bind(1, excess);
    select.bind(2, keep_id);
    if (!select.ok()) {
        return db_error<std::vector<Evicted>>(db_, "Eviction query failed");
    }

    std::vector<Evicted> rows;
    int rc;
    while ((rc = select.step()) == SQLITE_ROW) {
        Evicted row;
        row.id = select.column_int64(0);
        if (select.column_text(1) == content_type_name(ContentType::IMAGE)) {
            row.artifact_path = select.column_text(2);
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return db_error<std::vector<Evicted>>(db_, "Eviction query failed");
    }

    for (const auto& row : rows) {
        Statement del(db_, "DELETE FROM clipboard_entries WHERE id = ?1");
        del.bind(1, row.id);
        if (!del.ok() || del.step() != SQLITE_DONE) {
            return db_error<std::vector<Evicted>>(db_, "Eviction delete failed");
        }
    }
    return R::ok(std::move(rows));
}

Result<bool> HistoryStore::remove(int64_t id) {
    std::unique_lock lock(mutex_);
    Transaction txn(db_);
    if (!txn.begin()) {
        return db_error<bool>(db_, "Cannot begin transaction");
    }

    Statement select(db_, "SELECT content_type, raw_payload FROM clipboard_entries WHERE id = ?1");
    select.bind(1, id);
    if (!select.ok()) {
        return db_error<bool>(db_, "Lookup failed");
    }
    const int rc = select.step();
    if (rc == SQLITE_DONE) {
        return Result<bool>::ok(false);
    }
    if (rc != SQLITE_ROW) {
        return db_error<bool>(db_, "Lookup failed");
    }

    Evicted row;
    row.id = id;
    if (select.column_text(0) == content_type_name(ContentType::IMAGE)) {
        row.artifact_path = select.column_text(1);
    }

    Statement del(db_, "DELETE FROM clipboard_entries WHERE id = ?1");
    del.bind(1, id);
    if (!del.ok() || del.step() != SQLITE_DONE) {
        return db_error<bool>(db_, "Delete failed");
    }
    if (!txn.commit()) {
        return db_error<bool>(db_, "Commit failed");
    }

    delete_artifacts({row});
    utils::log::debug(std::format("Deleted entry {}", id));
    return Result<bool>::ok(true);
}

Result<bool> HistoryStore::set_pinned(int64_t id, bool pinned) {
    std::unique_lock lock(mutex_);
    Statement update(db_, "UPDATE clipboard_entries SET pinned = ?1 WHERE id = ?2");
    update.bind(1, int64_t{pinned ? 1 : 0});
    update.bind(2, id);
    if (!update.ok() || update.step() != SQLITE_DONE) {
        return db_error<bool>(db_, "Pin update failed");
    }
    const bool found = sqlite3_changes(db_) > 0;
    if (found) {
        utils::log::debug(std::format("Entry {} {}", id, pinned ? "pinned" : "unpinned"));
    }
    return Result<bool>::ok(found);
}

Result<int64_t> HistoryStore::clear_all() {
    std::unique_lock lock(mutex_);
    Transaction txn(db_);
    if (!txn.begin()) {
        return db_error<int64_t>(db_, "Cannot begin transaction");
    }

    Statement select(db_, "SELECT id, raw_payload FROM clipboard_entries WHERE content_type = 'image'");
    if (!select.ok()) {
        return db_error<int64_t>(db_, "Artifact listing failed");
    }
    std::vector<Evicted> images;
    int rc;
    while ((rc = select.step()) == SQLITE_ROW) {
        images.push_back({select.column_int64(0), select.column_text(1)});
    }
    if (rc != SQLITE_DONE) {
        return db_error<int64_t>(db_, "Artifact listing failed");
    }

    Statement del(db_, "DELETE FROM clipboard_entries");
    if (!del.ok() || del.step() != SQLITE_DONE) {
        return db_error<int64_t>(db_, "Clear failed");
    }
    const int64_t removed = sqlite3_changes(db_);
    if (!txn.commit()) {
        return db_error<int64_t>(db_, "Commit failed");
    }

    delete_artifacts(images);
    utils::log::info(std::format("Cleared history ({} entries)", removed));
    return Result<int64_t>::ok(removed);
}

void HistoryStore::delete_artifacts(const std::vector<Evicted>& rows) const {
    for (const auto& row : rows) {
        if (row.artifact_path.empty()) continue;
        const auto removed = artifacts_->remove(row.artifact_path);
        if (removed.is_error()) {
            utils::log::error(std::format("Artifact for entry {} not deleted: {}",
                                          row.id, removed.error_message()));
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

Result<std::vector<ClipboardEntry>> HistoryStore::query_entries(const char* sql,
                                                                const std::string& match,
                                                                size_t limit) const {
    using R = Result<std::vector<ClipboardEntry>>;

    Statement stmt(db_, sql);
    if (!match.empty()) stmt.bind(":match", match);
    stmt.bind(":limit", static_cast<int64_t>(limit));
    if (!stmt.ok()) {
        return db_error<std::vector<ClipboardEntry>>(db_, "Query failed");
    }

    std::vector<ClipboardEntry> entries;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        auto entry = read_entry(stmt);
        mark_integrity(entry);
        strip_sensitive(entry);
        entries.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        return db_error<std::vector<ClipboardEntry>>(db_, "Query failed");
    }
    return R::ok(std::move(entries));
}

Result<std::vector<ClipboardEntry>> HistoryStore::search(const std::string& query, size_t limit) const {
    const std::string match = build_fts_query(query);
    if (match.empty()) {
        return recent(limit);
    }

    static const std::string sql = std::format(R"(
        SELECT {} FROM clipboard_fts
        JOIN clipboard_entries e ON e.id = clipboard_fts.rowid
        WHERE clipboard_fts MATCH :match
        ORDER BY bm25(clipboard_fts), e.touch_seq DESC
        LIMIT :limit
    )", kEntryColumns);

    std::shared_lock lock(mutex_);
    return query_entries(sql.c_str(), match, limit);
}

Result<std::vector<ClipboardEntry>> HistoryStore::recent(size_t limit) const {
    static const std::string sql = std::format(
        "SELECT {} FROM clipboard_entries e ORDER BY e.touch_seq DESC LIMIT :limit",
        kEntryColumns);

    std::shared_lock lock(mutex_);
    return query_entries(sql.c_str(), {}, limit);
}

Result<std::optional<ClipboardEntry>> HistoryStore::get(int64_t id) const {
    using R = Result<std::optional<ClipboardEntry>>;
    static const std::string sql = std::format(
        "SELECT {} FROM clipboard_entries e WHERE e.id = ?1", kEntryColumns);

    std::shared_lock lock(mutex_);
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, id);
    if (!stmt.ok()) {
        return db_error<std::optional<ClipboardEntry>>(db_, "Get failed");
    }
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) return R::ok(std::nullopt);
    if (rc != SQLITE_ROW) {
        return db_error<std::optional<ClipboardEntry>>(db_, "Get failed");
    }
    auto entry = read_entry(stmt);
    mark_integrity(entry);
    return R::ok(std::move(entry));
}

Result<std::optional<ClipboardEntry>> HistoryStore::find_by_hash(const std::string& content_hash) const {
    using R = Result<std::optional<ClipboardEntry>>;
    static const std::string sql = std::format(
        "SELECT {} FROM clipboard_entries e WHERE e.content_hash = ?1", kEntryColumns);

    std::shared_lock lock(mutex_);
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, content_hash);
    if (!stmt.ok()) {
        return db_error<std::optional<ClipboardEntry>>(db_, "Hash lookup failed");
    }
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) return R::ok(std::nullopt);
    if (rc != SQLITE_ROW) {
        return db_error<std::optional<ClipboardEntry>>(db_, "Hash lookup failed");
    }
    auto entry = read_entry(stmt);
    mark_integrity(entry);
    return R::ok(std::move(entry));
}

Result<int64_t> HistoryStore::count() const {
    std::shared_lock lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM clipboard_entries");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        return db_error<int64_t>(db_, "Count failed");
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

Result<HistoryStats> HistoryStore::stats() const {
    HistoryStats stats;
    stats.max_entries = config_.max_entries;

    {
        std::shared_lock lock(mutex_);
        Statement stmt(db_,
            "SELECT content_type, COUNT(*), SUM(is_sensitive), SUM(pinned) "
            "FROM clipboard_entries GROUP BY content_type");
        if (!stmt.ok()) {
            return db_error<HistoryStats>(db_, "Stats query failed");
        }
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            const auto type = parse_content_type(stmt.column_text(0));
            const int64_t n = stmt.column_int64(1);
            stats.total_entries += n;
            stats.sensitive_entries += stmt.column_int64(2);
            stats.pinned_entries += stmt.column_int64(3);
            if (!type) continue;
            switch (*type) {
                case ContentType::TEXT:           stats.text_entries = n; break;
                case ContentType::IMAGE:          stats.image_entries = n; break;
                case ContentType::FILE_REFERENCE: stats.file_entries = n; break;
            }
        }
        if (rc != SQLITE_DONE) {
            return db_error<HistoryStats>(db_, "Stats query failed");
        }
    }

    stats.artifact_bytes = artifacts_->total_bytes();
    return Result<HistoryStats>::ok(stats);
}

void HistoryStore::mark_integrity(ClipboardEntry& entry) const {
    if (!entry.is_image()) return;
    if (artifacts_->exists(entry.raw_payload)) return;

    entry.integrity_degraded = true;
    entry.display_text = "[Image unavailable]";
    utils::log::warn(std::format("Entry {}: artifact missing ({})", entry.id, entry.raw_payload));
}

} // namespace clipstash
