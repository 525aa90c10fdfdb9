#include "storage/transcript_store.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

TranscriptStore::TranscriptStore() = default;

TranscriptStore::~TranscriptStore() {
    close();
}

bool TranscriptStore::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    if (path != ":memory:") {
        fs::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO transcripts (session_id, text, expires_at) "
        "VALUES (?, ?, strftime('%Y-%m-%dT%H:%M:%f', 'now', '+' || ? || ' days'))";

    const char* recent_sql =
        "SELECT id, session_id, text, created_at, expires_at FROM transcripts "
        "WHERE expires_at > strftime('%Y-%m-%dT%H:%M:%f', 'now') "
        "ORDER BY id DESC LIMIT ?";

    const char* recent_session_sql =
        "SELECT id, session_id, text, created_at, expires_at FROM transcripts "
        "WHERE session_id = ? AND expires_at > strftime('%Y-%m-%dT%H:%M:%f', 'now') "
        "ORDER BY id DESC LIMIT ?";

    auto prepare = [this](const char* sql, sqlite3_stmt** stmt, const char* name) {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", name, sqlite3_errmsg(db_));
            return false;
        }
        return true;
    };

    return prepare(insert_sql, &insert_stmt_, "insert") &&
           prepare(recent_sql, &recent_stmt_, "recent") &&
           prepare(recent_session_sql, &recent_session_stmt_, "recent by session");
}

void TranscriptStore::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (recent_session_stmt_) { sqlite3_finalize(recent_session_stmt_); recent_session_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool TranscriptStore::insert(const std::string& session_id, const std::string& text,
                             uint32_t retention_days) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_stmt_, 3, retention_days);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<TranscriptRecord> TranscriptStore::recent(int limit, const std::string& session_id) {
    std::lock_guard lock(mutex_);
    std::vector<TranscriptRecord> records;

    sqlite3_stmt* stmt = session_id.empty() ? recent_stmt_ : recent_session_stmt_;
    if (!stmt) return records;

    sqlite3_reset(stmt);
    int idx = 1;
    if (!session_id.empty()) {
        sqlite3_bind_text(stmt, idx++, session_id.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, idx, limit);

    auto get_text = [](sqlite3_stmt* s, int col) -> std::string {
        auto* p = sqlite3_column_text(s, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(TranscriptRecord{
            .id = sqlite3_column_int64(stmt, 0),
            .session_id = get_text(stmt, 1),
            .text = get_text(stmt, 2),
            .created_at = get_text(stmt, 3),
            .expires_at = get_text(stmt, 4),
        });
    }

    return records;
}

int TranscriptStore::purge_expired() {
    std::lock_guard lock(mutex_);
    if (!db_) return -1;

    char* err = nullptr;
    int rc = sqlite3_exec(db_,
                          "DELETE FROM transcripts "
                          "WHERE expires_at <= strftime('%Y-%m-%dT%H:%M:%f', 'now')",
                          nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: purge failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return -1;
    }
    return sqlite3_changes(db_);
}

bool TranscriptStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcripts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            text TEXT NOT NULL,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            expires_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_transcripts_session ON transcripts(session_id);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
