#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct TranscriptRecord {
    int64_t id;
    std::string session_id;
    std::string text;
    std::string created_at;
    std::string expires_at;
};

// Journal of flushed transcript blocks. Written by the dispatcher thread and
// read by the main loop, so every statement runs under one mutex.
class TranscriptStore {
public:
    TranscriptStore();
    ~TranscriptStore();

    TranscriptStore(const TranscriptStore&) = delete;
    TranscriptStore& operator=(const TranscriptStore&) = delete;

    bool open(const std::string& path);
    void close();

    bool insert(const std::string& session_id, const std::string& text, uint32_t retention_days);

    // Newest first; expired rows are skipped. Empty session_id means all sessions.
    std::vector<TranscriptRecord> recent(int limit = 10, const std::string& session_id = "");

    // Deletes expired rows, returns how many were removed (-1 on error).
    int purge_expired();

private:
    bool create_tables();

    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* recent_session_stmt_ = nullptr;
};
