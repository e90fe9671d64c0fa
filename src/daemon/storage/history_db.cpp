#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO transcriptions (text, audio_duration, processing_time, model, backend) "
        "VALUES (?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, text, audio_duration, processing_time, model, backend "
        "FROM transcriptions ORDER BY id DESC LIMIT ?";

    const char* usage_sql =
        "SELECT COALESCE(model, ''), SUM(audio_duration), COUNT(*) FROM transcriptions "
        "WHERE date(timestamp, 'localtime') = date('now', 'localtime') "
        "GROUP BY model ORDER BY model";

    struct { const char* sql; sqlite3_stmt** stmt; const char* name; } statements[] = {
        {insert_sql, &insert_stmt_, "insert"},
        {recent_sql, &recent_stmt_, "recent"},
        {usage_sql, &usage_stmt_, "usage"},
    };
    for (auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", s.name, sqlite3_errmsg(db_));
            close();
            return false;
        }
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (usage_stmt_) { sqlite3_finalize(usage_stmt_); usage_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const std::string& text, double audio_duration, double processing_time,
                       const std::string& model, const std::string& backend) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 2, audio_duration);
    sqlite3_bind_double(insert_stmt_, 3, processing_time);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };
    bind_nullable(4, model);
    bind_nullable(5, backend);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = column_text(recent_stmt_, 1);
        e.text = column_text(recent_stmt_, 2);
        e.audio_duration = sqlite3_column_double(recent_stmt_, 3);
        e.processing_time = sqlite3_column_double(recent_stmt_, 4);
        e.model = column_text(recent_stmt_, 5);
        e.backend = column_text(recent_stmt_, 6);
        entries.push_back(std::move(e));
    }

    return entries;
}

std::vector<ModelUsage> HistoryDb::usage_today() {
    std::vector<ModelUsage> usage;
    if (!usage_stmt_) return usage;

    sqlite3_reset(usage_stmt_);
    while (sqlite3_step(usage_stmt_) == SQLITE_ROW) {
        usage.push_back(ModelUsage{
            .model = column_text(usage_stmt_, 0),
            .audio_seconds = sqlite3_column_double(usage_stmt_, 1),
            .count = sqlite3_column_int64(usage_stmt_, 2),
        });
    }
    return usage;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            audio_duration REAL,
            processing_time REAL,
            model TEXT,
            backend TEXT
        );
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
