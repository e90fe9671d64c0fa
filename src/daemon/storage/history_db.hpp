#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    double audio_duration;
    double processing_time;
    std::string model;
    std::string backend;
};

struct ModelUsage {
    std::string model;
    double audio_seconds = 0.0;
    int64_t count = 0;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const std::string& text, double audio_duration, double processing_time,
                const std::string& model, const std::string& backend);

    std::vector<HistoryEntry> recent(int limit = 10);

    // Audio seconds per model for rows recorded since local midnight.
    std::vector<ModelUsage> usage_today();

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* usage_stmt_ = nullptr;
};
