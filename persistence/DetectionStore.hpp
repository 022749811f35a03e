#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ward {

struct DetectionRow {
    int64_t id{0};
    std::string uuid;
    uint64_t detected_at_ms{0};
    uint32_t pid{0};
    std::string image;
    std::string command_line;
    std::string label;
    double confidence{0.0};
    int heuristic_score{0};
    double fused_confidence{0.0};
    std::string severity;
    bool quarantined{false};
    std::string evidence_path;
    std::string evidence_sha256;
    std::vector<std::string> tokens;
    std::map<std::string, uint32_t> indicators;
};

// Append-only SQLite history of positive detections.
class DetectionStore {
public:
    DetectionStore();
    ~DetectionStore();

    DetectionStore(const DetectionStore&) = delete;
    DetectionStore& operator=(const DetectionStore&) = delete;

    // ":memory:" opens a private in-memory database.
    bool Initialize(const std::string& db_path = "data/ward.db");
    void Shutdown();
    bool IsOpen();

    bool InsertDetection(const DetectionRow& row);

    std::vector<DetectionRow> QueryRecent(int limit = 50);
    std::vector<DetectionRow> QueryByPid(uint32_t pid);

    struct StatusSnapshot {
        size_t total_detections{0};
        size_t quarantined{0};
        std::string last_detected_at;
    };
    StatusSnapshot GetStatusSnapshot();

private:
    void CreateSchema();
    void PrepareStatements();
    void FinalizeStatements();
    std::vector<DetectionRow> ReadRows(sqlite3_stmt* stmt);

    sqlite3* db_{nullptr};
    std::mutex mutex_;

    sqlite3_stmt* stmt_insert_{nullptr};
    sqlite3_stmt* stmt_recent_{nullptr};
    sqlite3_stmt* stmt_by_pid_{nullptr};
    sqlite3_stmt* stmt_count_{nullptr};
    sqlite3_stmt* stmt_quarantined_count_{nullptr};
    sqlite3_stmt* stmt_last_detected_{nullptr};
};

} // namespace ward
