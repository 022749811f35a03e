#include "persistence/DetectionStore.hpp"
#include "core/Logger.hpp"
#include "core/TimeUtils.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace ward {

namespace {

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

DetectionStore::DetectionStore() = default;

DetectionStore::~DetectionStore() {
    Shutdown();
}

bool DetectionStore::Initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        LOG_WARN("DetectionStore already initialized");
        return true;
    }

    // Create parent directory if needed (skip for :memory:)
    if (db_path != ":memory:") {
        try {
            std::filesystem::path p(db_path);
            if (p.has_parent_path() && !p.parent_path().empty()) {
                std::filesystem::create_directories(p.parent_path());
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("DetectionStore: Failed to create directory for {}: {}", db_path, ex.what());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DetectionStore: Failed to open database {}: {}", db_path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    CreateSchema();
    PrepareStatements();

    if (!stmt_insert_) {
        LOG_ERROR("DetectionStore: Failed to prepare statements: {}", sqlite3_errmsg(db_));
        FinalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("DetectionStore initialized (db_path={})", db_path);
    return true;
}

void DetectionStore::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    FinalizeStatements();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_INFO("DetectionStore shutdown");
    }
}

bool DetectionStore::IsOpen() {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void DetectionStore::CreateSchema() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS detections (
            id               INTEGER PRIMARY KEY AUTOINCREMENT,
            uuid             TEXT    NOT NULL UNIQUE,
            detected_at      TEXT    NOT NULL,
            detected_at_ms   INTEGER NOT NULL,
            pid              INTEGER NOT NULL,
            image            TEXT,
            command_line     TEXT,
            label            TEXT,
            confidence       REAL    DEFAULT 0,
            heuristic_score  INTEGER DEFAULT 0,
            fused_confidence REAL    DEFAULT 0,
            severity         TEXT    NOT NULL,
            quarantined      INTEGER DEFAULT 0,
            evidence_path    TEXT,
            evidence_sha256  TEXT,
            details          TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_detections_pid ON detections(pid);
        CREATE INDEX IF NOT EXISTS idx_detections_time ON detections(detected_at_ms);
    )SQL";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DetectionStore: Failed to create schema: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
    }
}

void DetectionStore::PrepareStatements() {
    sqlite3_prepare_v2(db_,
        "INSERT INTO detections (uuid, detected_at, detected_at_ms, pid, image, command_line, "
        "label, confidence, heuristic_score, fused_confidence, severity, quarantined, "
        "evidence_path, evidence_sha256, details) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_, nullptr);

    const char* columns =
        "SELECT id, uuid, detected_at_ms, pid, image, command_line, label, confidence, "
        "heuristic_score, fused_confidence, severity, quarantined, evidence_path, "
        "evidence_sha256, details FROM detections ";

    sqlite3_prepare_v2(db_,
        (std::string(columns) + "ORDER BY detected_at_ms DESC, id DESC LIMIT ?").c_str(),
        -1, &stmt_recent_, nullptr);

    sqlite3_prepare_v2(db_,
        (std::string(columns) + "WHERE pid = ? ORDER BY detected_at_ms ASC, id ASC").c_str(),
        -1, &stmt_by_pid_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT COUNT(*) FROM detections",
        -1, &stmt_count_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT COUNT(*) FROM detections WHERE quarantined = 1",
        -1, &stmt_quarantined_count_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT detected_at FROM detections ORDER BY detected_at_ms DESC, id DESC LIMIT 1",
        -1, &stmt_last_detected_, nullptr);
}

void DetectionStore::FinalizeStatements() {
    auto finalize = [](sqlite3_stmt*& stmt) {
        if (stmt) { sqlite3_finalize(stmt); stmt = nullptr; }
    };
    finalize(stmt_insert_);
    finalize(stmt_recent_);
    finalize(stmt_by_pid_);
    finalize(stmt_count_);
    finalize(stmt_quarantined_count_);
    finalize(stmt_last_detected_);
}

bool DetectionStore::InsertDetection(const DetectionRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_insert_) return false;

    std::string ts = TimestampToISO8601(row.detected_at_ms);

    nlohmann::json details;
    details["tokens"] = row.tokens;
    nlohmann::json indicators = nlohmann::json::object();
    for (const auto& [name, count] : row.indicators) {
        indicators[name] = count;
    }
    details["indicators"] = indicators;
    std::string details_str = details.dump();

    sqlite3_reset(stmt_insert_);
    sqlite3_clear_bindings(stmt_insert_);
    sqlite3_bind_text(stmt_insert_, 1, row.uuid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 2, ts.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_, 3, static_cast<sqlite3_int64>(row.detected_at_ms));
    sqlite3_bind_int64(stmt_insert_, 4, static_cast<sqlite3_int64>(row.pid));
    sqlite3_bind_text(stmt_insert_, 5, row.image.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 6, row.command_line.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 7, row.label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt_insert_, 8, row.confidence);
    sqlite3_bind_int(stmt_insert_, 9, row.heuristic_score);
    sqlite3_bind_double(stmt_insert_, 10, row.fused_confidence);
    sqlite3_bind_text(stmt_insert_, 11, row.severity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_, 12, row.quarantined ? 1 : 0);
    sqlite3_bind_text(stmt_insert_, 13, row.evidence_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 14, row.evidence_sha256.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 15, details_str.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_insert_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("DetectionStore: Failed to insert detection {}: {}", row.uuid, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<DetectionRow> DetectionStore::ReadRows(sqlite3_stmt* stmt) {
    std::vector<DetectionRow> rows;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DetectionRow row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.uuid = ColumnText(stmt, 1);
        row.detected_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        row.pid = static_cast<uint32_t>(sqlite3_column_int64(stmt, 3));
        row.image = ColumnText(stmt, 4);
        row.command_line = ColumnText(stmt, 5);
        row.label = ColumnText(stmt, 6);
        row.confidence = sqlite3_column_double(stmt, 7);
        row.heuristic_score = sqlite3_column_int(stmt, 8);
        row.fused_confidence = sqlite3_column_double(stmt, 9);
        row.severity = ColumnText(stmt, 10);
        row.quarantined = sqlite3_column_int(stmt, 11) != 0;
        row.evidence_path = ColumnText(stmt, 12);
        row.evidence_sha256 = ColumnText(stmt, 13);

        std::string details = ColumnText(stmt, 14);
        if (!details.empty()) {
            try {
                auto j = nlohmann::json::parse(details);
                row.tokens = j.value("tokens", std::vector<std::string>{});
                nlohmann::json indicators = j.value("indicators", nlohmann::json::object());
                for (const auto& [name, count] : indicators.items()) {
                    row.indicators[name] = count.get<uint32_t>();
                }
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("DetectionStore: Corrupt details for detection {}: {}", row.uuid, e.what());
            }
        }

        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<DetectionRow> DetectionStore::QueryRecent(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_recent_) return {};

    sqlite3_reset(stmt_recent_);
    sqlite3_bind_int(stmt_recent_, 1, limit > 0 ? limit : -1);
    return ReadRows(stmt_recent_);
}

std::vector<DetectionRow> DetectionStore::QueryByPid(uint32_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_by_pid_) return {};

    sqlite3_reset(stmt_by_pid_);
    sqlite3_bind_int64(stmt_by_pid_, 1, static_cast<sqlite3_int64>(pid));
    return ReadRows(stmt_by_pid_);
}

DetectionStore::StatusSnapshot DetectionStore::GetStatusSnapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    StatusSnapshot snapshot;
    if (!db_) return snapshot;

    if (stmt_count_) {
        sqlite3_reset(stmt_count_);
        if (sqlite3_step(stmt_count_) == SQLITE_ROW) {
            snapshot.total_detections = static_cast<size_t>(sqlite3_column_int64(stmt_count_, 0));
        }
    }

    if (stmt_quarantined_count_) {
        sqlite3_reset(stmt_quarantined_count_);
        if (sqlite3_step(stmt_quarantined_count_) == SQLITE_ROW) {
            snapshot.quarantined = static_cast<size_t>(sqlite3_column_int64(stmt_quarantined_count_, 0));
        }
    }

    if (stmt_last_detected_) {
        sqlite3_reset(stmt_last_detected_);
        if (sqlite3_step(stmt_last_detected_) == SQLITE_ROW) {
            snapshot.last_detected_at = ColumnText(stmt_last_detected_, 0);
        }
    }

    return snapshot;
}

} // namespace ward
