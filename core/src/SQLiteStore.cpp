#include "voicescope/SQLiteStore.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "voicescope/CoreContract.h"
#include "voicescope/MetricEngine.h"
#include "voicescope/Utility.h"

namespace voicescope {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(message);
    }
}

StmtPtr prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    return StmtPtr(stmt, &sqlite3_finalize);
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    sqlite3_reset(stmt);
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

void delete_children(sqlite3* db, sqlite3_int64 clip_id) {
    for (const char* table : {"metrics", "measurements", "segments", "issues"}) {
        auto stmt = prepare_or_throw(db, std::string("DELETE FROM ") + table + " WHERE clip_id=?;");
        sqlite3_bind_int64(stmt.get(), 1, clip_id);
        step_done_or_throw(db, stmt.get());
    }
}

std::optional<sqlite3_int64> find_clip_row(sqlite3* db, const std::string& clipId) {
    auto stmt = prepare_or_throw(db, "SELECT id FROM clips WHERE logical_id=?;");
    sqlite3_bind_text(stmt.get(), 1, clipId.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return sqlite3_column_int64(stmt.get(), 0);
    }
    return std::nullopt;
}

}  // namespace

SQLiteStore::SQLiteStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = "Failed to open SQLite database at " + path;
        if (db_) {
            message += ": ";
            message += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error(message);
    }
}

SQLiteStore::~SQLiteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SQLiteStore::initialize() {
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;

        CREATE TABLE IF NOT EXISTS clips (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            logical_id TEXT NOT NULL UNIQUE,
            name TEXT,
            duration_sec REAL,
            sample_rate INTEGER,
            used_fallback INTEGER NOT NULL DEFAULT 0,
            failure_stage TEXT,
            failure_message TEXT,
            delivery_average REAL,
            contract_version TEXT,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_clips_logical ON clips(logical_id);
        CREATE INDEX IF NOT EXISTS idx_clips_created ON clips(created_at);

        CREATE TABLE IF NOT EXISTS metrics (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            clip_id INTEGER NOT NULL,
            name TEXT NOT NULL,
            value REAL NOT NULL,
            FOREIGN KEY(clip_id) REFERENCES clips(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_metrics_clip ON metrics(clip_id);

        CREATE TABLE IF NOT EXISTS measurements (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            clip_id INTEGER NOT NULL,
            name TEXT NOT NULL,
            value REAL NOT NULL,
            FOREIGN KEY(clip_id) REFERENCES clips(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_measurements_clip ON measurements(clip_id);

        CREATE TABLE IF NOT EXISTS segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            clip_id INTEGER NOT NULL,
            type TEXT NOT NULL, -- "speech" or "silence"
            start_sec REAL NOT NULL,
            end_sec REAL NOT NULL,
            FOREIGN KEY(clip_id) REFERENCES clips(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_segments_clip ON segments(clip_id);

        CREATE TABLE IF NOT EXISTS issues (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            clip_id INTEGER NOT NULL,
            type TEXT NOT NULL,
            start_sec REAL NOT NULL,
            end_sec REAL NOT NULL,
            severity REAL NOT NULL,
            explanation TEXT,
            FOREIGN KEY(clip_id) REFERENCES clips(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_issues_clip ON issues(clip_id);
    )SQL";

    exec_or_throw(db_, schema);
}

void SQLiteStore::save_report(const DeliveryReport& report) {
    if (report.clipId.empty()) {
        throw std::runtime_error("save_report: clip id is empty");
    }

    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        // Insert clip record with UPSERT on logical_id
        sqlite3_int64 clip_id = 0;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO clips (logical_id, name, duration_sec, sample_rate, used_fallback, failure_stage, "
                "failure_message, delivery_average, contract_version, updated_at) "
                "VALUES (?,?,?,?,?,?,?,?,?,CURRENT_TIMESTAMP) "
                "ON CONFLICT(logical_id) DO UPDATE SET "
                "name=excluded.name, duration_sec=excluded.duration_sec, sample_rate=excluded.sample_rate, "
                "used_fallback=excluded.used_fallback, failure_stage=excluded.failure_stage, "
                "failure_message=excluded.failure_message, delivery_average=excluded.delivery_average, "
                "contract_version=excluded.contract_version, updated_at=CURRENT_TIMESTAMP;");

            sqlite3_bind_text(stmt.get(), 1, report.clipId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, report.clipName.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 3, report.durationSeconds);
            sqlite3_bind_int(stmt.get(), 4, report.sampleRate);
            sqlite3_bind_int(stmt.get(), 5, report.usedFallback ? 1 : 0);
            if (report.failure) {
                const std::string stage = analysis_stage_to_string(report.failure->stage);
                sqlite3_bind_text(stmt.get(), 6, stage.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 7, report.failure->message.c_str(), -1, SQLITE_TRANSIENT);
            } else {
                sqlite3_bind_null(stmt.get(), 6);
                sqlite3_bind_null(stmt.get(), 7);
            }
            sqlite3_bind_double(stmt.get(), 8, delivery_average(report.metrics));
            sqlite3_bind_text(stmt.get(), 9, contract::CORE_CONTRACT_VERSION, -1, SQLITE_STATIC);
            step_done_or_throw(db_, stmt.get());
        }

        const auto row = find_clip_row(db_, report.clipId);
        if (!row) {
            throw std::runtime_error("Failed to insert/get clip_id");
        }
        clip_id = *row;

        delete_children(db_, clip_id);

        // Scores
        {
            auto stmt = prepare_or_throw(db_, "INSERT INTO metrics (clip_id, name, value) VALUES (?,?,?);");
            for (const auto& [kind, value] : metric_values(report.metrics)) {
                const std::string name = metric_kind_to_string(kind);
                sqlite3_bind_int64(stmt.get(), 1, clip_id);
                sqlite3_bind_text(stmt.get(), 2, name.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 3, value);
                step_done_or_throw(db_, stmt.get());
            }
        }

        // Raw measurements (absent on the fallback path)
        if (!report.usedFallback) {
            const auto& m = report.measurements;
            const std::pair<const char*, double> rows[] = {
                {"speech_rate", m.speechRate},
                {"speech_segment_count", static_cast<double>(m.speechSegmentCount)},
                {"total_speech_sec", m.totalSpeechSeconds},
                {"silence_ratio", m.silenceRatio},
                {"total_silence_sec", m.totalSilenceSeconds},
                {"rms", m.rms},
                {"loudness_db", m.loudnessDb},
                {"clarity_ratio", m.clarityRatio},
                {"pitch_mean_hz", m.pitchMeanHz},
                {"pitch_variation_ratio", m.pitchVariationRatio},
                {"voiced_window_count", static_cast<double>(m.voicedWindowCount)},
            };
            auto stmt = prepare_or_throw(db_, "INSERT INTO measurements (clip_id, name, value) VALUES (?,?,?);");
            for (const auto& [name, value] : rows) {
                sqlite3_bind_int64(stmt.get(), 1, clip_id);
                sqlite3_bind_text(stmt.get(), 2, name, -1, SQLITE_STATIC);
                sqlite3_bind_double(stmt.get(), 3, value);
                step_done_or_throw(db_, stmt.get());
            }
        }

        // Speech and silence segments
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO segments (clip_id, type, start_sec, end_sec) VALUES (?,?,?,?);");
            auto insert_all = [&](const std::vector<TimeSegment>& segments, const char* type) {
                for (const auto& seg : segments) {
                    sqlite3_bind_int64(stmt.get(), 1, clip_id);
                    sqlite3_bind_text(stmt.get(), 2, type, -1, SQLITE_STATIC);
                    sqlite3_bind_double(stmt.get(), 3, seg.startSeconds);
                    sqlite3_bind_double(stmt.get(), 4, seg.endSeconds);
                    step_done_or_throw(db_, stmt.get());
                }
            };
            insert_all(report.speechSegments, "speech");
            insert_all(report.silenceSegments, "silence");
        }

        // Diagnostics issues
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO issues (clip_id, type, start_sec, end_sec, severity, explanation) VALUES (?,?,?,?,?,?);");
            for (const auto& issue : report.issues) {
                sqlite3_bind_int64(stmt.get(), 1, clip_id);
                sqlite3_bind_text(stmt.get(), 2, issue.type.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 3, issue.startTime);
                sqlite3_bind_double(stmt.get(), 4, issue.endTime);
                sqlite3_bind_double(stmt.get(), 5, issue.severity);
                sqlite3_bind_text(stmt.get(), 6, issue.explanation.c_str(), -1, SQLITE_TRANSIENT);
                step_done_or_throw(db_, stmt.get());
            }
        }

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
}

std::optional<DeliveryMetrics> SQLiteStore::load_metrics(const std::string& clipId) const {
    const auto row = find_clip_row(db_, clipId);
    if (!row) return std::nullopt;

    auto stmt = prepare_or_throw(db_, "SELECT name, value FROM metrics WHERE clip_id=?;");
    sqlite3_bind_int64(stmt.get(), 1, *row);

    DeliveryMetrics metrics;
    int found = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        set_metric_value(metrics, metric_kind_from_string(column_string(stmt.get(), 0)),
                         sqlite3_column_double(stmt.get(), 1));
        ++found;
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db_));
    }
    if (found == 0) return std::nullopt;
    return metrics;
}

std::vector<ClipSummary> SQLiteStore::list_clips() const {
    auto stmt = prepare_or_throw(db_,
        "SELECT logical_id, name, duration_sec, delivery_average, used_fallback, created_at "
        "FROM clips ORDER BY created_at DESC, id DESC;");

    std::vector<ClipSummary> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ClipSummary s;
        s.clipId = column_string(stmt.get(), 0);
        s.clipName = column_string(stmt.get(), 1);
        s.durationSeconds = sqlite3_column_double(stmt.get(), 2);
        s.deliveryAverage = sqlite3_column_double(stmt.get(), 3);
        s.usedFallback = sqlite3_column_int(stmt.get(), 4) != 0;
        s.createdAt = column_string(stmt.get(), 5);
        out.push_back(std::move(s));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db_));
    }
    return out;
}

bool SQLiteStore::delete_clip(const std::string& clipId) {
    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        const auto row = find_clip_row(db_, clipId);
        if (!row) {
            exec_or_throw(db_, "COMMIT;");
            return false;
        }
        delete_children(db_, *row);
        auto stmt = prepare_or_throw(db_, "DELETE FROM clips WHERE id=?;");
        sqlite3_bind_int64(stmt.get(), 1, *row);
        step_done_or_throw(db_, stmt.get());
        exec_or_throw(db_, "COMMIT;");
        return true;
    } catch (...) {
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
}

}  // namespace voicescope
