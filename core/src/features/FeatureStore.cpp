#include "cutgraph/features/FeatureStore.h"

#include "cutgraph/Logging.h"

#include <cstring>
#include <stdexcept>
#include <string>

namespace cutgraph {
namespace features {

namespace {

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(message);
    }
}

sqlite3_stmt* prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    return stmt;
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace

FeatureStore::FeatureStore(const std::string& path, Mode mode) : path_(path) {
    const int flags = (mode == Mode::ReadOnly) ? SQLITE_OPEN_READONLY
                                               : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open feature store at " + path + ": " + reason);
    }
    log_message(LogLevel::Debug, "FeatureStore", "Opened " + path);
}

FeatureStore::~FeatureStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void FeatureStore::initialize() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS matrices (
            key TEXT PRIMARY KEY,
            num_frames INTEGER NOT NULL,
            num_features INTEGER NOT NULL,
            data_blob BLOB
        );

        -- Index of Features references; storage_path/storage_key point into
        -- this or another store.
        CREATE TABLE IF NOT EXISTS features (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT,
            recording_id TEXT NOT NULL,
            channel_id INTEGER NOT NULL,
            start REAL NOT NULL,
            duration REAL NOT NULL,
            num_frames INTEGER NOT NULL,
            num_features INTEGER NOT NULL,
            frame_length REAL NOT NULL,
            frame_shift REAL NOT NULL,
            sampling_rate INTEGER NOT NULL,
            storage_type TEXT NOT NULL,
            storage_path TEXT NOT NULL,
            storage_key TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_features_recording ON features(recording_id, channel_id);
    )SQL";

    exec_or_throw(db_, schema);
}

void FeatureStore::write_matrix(const std::string& key, const FeatureMatrix& matrix) {
    if (matrix.values.size() != matrix.numFrames * matrix.numFeatures) {
        throw std::runtime_error("Feature matrix '" + key + "' has inconsistent shape");
    }
    auto stmt = prepare_or_throw(db_,
        "INSERT INTO matrices (key, num_frames, num_features, data_blob) VALUES (?,?,?,?) "
        "ON CONFLICT(key) DO UPDATE SET "
        "num_frames=excluded.num_frames, num_features=excluded.num_features, data_blob=excluded.data_blob;");

    const void* blob_data = matrix.values.data();
    const int blob_size = static_cast<int>(matrix.values.size() * sizeof(float));

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(matrix.numFrames));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(matrix.numFeatures));
    sqlite3_bind_blob(stmt, 4, blob_data, blob_size, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db_));
    }
}

FeatureMatrix FeatureStore::read_matrix(const std::string& key) const {
    auto stmt = prepare_or_throw(db_, "SELECT num_frames, num_features, data_blob FROM matrices WHERE key=?;");
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        throw std::runtime_error("No feature matrix '" + key + "' in " + path_);
    }

    FeatureMatrix matrix;
    matrix.numFrames = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    matrix.numFeatures = static_cast<std::size_t>(sqlite3_column_int64(stmt, 1));
    matrix.values.assign(matrix.numFrames * matrix.numFeatures, 0.0f);

    const void* blob = sqlite3_column_blob(stmt, 2);
    const std::size_t blob_size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, 2));
    if (blob_size != matrix.values.size() * sizeof(float)) {
        sqlite3_finalize(stmt);
        throw std::runtime_error("Feature matrix '" + key + "' in " + path_ + " is truncated");
    }
    if (blob_size > 0) {
        std::memcpy(matrix.values.data(), blob, blob_size);
    }
    sqlite3_finalize(stmt);
    return matrix;
}

bool FeatureStore::contains(const std::string& key) const {
    auto stmt = prepare_or_throw(db_, "SELECT 1 FROM matrices WHERE key=?;");
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    const bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

void FeatureStore::save_feature_set(const FeatureSet& featureSet) {
    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        exec_or_throw(db_, "DELETE FROM features;");

        auto stmt = prepare_or_throw(db_,
            "INSERT INTO features (type, recording_id, channel_id, start, duration, num_frames, num_features, "
            "frame_length, frame_shift, sampling_rate, storage_type, storage_path, storage_key) "
            "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?);");

        for (const auto& f : featureSet) {
            sqlite3_bind_text(stmt, 1, f.type.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, f.recordingId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 3, f.channelId);
            sqlite3_bind_double(stmt, 4, f.start);
            sqlite3_bind_double(stmt, 5, f.duration);
            sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(f.numFrames));
            sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(f.numFeatures));
            sqlite3_bind_double(stmt, 8, f.frameLength);
            sqlite3_bind_double(stmt, 9, f.frameShift);
            sqlite3_bind_int(stmt, 10, f.samplingRate);
            sqlite3_bind_text(stmt, 11, f.storageType.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 12, f.storagePath.c_str(), -1, SQLITE_TRANSIENT);

            // Handle optional storage_key (bind NULL if empty)
            if (f.storageKey.empty()) {
                sqlite3_bind_null(stmt, 13);
            } else {
                sqlite3_bind_text(stmt, 13, f.storageKey.c_str(), -1, SQLITE_TRANSIENT);
            }

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                const std::string message = sqlite3_errmsg(db_);
                sqlite3_finalize(stmt);
                throw std::runtime_error(message);
            }
            sqlite3_reset(stmt);
        }
        sqlite3_finalize(stmt);

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
    log_message(LogLevel::Debug, "FeatureStore",
                "Saved " + std::to_string(featureSet.size()) + " feature references to " + path_);
}

FeatureSet FeatureStore::load_feature_set() const {
    auto stmt = prepare_or_throw(db_,
        "SELECT type, recording_id, channel_id, start, duration, num_frames, num_features, "
        "frame_length, frame_shift, sampling_rate, storage_type, storage_path, storage_key "
        "FROM features ORDER BY id;");

    FeatureSet featureSet;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Features f;
        f.type = column_string(stmt, 0);
        f.recordingId = column_string(stmt, 1);
        f.channelId = sqlite3_column_int(stmt, 2);
        f.start = sqlite3_column_double(stmt, 3);
        f.duration = sqlite3_column_double(stmt, 4);
        f.numFrames = static_cast<std::size_t>(sqlite3_column_int64(stmt, 5));
        f.numFeatures = static_cast<std::size_t>(sqlite3_column_int64(stmt, 6));
        f.frameLength = sqlite3_column_double(stmt, 7);
        f.frameShift = sqlite3_column_double(stmt, 8);
        f.samplingRate = sqlite3_column_int(stmt, 9);
        f.storageType = column_string(stmt, 10);
        f.storagePath = column_string(stmt, 11);
        f.storageKey = column_string(stmt, 12);
        featureSet.add(std::move(f));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db_));
    }
    return featureSet;
}

}  // namespace features
}  // namespace cutgraph
