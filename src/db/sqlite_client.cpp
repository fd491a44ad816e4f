#include "sqlite_client.h"
#include "../utils/logger.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace prism {

namespace {

const char* IMAGE_COLUMNS =
    "image_id, owner_id, content_hash, storage_key, mime_type, name, "
    "size_bytes, width, height, created_at";

const char* JOB_COLUMNS =
    "job_id, fingerprint, image_id, user_id, output_format, canonical_spec, "
    "state, error_kind, error_message, enqueued_at, started_at, completed_at";

std::string columnText(sqlite3_stmt* stmt, int column) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? text : "";
}

// Finalizes the statement on every exit path
struct StatementGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StatementGuard() {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

} // namespace

SQLiteClient::SQLiteClient(const std::string& db_path)
    : db_(nullptr), db_path_(db_path) {

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        LOG_ERROR("Failed to open SQLite database: {}", error);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + db_path);
    }

    // Enable WAL mode for better concurrency
    executeSql("PRAGMA journal_mode=WAL");
    executeSql("PRAGMA synchronous=NORMAL");
    executeSql("PRAGMA foreign_keys=ON");

    LOG_INFO("SQLite database opened: {}", db_path);
}

SQLiteClient::~SQLiteClient() {
    if (db_) {
        sqlite3_close(db_);
        LOG_INFO("SQLite database closed");
    }
}

bool SQLiteClient::initialize(const std::string& schema_path) {
    std::ifstream schema_file(schema_path);
    if (!schema_file.is_open()) {
        LOG_ERROR("Failed to open schema file: {}", schema_path);
        return false;
    }

    std::stringstream buffer;
    buffer << schema_file.rdbuf();
    return initializeFromSql(buffer.str());
}

bool SQLiteClient::initializeFromSql(const std::string& schema_sql) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (!executeSql(schema_sql)) {
        LOG_ERROR("Failed to initialize database schema");
        return false;
    }

    LOG_INFO("Database schema initialized successfully");
    return true;
}

bool SQLiteClient::executeSql(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        LOG_ERROR("SQL execution failed: {}", error);
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

void SQLiteClient::logSqliteError(const std::string& operation) {
    prism::Logger::log_structured(spdlog::level::err, "SQLite operation failed", {
        {"operation", operation},
        {"database", db_path_},
        {"error", sqlite3_errmsg(db_)}
    });
}

int SQLiteClient::executeWithKey(const char* sql, const std::string& key, const char* operation) {
    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError(operation);
        return -1;
    }

    sqlite3_bind_text(guard.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        logSqliteError(operation);
        return -1;
    }

    return sqlite3_changes(db_);
}

ImageMetadata SQLiteClient::extractImageMetadata(sqlite3_stmt* stmt) {
    ImageMetadata metadata;

    metadata.image_id = columnText(stmt, 0);
    metadata.owner_id = columnText(stmt, 1);
    metadata.content_hash = columnText(stmt, 2);
    metadata.storage_key = columnText(stmt, 3);
    metadata.mime_type = columnText(stmt, 4);
    metadata.name = columnText(stmt, 5);
    metadata.size_bytes = static_cast<size_t>(sqlite3_column_int64(stmt, 6));
    metadata.width = sqlite3_column_int(stmt, 7);
    metadata.height = sqlite3_column_int(stmt, 8);
    metadata.created_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 9));

    return metadata;
}

JobRecord SQLiteClient::extractJob(sqlite3_stmt* stmt) {
    JobRecord job;

    job.job_id = columnText(stmt, 0);
    job.fingerprint = columnText(stmt, 1);
    job.image_id = columnText(stmt, 2);
    job.user_id = columnText(stmt, 3);
    job.output_format = columnText(stmt, 4);
    job.canonical_spec = columnText(stmt, 5);

    std::string state = columnText(stmt, 6);
    auto parsed = jobStateFromString(state);
    if (!parsed) {
        LOG_WARN("Unknown job state '{}' for job {}", state, job.job_id);
    }
    job.state = parsed.value_or(JobState::FAILED);

    job.error_kind = jobErrorKindFromString(columnText(stmt, 7));
    job.error_message = columnText(stmt, 8);
    job.enqueued_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 9));
    job.started_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 10));
    job.completed_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 11));

    return job;
}

bool SQLiteClient::putImageMetadata(const ImageMetadata& metadata) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    const char* sql = R"(
        INSERT INTO images (image_id, owner_id, content_hash, storage_key, mime_type,
                            name, size_bytes, width, height, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(image_id) DO UPDATE SET
            owner_id = excluded.owner_id,
            content_hash = excluded.content_hash,
            storage_key = excluded.storage_key,
            mime_type = excluded.mime_type,
            name = excluded.name,
            size_bytes = excluded.size_bytes,
            width = excluded.width,
            height = excluded.height
    )";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("putImageMetadata");
        return false;
    }

    sqlite3_stmt* stmt = guard.stmt;
    sqlite3_bind_text(stmt, 1, metadata.image_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, metadata.owner_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, metadata.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, metadata.storage_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, metadata.mime_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, metadata.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(metadata.size_bytes));
    sqlite3_bind_int(stmt, 8, metadata.width);
    sqlite3_bind_int(stmt, 9, metadata.height);
    sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(metadata.created_at));

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        logSqliteError("putImageMetadata");
        return false;
    }

    LOG_DEBUG("Image metadata stored: {}", metadata.image_id);
    return true;
}

std::optional<ImageMetadata> SQLiteClient::getImageMetadata(const std::string& image_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string sql = std::string("SELECT ") + IMAGE_COLUMNS + " FROM images WHERE image_id = ?";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("getImageMetadata");
        return std::nullopt;
    }

    sqlite3_bind_text(guard.stmt, 1, image_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(guard.stmt);
    if (rc == SQLITE_ROW) {
        return extractImageMetadata(guard.stmt);
    }

    if (rc != SQLITE_DONE) {
        logSqliteError("getImageMetadata");
    }
    return std::nullopt;
}

bool SQLiteClient::deleteImageMetadata(const std::string& image_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    int changes = executeWithKey("DELETE FROM images WHERE image_id = ?", image_id, "deleteImageMetadata");
    if (changes > 0) {
        LOG_DEBUG("Image metadata deleted: {}", image_id);
    }
    return changes > 0;
}

std::vector<ImageMetadata> SQLiteClient::listImages(const std::string& owner_id,
                                                    int limit, int offset) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string sql = std::string("SELECT ") + IMAGE_COLUMNS +
        " FROM images WHERE owner_id = ? ORDER BY created_at DESC, image_id LIMIT ? OFFSET ?";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("listImages");
        return {};
    }

    sqlite3_bind_text(guard.stmt, 1, owner_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(guard.stmt, 2, limit);
    sqlite3_bind_int(guard.stmt, 3, offset);

    std::vector<ImageMetadata> images;
    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        images.push_back(extractImageMetadata(guard.stmt));
    }

    if (rc != SQLITE_DONE) {
        logSqliteError("listImages");
        return {};
    }

    LOG_DEBUG("Listed {} images for owner {}", images.size(), owner_id);
    return images;
}

int SQLiteClient::countImagesWithHash(const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM images WHERE content_hash = ?",
                           -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("countImagesWithHash");
        return -1;
    }

    sqlite3_bind_text(guard.stmt, 1, content_hash.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(guard.stmt) != SQLITE_ROW) {
        logSqliteError("countImagesWithHash");
        return -1;
    }
    return sqlite3_column_int(guard.stmt, 0);
}

bool SQLiteClient::imageExists(const std::string& image_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM images WHERE image_id = ?",
                           -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("imageExists");
        return false;
    }

    sqlite3_bind_text(guard.stmt, 1, image_id.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(guard.stmt) == SQLITE_ROW;
}

bool SQLiteClient::putJob(const JobRecord& job) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    const char* sql = R"(
        INSERT INTO jobs (job_id, fingerprint, image_id, user_id, output_format,
                          canonical_spec, state, error_kind, error_message,
                          enqueued_at, started_at, completed_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(job_id) DO UPDATE SET
            state = excluded.state,
            error_kind = excluded.error_kind,
            error_message = excluded.error_message,
            started_at = excluded.started_at,
            completed_at = excluded.completed_at
    )";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("putJob");
        return false;
    }

    std::string state = jobStateToString(job.state);
    std::string error_kind = jobErrorKindToString(job.error_kind);

    sqlite3_stmt* stmt = guard.stmt;
    sqlite3_bind_text(stmt, 1, job.job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, job.fingerprint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, job.image_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, job.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, job.output_format.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, job.canonical_spec.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, state.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, error_kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, job.error_message.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(job.enqueued_at));
    sqlite3_bind_int64(stmt, 11, static_cast<sqlite3_int64>(job.started_at));
    sqlite3_bind_int64(stmt, 12, static_cast<sqlite3_int64>(job.completed_at));

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        logSqliteError("putJob");
        return false;
    }
    return true;
}

std::optional<JobRecord> SQLiteClient::getJob(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string sql = std::string("SELECT ") + JOB_COLUMNS + " FROM jobs WHERE job_id = ?";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("getJob");
        return std::nullopt;
    }

    sqlite3_bind_text(guard.stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(guard.stmt);
    if (rc == SQLITE_ROW) {
        return extractJob(guard.stmt);
    }

    if (rc != SQLITE_DONE) {
        logSqliteError("getJob");
    }
    return std::nullopt;
}

bool SQLiteClient::deleteJob(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return executeWithKey("DELETE FROM jobs WHERE job_id = ?", job_id, "deleteJob") > 0;
}

std::vector<JobRecord> SQLiteClient::listJobsByState(JobState state) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string sql = std::string("SELECT ") + JOB_COLUMNS +
        " FROM jobs WHERE state = ? ORDER BY enqueued_at, job_id";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        logSqliteError("listJobsByState");
        return {};
    }

    std::string state_value = jobStateToString(state);
    sqlite3_bind_text(guard.stmt, 1, state_value.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<JobRecord> jobs;
    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        jobs.push_back(extractJob(guard.stmt));
    }

    if (rc != SQLITE_DONE) {
        logSqliteError("listJobsByState");
        return {};
    }
    return jobs;
}

} // namespace prism
