#ifndef PRISM_DB_SQLITE_CLIENT_H
#define PRISM_DB_SQLITE_CLIENT_H

#include <sqlite3.h>
#include <string>
#include <memory>
#include <mutex>
#include "../interfaces/database_client_interface.h"

namespace prism {

/**
 * @brief SQLite implementation of the database client interface
 */
class SQLiteClient : public DatabaseClientInterface {
public:
    /**
     * @brief Constructor
     * @param db_path Path to the SQLite database file (":memory:" for tests)
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit SQLiteClient(const std::string& db_path);

    /**
     * @brief Destructor - closes database connection
     */
    ~SQLiteClient() override;

    // Disable copy
    SQLiteClient(const SQLiteClient&) = delete;
    SQLiteClient& operator=(const SQLiteClient&) = delete;

    // Image metadata operations
    bool putImageMetadata(const ImageMetadata& metadata) override;
    std::optional<ImageMetadata> getImageMetadata(const std::string& image_id) override;
    bool deleteImageMetadata(const std::string& image_id) override;
    std::vector<ImageMetadata> listImages(const std::string& owner_id,
                                          int limit, int offset) override;
    int countImagesWithHash(const std::string& content_hash) override;
    bool imageExists(const std::string& image_id) override;

    // Job operations
    bool putJob(const JobRecord& job) override;
    std::optional<JobRecord> getJob(const std::string& job_id) override;
    bool deleteJob(const std::string& job_id) override;
    std::vector<JobRecord> listJobsByState(JobState state) override;

    /**
     * @brief Initialize the database schema from a SQL file
     * @param schema_path Path to schema.sql
     * @return true if successful
     */
    bool initialize(const std::string& schema_path);

    /**
     * @brief Initialize the database schema from SQL text
     * @return true if successful
     */
    bool initializeFromSql(const std::string& schema_sql);

private:
    sqlite3* db_;
    std::string db_path_;
    mutable std::mutex db_mutex_;  // For thread safety

    /**
     * @brief Execute SQL statement
     * @param sql SQL statement to execute
     * @return true if successful
     */
    bool executeSql(const std::string& sql);

    /**
     * @brief Run a single-row-key statement (DELETE ... WHERE id = ?)
     * @return Number of rows changed, -1 on error
     */
    int executeWithKey(const char* sql, const std::string& key, const char* operation);

    void logSqliteError(const std::string& operation);

    /**
     * @brief Helper to extract ImageMetadata from SQLite row
     */
    ImageMetadata extractImageMetadata(sqlite3_stmt* stmt);

    /**
     * @brief Helper to extract JobRecord from SQLite row
     */
    JobRecord extractJob(sqlite3_stmt* stmt);
};

} // namespace prism

#endif // PRISM_DB_SQLITE_CLIENT_H
