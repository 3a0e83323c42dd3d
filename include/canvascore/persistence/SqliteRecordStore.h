#pragma once

#include "IRecordStore.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace canvascore {

/**
 * @brief IRecordStore backed by a SQLite database file
 *
 * Tables: `nodes`, `edges` and a key/value `meta` table holding the schema
 * version. The database runs in WAL mode. Each WriteBatch becomes one
 * BEGIN IMMEDIATE ... COMMIT transaction of INSERT OR REPLACE / DELETE
 * statements; any failure rolls the whole batch back.
 *
 * SQLite errors are raised internally as std::runtime_error and converted to
 * IoResult at the public methods.
 */
class SqliteRecordStore : public IRecordStore {
public:
    static constexpr int SCHEMA_VERSION = 1;

    /// @param path Database file, or ":memory:"
    explicit SqliteRecordStore(std::string path);
    ~SqliteRecordStore() override;

    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    IoResult open() override;
    void close() override;
    bool isOpen() const override;

    IoResult writeBatch(const WriteBatch& batch) override;
    IoResult loadAll(LoadedRecords& out) override;

    std::optional<std::string> metaValue(const std::string& key);
    IoResult setMetaValue(const std::string& key, const std::string& value);

    const std::string& path() const { return path_; }

private:
    struct StmtDeleter {
        void operator()(sqlite3_stmt* stmt) const;
    };
    using unique_stmt_ptr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    void exec(const char* sql);
    unique_stmt_ptr prepare(const char* sql);
    void step(sqlite3_stmt* stmt);
    void initializeSchema();

    void upsertNode(sqlite3_stmt* stmt, const Node& node);
    void upsertEdge(sqlite3_stmt* stmt, const Edge& edge);

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace canvascore
