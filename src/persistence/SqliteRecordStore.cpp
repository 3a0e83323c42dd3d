#include "canvascore/persistence/SqliteRecordStore.h"
#include "canvascore/common/Logger.h"

#include <sqlite3.h>

#include <stdexcept>

namespace canvascore {

namespace {

const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS nodes (
        id INTEGER PRIMARY KEY,
        x REAL NOT NULL,
        y REAL NOT NULL,
        width REAL NOT NULL,
        height REAL NOT NULL,
        kind TEXT NOT NULL,
        payload TEXT NOT NULL,
        color TEXT,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS edges (
        id INTEGER PRIMARY KEY,
        source_id INTEGER NOT NULL,
        target_id INTEGER NOT NULL,
        color TEXT,
        created_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_edges_source ON edges(source_id);
    CREATE INDEX IF NOT EXISTS idx_edges_target ON edges(target_id);

    CREATE TABLE IF NOT EXISTS meta (
        key TEXT PRIMARY KEY NOT NULL,
        value TEXT
    );
)";

const char* kUpsertNode =
    "INSERT OR REPLACE INTO nodes "
    "(id, x, y, width, height, kind, payload, color, created_at, updated_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

const char* kUpsertEdge =
    "INSERT OR REPLACE INTO edges (id, source_id, target_id, color, created_at) "
    "VALUES (?, ?, ?, ?, ?)";

void bindText(sqlite3_stmt* stmt, int index, const std::string& text) {
    sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& text) {
    if (text) {
        bindText(stmt, index, *text);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string columnText(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, index)));
}

std::optional<std::string> columnOptionalText(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, index);
}

}  // namespace

void SqliteRecordStore::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

SqliteRecordStore::SqliteRecordStore(std::string path)
    : path_(std::move(path)) {
}

SqliteRecordStore::~SqliteRecordStore() {
    close();
}

// =============================================================================
// Connection
// =============================================================================

IoResult SqliteRecordStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return IoResult::success();
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string message = "database connection failed: ";
        if (db_) {
            message += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            message += "could not allocate database handle";
        }
        LOG_ERROR("{} ({})", message, path_);
        return IoResult::fail(IoErrorCode::OpenFailed, message);
    }

    try {
        initializeSchema();
    } catch (const std::runtime_error& e) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("schema setup failed for {}: {}", path_, e.what());
        return IoResult::fail(IoErrorCode::OpenFailed, e.what());
    }

    LOG_INFO("opened {}", path_);
    return IoResult::success();
}

void SqliteRecordStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteRecordStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void SqliteRecordStore::initializeSchema() {
    exec(kSchema);
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");

    auto stmt = prepare("INSERT OR IGNORE INTO meta (key, value) VALUES ('schema_version', ?)");
    bindText(stmt.get(), 1, std::to_string(SCHEMA_VERSION));
    step(stmt.get());
}

// =============================================================================
// Statement helpers
// =============================================================================

void SqliteRecordStore::exec(const char* sql) {
    char* errorText = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errorText) != SQLITE_OK) {
        std::string message = "SQL error: ";
        if (errorText) {
            message += errorText;
            sqlite3_free(errorText);
        } else {
            message += sqlite3_errmsg(db_);
        }
        throw std::runtime_error(message);
    }
}

SqliteRecordStore::unique_stmt_ptr SqliteRecordStore::prepare(const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        std::string message = "failed to prepare statement: ";
        message += sqlite3_errmsg(db_);
        if (raw) {
            sqlite3_finalize(raw);
        }
        throw std::runtime_error(message);
    }
    return unique_stmt_ptr(raw);
}

void SqliteRecordStore::step(sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        std::string message = "failed to execute statement: ";
        message += sqlite3_errmsg(db_);
        throw std::runtime_error(message);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

void SqliteRecordStore::upsertNode(sqlite3_stmt* stmt, const Node& node) {
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(node.id));
    sqlite3_bind_double(stmt, 2, node.position.x);
    sqlite3_bind_double(stmt, 3, node.position.y);
    sqlite3_bind_double(stmt, 4, node.size.width);
    sqlite3_bind_double(stmt, 5, node.size.height);
    bindText(stmt, 6, node.content.kind);
    bindText(stmt, 7, node.content.payload);
    bindOptionalText(stmt, 8, node.color);
    sqlite3_bind_int64(stmt, 9, node.createdAt);
    sqlite3_bind_int64(stmt, 10, node.updatedAt);
    step(stmt);
}

void SqliteRecordStore::upsertEdge(sqlite3_stmt* stmt, const Edge& edge) {
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(edge.id));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(edge.source));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(edge.target));
    bindOptionalText(stmt, 4, edge.color);
    sqlite3_bind_int64(stmt, 5, edge.createdAt);
    step(stmt);
}

// =============================================================================
// Records
// =============================================================================

IoResult SqliteRecordStore::writeBatch(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return IoResult::fail(IoErrorCode::Closed, "database is not open");
    }
    if (batch.empty()) {
        return IoResult::success();
    }

    try {
        exec("BEGIN IMMEDIATE");
    } catch (const std::runtime_error& e) {
        return IoResult::fail(IoErrorCode::TransactionFailed, e.what());
    }

    try {
        if (!batch.edgeDeletes.empty()) {
            auto stmt = prepare("DELETE FROM edges WHERE id = ?");
            for (EdgeId id : batch.edgeDeletes) {
                sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id));
                step(stmt.get());
            }
        }
        if (!batch.nodeDeletes.empty()) {
            auto stmt = prepare("DELETE FROM nodes WHERE id = ?");
            for (NodeId id : batch.nodeDeletes) {
                sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id));
                step(stmt.get());
            }
        }
        if (!batch.nodeUpserts.empty()) {
            auto stmt = prepare(kUpsertNode);
            for (const auto& node : batch.nodeUpserts) {
                upsertNode(stmt.get(), node);
            }
        }
        if (!batch.edgeUpserts.empty()) {
            auto stmt = prepare(kUpsertEdge);
            for (const auto& edge : batch.edgeUpserts) {
                upsertEdge(stmt.get(), edge);
            }
        }
        exec("COMMIT");
    } catch (const std::runtime_error& e) {
        std::string message = e.what();
        try {
            exec("ROLLBACK");
        } catch (const std::runtime_error& rollbackError) {
            message += std::string("; rollback failed: ") + rollbackError.what();
        }
        return IoResult::fail(IoErrorCode::TransactionFailed, message);
    }

    return IoResult::success();
}

IoResult SqliteRecordStore::loadAll(LoadedRecords& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return IoResult::fail(IoErrorCode::Closed, "database is not open");
    }

    out.nodes.clear();
    out.edges.clear();

    try {
        auto nodeStmt = prepare(
            "SELECT id, x, y, width, height, kind, payload, color, created_at, updated_at "
            "FROM nodes ORDER BY id");
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(nodeStmt.get())) == SQLITE_ROW) {
            Node node;
            node.id = static_cast<NodeId>(sqlite3_column_int64(nodeStmt.get(), 0));
            node.position = {static_cast<float>(sqlite3_column_double(nodeStmt.get(), 1)),
                             static_cast<float>(sqlite3_column_double(nodeStmt.get(), 2))};
            node.size = {static_cast<float>(sqlite3_column_double(nodeStmt.get(), 3)),
                         static_cast<float>(sqlite3_column_double(nodeStmt.get(), 4))};
            node.content.kind = columnText(nodeStmt.get(), 5);
            node.content.payload = columnText(nodeStmt.get(), 6);
            node.color = columnOptionalText(nodeStmt.get(), 7);
            node.createdAt = sqlite3_column_int64(nodeStmt.get(), 8);
            node.updatedAt = sqlite3_column_int64(nodeStmt.get(), 9);
            out.nodes.push_back(std::move(node));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("reading nodes failed: ") + sqlite3_errmsg(db_));
        }

        auto edgeStmt = prepare(
            "SELECT id, source_id, target_id, color, created_at FROM edges ORDER BY id");
        while ((rc = sqlite3_step(edgeStmt.get())) == SQLITE_ROW) {
            Edge edge;
            edge.id = static_cast<EdgeId>(sqlite3_column_int64(edgeStmt.get(), 0));
            edge.source = static_cast<NodeId>(sqlite3_column_int64(edgeStmt.get(), 1));
            edge.target = static_cast<NodeId>(sqlite3_column_int64(edgeStmt.get(), 2));
            edge.color = columnOptionalText(edgeStmt.get(), 3);
            edge.createdAt = sqlite3_column_int64(edgeStmt.get(), 4);
            out.edges.push_back(std::move(edge));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("reading edges failed: ") + sqlite3_errmsg(db_));
        }
    } catch (const std::runtime_error& e) {
        out.nodes.clear();
        out.edges.clear();
        return IoResult::fail(IoErrorCode::QueryFailed, e.what());
    }

    LOG_DEBUG("read {} nodes, {} edges from {}", out.nodes.size(), out.edges.size(), path_);
    return IoResult::success();
}

std::optional<std::string> SqliteRecordStore::metaValue(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    try {
        auto stmt = prepare("SELECT value FROM meta WHERE key = ?");
        bindText(stmt.get(), 1, key);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            return columnOptionalText(stmt.get(), 0);
        }
    } catch (const std::runtime_error& e) {
        LOG_WARN("meta lookup '{}' failed: {}", key, e.what());
    }
    return std::nullopt;
}

IoResult SqliteRecordStore::setMetaValue(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return IoResult::fail(IoErrorCode::Closed, "database is not open");
    }
    try {
        auto stmt = prepare("INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)");
        bindText(stmt.get(), 1, key);
        bindText(stmt.get(), 2, value);
        step(stmt.get());
    } catch (const std::runtime_error& e) {
        return IoResult::fail(IoErrorCode::QueryFailed, e.what());
    }
    return IoResult::success();
}

}  // namespace canvascore
