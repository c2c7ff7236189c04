#include "tessera/db/db.hpp"
#include "tessera/core/log.hpp"
#include <sqlite3.h>
#include <cstring>
#include <cstdlib>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tessera::db {

using namespace tessera::core;

// Open connections, keyed by handle id
namespace {
    struct Connection {
        sqlite3* db = nullptr;
        std::mutex mutex;
    };

    struct DbRegistry {
        std::map<u32, std::shared_ptr<Connection>> open;
        u32 next_id = 1;
        std::mutex mutex;
    };

    DbRegistry g_registry;

    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS layer_attributes (
            layer_name TEXT NOT NULL,
            layer_zoom INTEGER NOT NULL,
            name TEXT NOT NULL,
            value BLOB NOT NULL,
            checksum BLOB NOT NULL,
            updated_at INTEGER NOT NULL,
            PRIMARY KEY (layer_name, layer_zoom, name)
        );
    )SQL";

    [[nodiscard]] std::shared_ptr<Connection> lookup(DbHandle db) noexcept {
        std::lock_guard<std::mutex> lock(g_registry.mutex);
        auto it = g_registry.open.find(db.id);
        if (it == g_registry.open.end()) {
            return nullptr;
        }
        return it->second;
    }

    [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept {
        if (!db || !sql) return false;
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (err_msg) {
            log_write(LogLevel::Debug, "db: %s: %s", sql, err_msg);
            sqlite3_free(err_msg);
        }
        return rc == SQLITE_OK;
    }

    [[nodiscard]] Status sqlite_status(int rc) noexcept {
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return make_status(StatusDomain::Db, StatusCode::Busy, static_cast<u32>(rc));
            case SQLITE_CORRUPT:
            case SQLITE_NOTADB:
                return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(rc));
            case SQLITE_IOERR:
            case SQLITE_FULL:
            case SQLITE_CANTOPEN:
                return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
            default:
                return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
        }
    }

    void bind_layer(sqlite3_stmt* stmt, const LayerId& layer) noexcept {
        sqlite3_bind_text(stmt, 1, layer.name.c_str(), static_cast<int>(layer.name.size()), SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(layer.zoom));
    }
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto conn = std::make_shared<Connection>();

    const char* path = cfg.path ? cfg.path : ":memory:";
    int rc = sqlite3_open_v2(path, &conn->db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        log_write(LogLevel::Error, "db: cannot open %s: %s", path,
                  conn->db ? sqlite3_errmsg(conn->db) : sqlite3_errstr(rc));
        sqlite3_close(conn->db);
        return sqlite_status(rc);
    }

    if (cfg.busy_timeout_ms > 0) {
        sqlite3_busy_timeout(conn->db, static_cast<int>(cfg.busy_timeout_ms));
    }

    // WAL lets catalog readers proceed while a writer commits (configurable).
    const char* journal_mode = std::getenv("TESSERA_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    if (!exec_sql(conn->db, journal_sql.c_str())) {
        // In-memory databases reject WAL; keep going with the default journal.
        log_write(LogLevel::Debug, "db: journal_mode=%s not applied for %s", journal_mode, path);
    }

    (void)exec_sql(conn->db, "PRAGMA synchronous=NORMAL");
    (void)exec_sql(conn->db, "PRAGMA temp_store=MEMORY");

    if (!exec_sql(conn->db, kSchemaSQL)) {
        log_write(LogLevel::Error, "db: schema setup failed for %s: %s", path, sqlite3_errmsg(conn->db));
        sqlite3_close(conn->db);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    std::lock_guard<std::mutex> lock(g_registry.mutex);
    const u32 id = g_registry.next_id++;
    g_registry.open.emplace(id, std::move(conn));
    out->id = id;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(g_registry.mutex);
        auto it = g_registry.open.find(db.id);
        if (it == g_registry.open.end()) {
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }
        conn = std::move(it->second);
        g_registry.open.erase(it);
    }

    // Wait for in-flight statements on this connection.
    std::lock_guard<std::mutex> lock(conn->mutex);
    sqlite3_close(conn->db);
    conn->db = nullptr;
    return ok_status();
}

// ============================================================================
// Layer Attributes
// ============================================================================

Status db_attr_put_all(DbHandle db, const LayerId& layer, const std::vector<AttributeRow>& rows) noexcept {
    auto conn = lookup(db);
    if (!conn || layer.name.empty() || rows.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(conn->mutex);

    if (!exec_sql(conn->db, "BEGIN IMMEDIATE TRANSACTION")) {
        return sqlite_status(sqlite3_extended_errcode(conn->db));
    }

    auto rollback = [&](Status s) {
        log_write(LogLevel::Debug, "db: attribute write for %s/%u rolled back: %s",
                  layer.name.c_str(), layer.zoom, sqlite3_errmsg(conn->db));
        (void)exec_sql(conn->db, "ROLLBACK");
        return s;
    };

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn->db,
                                "DELETE FROM layer_attributes WHERE layer_name = ? AND layer_zoom = ?",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return rollback(sqlite_status(rc));
    }
    bind_layer(stmt, layer);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return rollback(sqlite_status(rc));
    }

    rc = sqlite3_prepare_v2(conn->db,
                            "INSERT INTO layer_attributes (layer_name, layer_zoom, name, value, checksum, updated_at) "
                            "VALUES (?, ?, ?, ?, ?, ?)",
                            -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return rollback(sqlite_status(rc));
    }

    const sqlite3_int64 now = static_cast<sqlite3_int64>(std::time(nullptr));
    for (const AttributeRow& row : rows) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        bind_layer(stmt, layer);
        sqlite3_bind_text(stmt, 3, row.name.c_str(), static_cast<int>(row.name.size()), SQLITE_STATIC);
        if (row.value.empty()) {
            sqlite3_bind_zeroblob(stmt, 4, 0);  // a NULL blob would trip NOT NULL
        } else {
            sqlite3_bind_blob(stmt, 4, row.value.data(), static_cast<int>(row.value.size()), SQLITE_STATIC);
        }
        sqlite3_bind_blob(stmt, 5, row.checksum.b.data(), static_cast<int>(row.checksum.b.size()), SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 6, now);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return rollback(rc == SQLITE_CONSTRAINT ? make_status(StatusDomain::Db, StatusCode::Conflict)
                                                    : sqlite_status(rc));
        }
    }
    sqlite3_finalize(stmt);

    if (!exec_sql(conn->db, "COMMIT")) {
        return rollback(sqlite_status(sqlite3_extended_errcode(conn->db)));
    }
    return ok_status();
}

Status db_attr_get_all(DbHandle db, const LayerId& layer, std::vector<AttributeRow>* out) noexcept {
    auto conn = lookup(db);
    if (!conn || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();

    std::lock_guard<std::mutex> lock(conn->mutex);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn->db,
                                "SELECT name, value, checksum FROM layer_attributes "
                                "WHERE layer_name = ? AND layer_zoom = ? ORDER BY name",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }
    bind_layer(stmt, layer);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        AttributeRow row;
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        row.name = name ? name : "";

        const u8* value = static_cast<const u8*>(sqlite3_column_blob(stmt, 1));
        const int value_len = sqlite3_column_bytes(stmt, 1);
        if (value && value_len > 0) {
            row.value.assign(value, value + value_len);
        }

        const u8* checksum = static_cast<const u8*>(sqlite3_column_blob(stmt, 2));
        const int checksum_len = sqlite3_column_bytes(stmt, 2);
        if (checksum && checksum_len == static_cast<int>(row.checksum.b.size())) {
            std::memcpy(row.checksum.b.data(), checksum, row.checksum.b.size());
        }

        out->push_back(std::move(row));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        out->clear();
        return sqlite_status(rc);
    }
    if (out->empty()) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return ok_status();
}

Status db_attr_delete_all(DbHandle db, const LayerId& layer) noexcept {
    auto conn = lookup(db);
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(conn->mutex);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn->db,
                                "DELETE FROM layer_attributes WHERE layer_name = ? AND layer_zoom = ?",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }
    bind_layer(stmt, layer);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_status(rc);
    }
    if (sqlite3_changes(conn->db) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return ok_status();
}

Status db_layer_exists(DbHandle db, const LayerId& layer, bool* out) noexcept {
    auto conn = lookup(db);
    if (!conn || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(conn->mutex);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn->db,
                                "SELECT 1 FROM layer_attributes WHERE layer_name = ? AND layer_zoom = ? LIMIT 1",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }
    bind_layer(stmt, layer);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return sqlite_status(rc);
    }
    *out = (rc == SQLITE_ROW);
    return ok_status();
}

Status db_layer_list(DbHandle db, std::vector<LayerId>* out) noexcept {
    auto conn = lookup(db);
    if (!conn || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();

    std::lock_guard<std::mutex> lock(conn->mutex);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(conn->db,
                                "SELECT DISTINCT layer_name, layer_zoom FROM layer_attributes "
                                "ORDER BY layer_name, layer_zoom",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_status(rc);
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        LayerId id;
        id.name = name ? name : "";
        id.zoom = static_cast<u32>(sqlite3_column_int64(stmt, 1));
        out->push_back(std::move(id));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        out->clear();
        return sqlite_status(rc);
    }
    return ok_status();
}

} // namespace tessera::db
