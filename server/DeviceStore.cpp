#include "DeviceStore.hpp"
#include "../common/Log.hpp"

namespace net_watch::server
{
    namespace
    {
        std::string ColumnText(sqlite3_stmt *stmt, int column)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
            return text ? std::string(text) : std::string();
        }
    }

    SqliteDeviceStore::SqliteDeviceStore(const std::string &db_path) : db_(nullptr), fresh_(false)
    {
        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw StorageError("Open of '" + db_path + "' failed: " + message);
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        sqlite3_stmt *stmt = nullptr;
        const char *exists_sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'devices';";
        if (sqlite3_prepare_v2(db_, exists_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
            throw StorageError("Schema probe failed: " + message);
        }
        fresh_ = (sqlite3_step(stmt) != SQLITE_ROW);
        sqlite3_finalize(stmt);

        // id is nullable: rows written by other tools may lack one and are
        // repaired on load.
        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS devices ("
            "position INTEGER PRIMARY KEY, "
            "id TEXT, "
            "name TEXT NOT NULL DEFAULT '', "
            "ip TEXT NOT NULL DEFAULT ''"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::string message = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            sqlite3_close(db_);
            db_ = nullptr;
            throw StorageError("Schema error: " + message);
        }

        if (fresh_)
            common::LogInfo("Store", "Created device table in " + db_path);
    }

    SqliteDeviceStore::~SqliteDeviceStore()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteDeviceStore::Execute(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::string message = err_msg ? err_msg : sqlite3_errmsg(db_);
            sqlite3_free(err_msg);
            throw StorageError(std::string(sql) + " failed: " + message);
        }
    }

    common::DeviceList SqliteDeviceStore::Load()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        common::DeviceList devices;

        const char *sql = "SELECT id, name, ip FROM devices ORDER BY position;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            throw StorageError(std::string("Load failed: ") + sqlite3_errmsg(db_));

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            common::Device d;
            d.id = ColumnText(stmt, 0);
            d.name = ColumnText(stmt, 1);
            d.ip = ColumnText(stmt, 2);
            devices.push_back(d);
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            throw StorageError(std::string("Load failed: ") + sqlite3_errmsg(db_));

        return devices;
    }

    void SqliteDeviceStore::Save(const common::DeviceList &devices)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Execute("BEGIN IMMEDIATE;");
        sqlite3_stmt *stmt = nullptr;
        try
        {
            Execute("DELETE FROM devices;");

            const char *sql = "INSERT INTO devices (position, id, name, ip) VALUES (?, ?, ?, ?);";
            if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
                throw StorageError(std::string("Save failed: ") + sqlite3_errmsg(db_));

            for (size_t i = 0; i < devices.size(); ++i)
            {
                const auto &d = devices[i];
                sqlite3_reset(stmt);
                sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(i));
                if (d.id.empty())
                    sqlite3_bind_null(stmt, 2);
                else
                    sqlite3_bind_text(stmt, 2, d.id.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 3, d.name.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 4, d.ip.c_str(), -1, SQLITE_TRANSIENT);

                if (sqlite3_step(stmt) != SQLITE_DONE)
                    throw StorageError(std::string("Save failed: ") + sqlite3_errmsg(db_));
            }
            sqlite3_finalize(stmt);
            stmt = nullptr;

            Execute("COMMIT;");
        }
        catch (...)
        {
            // Whatever went wrong, the transaction must not stay open.
            sqlite3_finalize(stmt);
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }
    }
}
