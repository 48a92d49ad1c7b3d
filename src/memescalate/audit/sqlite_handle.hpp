/**
 * @file sqlite_handle.hpp
 * @brief RAII wrappers over the SQLite3 C API.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include <sqlite3.h>

namespace memescalate
{

/**
 * @brief Owning handle of an open database connection.
 *
 * @details
 * All failures throw EscalationError with `AuditWrite`; the audit store decides whether to
 * swallow them.
 */
class SqliteDatabase
{
public:
    /**
     * @brief Open (creating if needed) a database file.
     * @throw EscalationError with `AuditWrite` if it cannot be opened.
     */
    explicit SqliteDatabase(const std::string& path);

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    /**
     * @brief Run one or more statements without results.
     */
    void execute(const std::string& sql);

    sqlite3* get() const noexcept
    {
        return m_db.get();
    }

    const std::string& path() const noexcept
    {
        return m_path;
    }

    /**
     * @brief Rowid of the last inserted row.
     */
    int64_t last_insert_rowid() const noexcept;

private:
    struct Closer
    {
        void operator()(sqlite3* db) const noexcept
        {
            sqlite3_close(db);
        }
    };

    std::string m_path;
    std::unique_ptr<sqlite3, Closer> m_db;
};

/**
 * @brief A prepared statement. Bind indices are 1-based; column indices are 0-based.
 */
class SqliteStatement
{
public:
    SqliteStatement(SqliteDatabase& db, const std::string& sql);

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    SqliteStatement& bind(int index, const std::string& value);
    SqliteStatement& bind(int index, int64_t value);
    SqliteStatement& bind(int index, const std::optional<size_t>& value);
    SqliteStatement& bind_null(int index);

    /**
     * @brief Advance to the next row.
     * @return True if a row is available, false when done.
     */
    bool step();

    /**
     * @brief Step through a statement that returns no rows, then reset it for reuse.
     */
    void run();

    void reset();

    std::string column_text(int column) const;
    int64_t column_int(int column) const;
    bool column_is_null(int column) const;

private:
    struct Finalizer
    {
        void operator()(sqlite3_stmt* stmt) const noexcept
        {
            sqlite3_finalize(stmt);
        }
    };

    [[noreturn]] void fail(const char* step) const;

    SqliteDatabase& m_db;
    std::unique_ptr<sqlite3_stmt, Finalizer> m_stmt;
};

/**
 * @brief Transaction that rolls back unless committed.
 */
class SqliteTransaction
{
public:
    explicit SqliteTransaction(SqliteDatabase& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteDatabase& m_db;
    bool m_done{false};
};

} // namespace memescalate
