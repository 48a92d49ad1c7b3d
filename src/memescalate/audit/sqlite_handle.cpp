/**
 * @file sqlite_handle.cpp
 */
#include "memescalate/audit/sqlite_handle.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

namespace memescalate
{

// ============================================================================
// SqliteDatabase
// ============================================================================

SqliteDatabase::SqliteDatabase(const std::string& path)
    : m_path(path)
{
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(
        path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    m_db.reset(raw);
    if (rc != SQLITE_OK)
    {
        std::string message = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        throw EscalationError(EscalationErrorCode::AuditWrite,
            "Cannot open database " + path + ": " + message);
    }
    sqlite3_busy_timeout(raw, 5000);
}

void SqliteDatabase::execute(const std::string& sql)
{
    char* error = nullptr;
    int rc = sqlite3_exec(m_db.get(), sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK)
    {
        std::string message = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        throw EscalationError(EscalationErrorCode::AuditWrite,
            "Database " + m_path + ": " + message);
    }
}

int64_t SqliteDatabase::last_insert_rowid() const noexcept
{
    return sqlite3_last_insert_rowid(m_db.get());
}

// ============================================================================
// SqliteStatement
// ============================================================================

SqliteStatement::SqliteStatement(SqliteDatabase& db, const std::string& sql)
    : m_db(db)
{
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw, nullptr);
    m_stmt.reset(raw);
    if (rc != SQLITE_OK)
    {
        fail("prepare");
    }
}

void SqliteStatement::fail(const char* step) const
{
    throw EscalationError(EscalationErrorCode::AuditWrite,
        std::string("Database ") + m_db.path() + ": " + step + " failed: " +
        sqlite3_errmsg(m_db.get()));
}

SqliteStatement& SqliteStatement::bind(int index, const std::string& value)
{
    if (sqlite3_bind_text(m_stmt.get(), index, value.c_str(), static_cast<int>(value.size()),
            SQLITE_TRANSIENT) != SQLITE_OK)
    {
        fail("bind");
    }
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, int64_t value)
{
    if (sqlite3_bind_int64(m_stmt.get(), index, value) != SQLITE_OK)
    {
        fail("bind");
    }
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, const std::optional<size_t>& value)
{
    if (!value)
    {
        return bind_null(index);
    }
    return bind(index, static_cast<int64_t>(*value));
}

SqliteStatement& SqliteStatement::bind_null(int index)
{
    if (sqlite3_bind_null(m_stmt.get(), index) != SQLITE_OK)
    {
        fail("bind");
    }
    return *this;
}

bool SqliteStatement::step()
{
    int rc = sqlite3_step(m_stmt.get());
    if (rc == SQLITE_ROW)
    {
        return true;
    }
    if (rc == SQLITE_DONE)
    {
        return false;
    }
    fail("step");
}

void SqliteStatement::run()
{
    while (step())
    {
    }
    reset();
}

void SqliteStatement::reset()
{
    sqlite3_reset(m_stmt.get());
    sqlite3_clear_bindings(m_stmt.get());
}

std::string SqliteStatement::column_text(int column) const
{
    const unsigned char* text = sqlite3_column_text(m_stmt.get(), column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

int64_t SqliteStatement::column_int(int column) const
{
    return sqlite3_column_int64(m_stmt.get(), column);
}

bool SqliteStatement::column_is_null(int column) const
{
    return sqlite3_column_type(m_stmt.get(), column) == SQLITE_NULL;
}

// ============================================================================
// SqliteTransaction
// ============================================================================

SqliteTransaction::SqliteTransaction(SqliteDatabase& db)
    : m_db(db)
{
    m_db.execute("BEGIN");
}

SqliteTransaction::~SqliteTransaction()
{
    if (m_done)
    {
        return;
    }
    // Best-effort rollback; an error here leaves SQLite to roll back on close
    sqlite3_exec(m_db.get(), "ROLLBACK", nullptr, nullptr, nullptr);
}

void SqliteTransaction::commit()
{
    m_db.execute("COMMIT");
    m_done = true;
}

} // namespace memescalate
