#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database connection.
 *
 * This class provides a safe wrapper for SQLite database connections,
 * handling automatic cleanup when the connection goes out of scope and
 * turning every native failure into an SQLiteException.
 */

#include "ErrorHandler.hpp"
#include "SQLiteResultCode.hpp"
#include "SQLiteStatement.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <vector>

namespace nodal {

class SQLiteConnection;

/**
 * @class SQLiteSession
 * @brief Live view of the session counters of a connection.
 *
 * Values are read from the native handle on every call, not snapshotted:
 * running further statements changes what the next read returns. The view
 * refers to its connection by address and must not outlive it (or survive
 * a move of it).
 */
class SQLiteSession {
public:
    explicit SQLiteSession(const SQLiteConnection& connection) : m_connection(&connection) {}

    /**
     * @brief Rowid of the most recent successful INSERT, 0 if none.
     * @throws SQLiteException if the connection is closed.
     */
    int64_t lastInsertRowId() const;

    /**
     * @brief Rows modified by the most recent INSERT, UPDATE or DELETE.
     * @throws SQLiteException if the connection is closed.
     */
    int changes() const;

    bool isOpen() const;

private:
    const SQLiteConnection* m_connection;
};

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for one SQLite database handle.
 *
 * SQLiteConnection exclusively owns its sqlite3 handle; it is movable but
 * not copyable. The handle is closed when the object is destroyed or
 * close() is called. Once closed, every operation throws
 * "Database connection is closed" instead of touching a dangling handle.
 *
 * Open targets follow SQLite's path rules: a filesystem path, ":memory:"
 * for a private in-memory database, or "" for a temporary on-disk file.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn(":memory:");
 *   conn.execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT)");
 *   auto stmt = conn.prepare("INSERT INTO t (name) VALUES (?)");
 *   stmt.execute({"Alice"});
 *   int64_t id = conn.session().lastInsertRowId();
 * @endcode
 *
 * Thread Safety:
 * - No internal locking. A connection and the statements prepared from it
 *   must be used from one thread at a time.
 * - Statements must be finalized before the connection is assumed gone.
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database.
     * @param path Database file path, ":memory:" or "".
     * @param flags sqlite3_open_v2 flags (default ReadWrite | Create).
     * @throws SQLiteException if the database cannot be opened.
     *
     * Extended result codes are enabled on the new handle.
     */
    explicit SQLiteConnection(const std::string& path, OpenFlags flags = kDefaultOpenFlags);

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object), or nullptr
     *         once closed.
     */
    sqlite3* get() const { return m_db; }

    /**
     * @brief Check if the connection is valid and open.
     */
    bool isValid() const { return m_db != nullptr; }

    const std::string& path() const { return m_path; }

    /**
     * @brief Execute one or more SQL statements without parameters.
     * @param sql The SQL text to execute.
     * @throws SQLiteException on the first failing statement.
     *
     * Use this for DDL and parameterless DML. Result rows are discarded.
     */
    void execute(const std::string& sql);

    /**
     * @brief Compile the first statement of @p sql.
     * @throws SQLiteException if the SQL is malformed or contains no statement.
     *
     * The returned statement borrows this connection and must be finalized
     * (or destroyed) before the connection is closed.
     */
    SQLiteStatement prepare(const std::string& sql);

    /**
     * @brief Compile @p sql, which must hold exactly one statement.
     * @throws SQLiteException "SQL text contains more than one statement" if
     *         anything but whitespace or comments follows the first statement.
     */
    SQLiteStatement prepareSingle(const std::string& sql);

    /**
     * @brief Prepare, collect every row, finalize.
     *
     * The statement is finalized even if stepping fails.
     */
    std::vector<RowMap> query(const std::string& sql);

    /**
     * @brief Live session counters (last insert rowid, changes).
     */
    SQLiteSession session() const { return SQLiteSession(*this); }

    /**
     * @brief Get the rowid of the last inserted row.
     * @throws SQLiteException if the connection is closed.
     */
    int64_t lastInsertRowId() const;

    /**
     * @brief Get the number of rows changed by the last statement.
     * @throws SQLiteException if the connection is closed.
     */
    int changes() const;

    /**
     * @brief Close the connection.
     *
     * Idempotent: closing a closed connection does nothing. If the native
     * close fails the connection is still marked closed (the handle is not
     * retried) and the failure is thrown.
     */
    void close();

private:
    void ensureOpen() const;

    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
};

}  // namespace nodal
