#pragma once

/**
 * @file SQLiteStatement.hpp
 * @brief RAII wrapper for an SQLite prepared statement.
 *
 * This file provides a typed interface over sqlite3_stmt: parameter
 * binding, row stepping and column access, with automatic finalization of
 * the native handle and SQLiteException on every native failure.
 */

#include "ErrorHandler.hpp"
#include "SQLiteValue.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nodal {

/// One materialized row: column name -> value. Duplicate names keep the first.
using RowMap = std::map<std::string, Value>;

/**
 * @class SQLiteStatement
 * @brief RAII wrapper for a compiled SQLite statement.
 *
 * SQLiteStatement exclusively owns its sqlite3_stmt handle and borrows the
 * sqlite3 handle of the connection that prepared it. Finalizing a statement
 * never closes the connection. Closing the connection while statements are
 * still alive is a caller error and is not detected here.
 *
 * Cursor states:
 * - before-first: after prepare() or reset(); bindings are retained
 * - on-row:       step() returned true
 * - done:         step() returned false
 * - finalized:    terminal; every accessor throws "Statement has been finalized"
 *
 * Usage:
 * @code
 *   auto stmt = conn.prepare("SELECT id, name FROM users WHERE age > ?");
 *   stmt.bind({18});
 *   while (stmt.step()) {
 *       int64_t id = stmt.columnInt(0);
 *       std::string name = stmt.columnText(1);
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; calls must be serialized with the owning connection.
 */
class SQLiteStatement {
public:
    /**
     * @brief Construct an empty (finalized) statement.
     */
    SQLiteStatement() = default;

    /**
     * @brief Take ownership of a prepared statement.
     * @param stmt Compiled statement handle (owned from now on).
     * @param db Connection handle that compiled @p stmt (borrowed).
     * @param sql Source text, reported in errors.
     */
    SQLiteStatement(sqlite3_stmt* stmt, sqlite3* db, std::string sql);

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteStatement();

    // Non-copyable
    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    // Movable
    SQLiteStatement(SQLiteStatement&& other) noexcept;
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3_stmt handle.
     * @return Raw sqlite3_stmt* pointer (still owned by this object).
     */
    sqlite3_stmt* get() const { return m_stmt; }

    const std::string& sql() const { return m_sql; }

    bool isFinalized() const { return m_stmt == nullptr; }

    // ------------------------------------------------------------------
    // Binding
    // ------------------------------------------------------------------

    /**
     * @brief Bind values to positional parameters 1..N in order.
     * @throws SQLiteException on the first native bind failure. Earlier
     *         slots stay bound; call clearBindings() first for all-or-nothing.
     */
    void bind(const std::vector<Value>& parameters);

    /**
     * @brief Bind values to named parameters.
     * @param parameters Map of parameter name to value. A name without a
     *        ':', '@' or '$' prefix is looked up as ":name".
     * @throws SQLiteException "Unknown parameter name: <name>" if the
     *         statement has no such parameter. Entries already bound by
     *         this call stay bound.
     */
    void bindByName(const std::map<std::string, Value>& parameters);

    /**
     * @brief Number of parameter slots in the statement.
     */
    int parameterCount() const;

    /**
     * @brief 1-based slot of a named parameter, or 0 if it does not exist.
     */
    int parameterIndex(const std::string& name) const;

    // ------------------------------------------------------------------
    // Execution
    // ------------------------------------------------------------------

    /**
     * @brief Step to the next row.
     * @return true when a row is available (SQLITE_ROW), false when the
     *         statement has run to completion (SQLITE_DONE).
     * @throws SQLiteException for any other outcome, carrying the
     *         connection's error message and the statement text.
     */
    bool step();

    /**
     * @brief Rewind to before-first. Bound parameters are retained.
     */
    void reset();

    /**
     * @brief Rewind after a failed step() without raising its error again.
     *
     * sqlite3_reset() repeats the error of the last step(), which has
     * already been thrown to the caller. No-op on a finalized statement.
     */
    void rewind();

    /**
     * @brief Set every parameter slot back to NULL.
     */
    void clearBindings();

    /**
     * @brief Finalize the statement and release resources.
     *
     * Safe to call more than once. Called automatically by the destructor.
     */
    void finalize();

    /**
     * @brief Step through every remaining row.
     * @return One RowMap per row. The statement is left in the done state.
     */
    std::vector<RowMap> queryAll();

    /**
     * @brief Run to completion discarding rows, then reset.
     *
     * For DDL/DML where result rows are irrelevant. The statement is reset
     * on the failure path as well, so it never stays stuck mid-cursor.
     * Current bindings are used as they are.
     */
    void execute();

    /**
     * @brief bind(parameters), then execute().
     */
    void execute(const std::vector<Value>& parameters);

    // ------------------------------------------------------------------
    // Column access
    // ------------------------------------------------------------------

    /**
     * @brief Get the number of columns in the result.
     */
    int columnCount() const;

    /**
     * @brief Get a column name by index.
     * @param index Zero-based column index.
     */
    std::string columnName(int index) const;

    /**
     * @brief All column names, in order.
     */
    std::vector<std::string> columnNames() const;

    /**
     * @brief Storage class of the column value in the current row.
     */
    ColumnType columnType(int index) const;

    int64_t columnInt(int index) const;
    double columnDouble(int index) const;

    /**
     * @brief Column value as text; empty string for NULL.
     */
    std::string columnText(int index) const;

    /**
     * @brief Copy of the column bytes; empty for NULL or zero-length blobs.
     */
    Blob columnBlob(int index) const;

    /**
     * @brief Column value decoded according to its storage class.
     */
    Value columnValue(int index) const;

private:
    void ensureAlive() const;
    void checkColumn(int index) const;
    void checkResult(int rc) const;
    void checkBind(int rc) const;

    sqlite3_stmt* m_stmt = nullptr;  ///< Prepared statement handle (owned)
    sqlite3* m_db = nullptr;         ///< Parent connection handle (borrowed)
    std::string m_sql;               ///< Source SQL text
};

}  // namespace nodal
