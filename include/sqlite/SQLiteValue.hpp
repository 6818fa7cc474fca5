#pragma once

/**
 * @file SQLiteValue.hpp
 * @brief Marshaling of Value to and from SQLite statements.
 *
 * bindValue() and readColumn() are the only places where values cross the
 * native boundary. Both dispatch exhaustively over the Value storage
 * classes, so there is no runtime "unsupported type" branch here.
 */

#include "Value.hpp"
#include <sqlite3.h>

namespace nodal {

/**
 * @brief Bind a value to a 1-based parameter slot.
 * @param stmt Prepared statement (not owned).
 * @param index 1-based parameter index.
 * @param value Value to bind.
 * @return The sqlite3_bind_* result code; caller translates failures.
 *
 * TEXT and BLOB are bound with SQLITE_TRANSIENT so SQLite copies the bytes
 * before this call returns. An empty Blob binds as a zero-length BLOB, not
 * as NULL.
 */
int bindValue(sqlite3_stmt* stmt, int index, const Value& value);

/**
 * @brief Decode the column at @p index of the current row.
 * @param stmt Prepared statement positioned on a row (not owned).
 * @param index 0-based column index.
 * @return Value owning a copy of any text or blob bytes.
 *
 * Native column buffers are invalidated by the next step/reset/finalize,
 * so text and blob contents are always copied out.
 */
Value readColumn(sqlite3_stmt* stmt, int index);

}  // namespace nodal
