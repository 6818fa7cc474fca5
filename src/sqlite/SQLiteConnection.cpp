/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 *
 * Implements the SQLiteConnection class which provides a safe wrapper around
 * sqlite3 database handles with automatic resource management.
 */

#include "SQLiteConnection.hpp"
#include <spdlog/spdlog.h>

namespace nodal {

// ============================================================================
// Session
// ============================================================================

int64_t SQLiteSession::lastInsertRowId() const {
    return m_connection->lastInsertRowId();
}

int SQLiteSession::changes() const {
    return m_connection->changes();
}

bool SQLiteSession::isOpen() const {
    return m_connection->isValid();
}

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& path, OpenFlags flags) : m_path(path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, static_cast<int>(flags), nullptr);
    if (rc != SQLITE_OK) {
        // Even on error, SQLite may allocate a handle that carries the message
        if (db) {
            SQLiteException error = ErrorHandler::fromConnection(db, rc);
            sqlite3_close_v2(db);
            spdlog::debug("Failed to open SQLite database '{}': {}", path, error.message());
            throw error;
        }
        spdlog::debug("Failed to open SQLite database '{}': no handle allocated", path);
        throw SQLiteException("Failed to open database", rc, std::nullopt,
                              ErrorHandler::getErrorMessage(rc));
    }

    m_db = db;
    sqlite3_extended_result_codes(m_db, 1);
    spdlog::debug("Opened SQLite database '{}'", path);
}

SQLiteConnection::~SQLiteConnection() {
    // Close database handle if open
    if (m_db) {
        int rc = sqlite3_close_v2(m_db);
        if (rc != SQLITE_OK) {
            spdlog::warn("Closing SQLite database '{}' failed: {}", m_path,
                         ErrorHandler::getErrorMessage(rc));
        }
    }
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db), m_path(std::move(other.m_path)) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close_v2(m_db);
        }
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        other.m_db = nullptr;
    }
    return *this;
}

void SQLiteConnection::ensureOpen() const {
    if (!m_db) {
        throw SQLiteException("Database connection is closed");
    }
}

// ============================================================================
// Query Execution
// ============================================================================

void SQLiteConnection::execute(const std::string& sql) {
    ensureOpen();
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "sqlite3_exec failed";
        if (errMsg) sqlite3_free(errMsg);

        std::optional<std::string> explanation;
        std::string generic = ErrorHandler::getErrorMessage(rc);
        if (generic != message) {
            explanation = generic;
        }
        throw SQLiteException(message, rc, sql, explanation);
    }
}

SQLiteStatement SQLiteConnection::prepare(const std::string& sql) {
    ensureOpen();
    // Compile SQL into a prepared statement for execution
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        // SQLite leaves stmt null on failure; nothing to finalize
        throw ErrorHandler::fromConnection(m_db, rc, sql);
    }
    if (!stmt) {
        // Empty input or only comments/whitespace
        throw SQLiteException("SQL text contains no statement", std::nullopt, sql);
    }
    spdlog::trace("Prepared statement: {}", sql);
    return SQLiteStatement(stmt, m_db, sql);
}

SQLiteStatement SQLiteConnection::prepareSingle(const std::string& sql) {
    ensureOpen();
    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
        throw ErrorHandler::fromConnection(m_db, rc, sql);
    }
    if (!stmt) {
        throw SQLiteException("SQL text contains no statement", std::nullopt, sql);
    }
    SQLiteStatement first(stmt, m_db, sql);

    if (tail && *tail) {
        // Compile the remainder only to see whether it holds a statement
        sqlite3_stmt* next = nullptr;
        rc = sqlite3_prepare_v2(m_db, tail, -1, &next, nullptr);
        if (rc != SQLITE_OK) {
            throw ErrorHandler::fromConnection(m_db, rc, sql);
        }
        if (next) {
            sqlite3_finalize(next);
            throw SQLiteException("SQL text contains more than one statement", std::nullopt, sql);
        }
    }
    spdlog::trace("Prepared statement: {}", sql);
    return first;
}

std::vector<RowMap> SQLiteConnection::query(const std::string& sql) {
    // The statement finalizes on scope exit, including when queryAll throws
    SQLiteStatement stmt = prepare(sql);
    return stmt.queryAll();
}

// ============================================================================
// Session Information
// ============================================================================

int64_t SQLiteConnection::lastInsertRowId() const {
    ensureOpen();
    return sqlite3_last_insert_rowid(m_db);
}

int SQLiteConnection::changes() const {
    ensureOpen();
    return sqlite3_changes(m_db);
}

// ============================================================================
// Shutdown
// ============================================================================

void SQLiteConnection::close() {
    if (!m_db) return;

    // Marked closed before the native call: a failed close is terminal
    sqlite3* db = m_db;
    m_db = nullptr;

    int rc = sqlite3_close_v2(db);
    if (rc != SQLITE_OK) {
        spdlog::warn("Closing SQLite database '{}' failed: {}", m_path,
                     ErrorHandler::getErrorMessage(rc));
        throw SQLiteException("Failed to close database", rc, std::nullopt,
                              ErrorHandler::getErrorMessage(rc));
    }
    spdlog::debug("Closed SQLite database '{}'", m_path);
}

}  // namespace nodal
