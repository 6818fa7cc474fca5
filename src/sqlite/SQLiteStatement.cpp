/**
 * @file SQLiteStatement.cpp
 * @brief Implementation of the RAII SQLite prepared statement wrapper.
 *
 * Every native call is checked; anything other than the expected outcome
 * is turned into an SQLiteException carrying the connection's error
 * message and the statement text.
 */

#include "SQLiteStatement.hpp"
#include <spdlog/spdlog.h>

namespace nodal {

namespace {

bool hasParameterPrefix(const std::string& name) {
    return !name.empty() && (name[0] == ':' || name[0] == '@' || name[0] == '$');
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteStatement::SQLiteStatement(sqlite3_stmt* stmt, sqlite3* db, std::string sql)
    : m_stmt(stmt), m_db(db), m_sql(std::move(sql)) {}

SQLiteStatement::~SQLiteStatement() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept
    : m_stmt(other.m_stmt), m_db(other.m_db), m_sql(std::move(other.m_sql)) {
    other.m_stmt = nullptr;
    other.m_db = nullptr;
}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        m_db = other.m_db;
        m_sql = std::move(other.m_sql);
        other.m_stmt = nullptr;
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Checks
// ============================================================================

void SQLiteStatement::ensureAlive() const {
    if (!m_stmt) {
        throw SQLiteException("Statement has been finalized", std::nullopt, m_sql);
    }
}

void SQLiteStatement::checkColumn(int index) const {
    ensureAlive();
    if (index < 0 || index >= sqlite3_column_count(m_stmt)) {
        throw SQLiteException("Column index out of range: " + std::to_string(index),
                              SQLITE_RANGE, m_sql);
    }
}

void SQLiteStatement::checkResult(int rc) const {
    if (rc != SQLITE_OK) {
        throw ErrorHandler::fromConnection(m_db, rc, m_sql);
    }
}

void SQLiteStatement::checkBind(int rc) const {
    // bindValue rejects oversized values itself, so the connection's error
    // message may not belong to this call
    if (rc != SQLITE_OK) {
        throw SQLiteException(ErrorHandler::getErrorMessage(rc), rc, m_sql);
    }
}

// ============================================================================
// Binding
// ============================================================================

void SQLiteStatement::bind(const std::vector<Value>& parameters) {
    ensureAlive();
    for (size_t i = 0; i < parameters.size(); ++i) {
        // SQLite parameter indices are 1-based
        checkBind(bindValue(m_stmt, static_cast<int>(i + 1), parameters[i]));
    }
}

void SQLiteStatement::bindByName(const std::map<std::string, Value>& parameters) {
    ensureAlive();
    for (const auto& [name, value] : parameters) {
        int index = parameterIndex(name);
        if (index == 0) {
            throw SQLiteException("Unknown parameter name: " + name, std::nullopt, m_sql);
        }
        checkBind(bindValue(m_stmt, index, value));
    }
}

int SQLiteStatement::parameterCount() const {
    ensureAlive();
    return sqlite3_bind_parameter_count(m_stmt);
}

int SQLiteStatement::parameterIndex(const std::string& name) const {
    ensureAlive();
    const std::string prefixed = hasParameterPrefix(name) ? name : ":" + name;
    return sqlite3_bind_parameter_index(m_stmt, prefixed.c_str());
}

// ============================================================================
// Execution
// ============================================================================

bool SQLiteStatement::step() {
    ensureAlive();
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw ErrorHandler::fromConnection(m_db, rc, m_sql);
}

void SQLiteStatement::reset() {
    ensureAlive();
    checkResult(sqlite3_reset(m_stmt));
}

void SQLiteStatement::rewind() {
    if (m_stmt) {
        sqlite3_reset(m_stmt);
    }
}

void SQLiteStatement::clearBindings() {
    ensureAlive();
    checkResult(sqlite3_clear_bindings(m_stmt));
}

void SQLiteStatement::finalize() {
    if (m_stmt) {
        // The return value repeats the last step() error, already reported
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        spdlog::trace("Finalized statement: {}", m_sql);
    }
}

std::vector<RowMap> SQLiteStatement::queryAll() {
    ensureAlive();
    const std::vector<std::string> names = columnNames();
    const int count = static_cast<int>(names.size());

    std::vector<RowMap> rows;
    while (step()) {
        RowMap row;
        for (int i = 0; i < count; ++i) {
            row.emplace(names[i], columnValue(i));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void SQLiteStatement::execute(const std::vector<Value>& parameters) {
    bind(parameters);
    execute();
}

void SQLiteStatement::execute() {
    ensureAlive();
    try {
        while (step()) {
            // Drain all rows (if any)
        }
    } catch (const SQLiteException&) {
        rewind();
        throw;
    }
    reset();
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteStatement::columnCount() const {
    ensureAlive();
    return sqlite3_column_count(m_stmt);
}

std::string SQLiteStatement::columnName(int index) const {
    checkColumn(index);
    const char* name = sqlite3_column_name(m_stmt, index);
    if (!name) {
        throw ErrorHandler::fromConnection(m_db, SQLITE_NOMEM, m_sql);
    }
    return name;
}

std::vector<std::string> SQLiteStatement::columnNames() const {
    const int count = columnCount();
    std::vector<std::string> names;
    names.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        names.push_back(columnName(i));
    }
    return names;
}

ColumnType SQLiteStatement::columnType(int index) const {
    checkColumn(index);
    return toColumnType(sqlite3_column_type(m_stmt, index));
}

int64_t SQLiteStatement::columnInt(int index) const {
    checkColumn(index);
    return sqlite3_column_int64(m_stmt, index);
}

double SQLiteStatement::columnDouble(int index) const {
    checkColumn(index);
    return sqlite3_column_double(m_stmt, index);
}

std::string SQLiteStatement::columnText(int index) const {
    checkColumn(index);
    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    if (!text) return "";
    int length = sqlite3_column_bytes(m_stmt, index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(length));
}

Blob SQLiteStatement::columnBlob(int index) const {
    checkColumn(index);
    const void* data = sqlite3_column_blob(m_stmt, index);
    if (!data) return Blob{};
    int length = sqlite3_column_bytes(m_stmt, index);
    // Copy the data so it outlives the current row
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    return Blob(bytes, bytes + length);
}

Value SQLiteStatement::columnValue(int index) const {
    checkColumn(index);
    return readColumn(m_stmt, index);
}

}  // namespace nodal
