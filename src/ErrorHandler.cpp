#include "ErrorHandler.hpp"
#include <sqlite3.h>
#include <cerrno>
#include <sstream>

namespace nodal {

namespace {

std::string describeNative(const std::string& message, const std::optional<int>& code) {
    std::ostringstream out;
    out << "SQLiteException";
    if (code) {
        out << " (" << resultCodeName(toResultCode(*code)) << "=" << *code << ")";
    }
    out << ": " << message;
    return out.str();
}

std::string describeClient(const std::string& message,
                           const std::optional<int>& code,
                           const std::optional<std::string>& sql,
                           const std::optional<std::string>& explanation) {
    std::ostringstream out;
    out << "ClientException";
    if (code) {
        out << "(" << *code << ")";
    }
    out << ": " << message;
    if (explanation) {
        out << ", " << *explanation;
    }
    if (sql) {
        out << "\n  Causing statement: " << *sql;
    }
    return out.str();
}

}  // namespace

SQLiteException::SQLiteException(const std::string& message,
                                 std::optional<int> code,
                                 std::optional<std::string> sql,
                                 std::optional<std::string> explanation)
    : std::runtime_error(describeNative(message, code))
    , m_message(message)
    , m_code(code)
    , m_sql(std::move(sql))
    , m_explanation(std::move(explanation)) {
}

std::optional<ResultCode> SQLiteException::resultCode() const {
    if (!m_code) {
        return std::nullopt;
    }
    return toResultCode(*m_code);
}

ClientException::ClientException(const std::string& message,
                                 std::optional<int> resultCode,
                                 std::optional<std::string> sql,
                                 std::optional<std::string> explanation)
    : std::runtime_error(describeClient(message, resultCode, sql, explanation))
    , m_message(message)
    , m_resultCode(resultCode)
    , m_sql(std::move(sql))
    , m_explanation(std::move(explanation)) {
}

std::string ClientException::toString() const {
    return what();
}

ClientException ErrorHandler::translate(const std::string& message,
                                        std::optional<int> code,
                                        std::optional<std::string> sql,
                                        std::optional<std::string> explanation) {
    return ClientException(message.empty() ? getErrorMessage(code.value_or(SQLITE_ERROR)) : message,
                           code, std::move(sql), std::move(explanation));
}

ClientException ErrorHandler::translate(const SQLiteException& error,
                                        const std::optional<std::string>& fallbackSql) {
    return translate(error.message(), error.code(),
                     error.sql() ? error.sql() : fallbackSql,
                     error.explanation());
}

SQLiteException ErrorHandler::fromConnection(sqlite3* db, int rc, std::optional<std::string> sql) {
    std::string message = db ? sqlite3_errmsg(db) : getErrorMessage(rc);
    std::string generic = getErrorMessage(rc);

    std::optional<std::string> explanation;
    if (generic != message) {
        explanation = generic;
    }
    return SQLiteException(message, rc, std::move(sql), std::move(explanation));
}

std::string ErrorHandler::getErrorMessage(int code) {
    const char* text = sqlite3_errstr(code);
    return text ? text : "SQLite error " + std::to_string(code);
}

int ErrorHandler::sqliteToErrno(int code) {
    // Unique and primary key violations mean the row already exists
    if (code == SQLITE_CONSTRAINT_UNIQUE || code == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return EEXIST;
    }

    switch (toResultCode(code)) {
        // Success
        case ResultCode::Ok:
        case ResultCode::Row:
        case ResultCode::Done:
            return 0;

        // Permission errors
        case ResultCode::Perm:
        case ResultCode::Auth:
            return EACCES;

        // Not found errors
        case ResultCode::CantOpen:
        case ResultCode::NotFound:
            return ENOENT;

        // Lock/busy errors
        case ResultCode::Busy:
        case ResultCode::Locked:
            return EBUSY;

        // Read-only errors
        case ResultCode::ReadOnly:
            return EROFS;

        // Disk/space errors
        case ResultCode::Full:
            return ENOSPC;

        case ResultCode::NoMem:
            return ENOMEM;

        case ResultCode::Interrupt:
            return EINTR;

        case ResultCode::TooBig:
            return E2BIG;

        // Invalid input errors
        case ResultCode::Error:
        case ResultCode::Constraint:
        case ResultCode::Mismatch:
        case ResultCode::Misuse:
        case ResultCode::Range:
            return EINVAL;

        // Default to I/O error
        default:
            return EIO;
    }
}

bool ErrorHandler::isRetryable(int code) {
    switch (toResultCode(code)) {
        case ResultCode::Busy:
        case ResultCode::Locked:
            return true;
        default:
            return false;
    }
}

}  // namespace nodal
