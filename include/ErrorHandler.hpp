#pragma once

#include "SQLiteResultCode.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

struct sqlite3;

namespace nodal {

// Failure raised by the native layer (SQLiteConnection / SQLiteStatement).
// code is the raw value returned by SQLite and may be an extended code.
class SQLiteException : public std::runtime_error {
public:
    explicit SQLiteException(const std::string& message,
                             std::optional<int> code = std::nullopt,
                             std::optional<std::string> sql = std::nullopt,
                             std::optional<std::string> explanation = std::nullopt);

    const std::string& message() const { return m_message; }
    const std::optional<int>& code() const { return m_code; }
    const std::optional<std::string>& sql() const { return m_sql; }
    const std::optional<std::string>& explanation() const { return m_explanation; }

    // Catalog variant for code(), folded from extended codes
    std::optional<ResultCode> resultCode() const;

private:
    std::string m_message;
    std::optional<int> m_code;
    std::optional<std::string> m_sql;
    std::optional<std::string> m_explanation;
};

// Failure surfaced by SqliteClient. No native exception type crosses the
// client boundary; everything is re-wrapped into this one.
class ClientException : public std::runtime_error {
public:
    explicit ClientException(const std::string& message,
                             std::optional<int> resultCode = std::nullopt,
                             std::optional<std::string> sql = std::nullopt,
                             std::optional<std::string> explanation = std::nullopt);

    const std::string& message() const { return m_message; }
    const std::optional<int>& resultCode() const { return m_resultCode; }
    const std::optional<std::string>& sql() const { return m_sql; }
    const std::optional<std::string>& explanation() const { return m_explanation; }

    // ClientException(<code>): <message>, <explanation>
    //   Causing statement: <sql>
    std::string toString() const;

private:
    std::string m_message;
    std::optional<int> m_resultCode;
    std::optional<std::string> m_sql;
    std::optional<std::string> m_explanation;
};

class ErrorHandler {
public:
    // Build the client-level error from its four parts
    static ClientException translate(const std::string& message,
                                     std::optional<int> code = std::nullopt,
                                     std::optional<std::string> sql = std::nullopt,
                                     std::optional<std::string> explanation = std::nullopt);

    // Re-wrap a native error; fallbackSql is used when the error has none
    static ClientException translate(const SQLiteException& error,
                                     const std::optional<std::string>& fallbackSql = std::nullopt);

    // Read the current error of a connection after a call returned rc
    static SQLiteException fromConnection(sqlite3* db, int rc,
                                          std::optional<std::string> sql = std::nullopt);

    // Generic description of a result code (sqlite3_errstr)
    static std::string getErrorMessage(int code);

    // Convert SQLite result code (primary or extended) to errno
    static int sqliteToErrno(int code);

    // Busy and locked outcomes may succeed when attempted again
    static bool isRetryable(int code);

    // Run operation, retrying while it fails with a retryable ClientException.
    // Opt-in for callers; the client itself never retries.
    template<typename Func>
    static auto executeWithRetry(Func&& operation, int maxRetries = 3,
                                 std::chrono::milliseconds baseDelay = std::chrono::milliseconds(100))
        -> decltype(operation()) {
        int attempt = 0;
        while (true) {
            try {
                return operation();
            } catch (const ClientException& e) {
                ++attempt;
                if (!e.resultCode() || !isRetryable(*e.resultCode()) || attempt >= maxRetries) {
                    throw;
                }
                // Exponential backoff: base, 2*base, 4*base...
                std::this_thread::sleep_for(baseDelay * (1 << (attempt - 1)));
            }
        }
    }
};

}  // namespace nodal
