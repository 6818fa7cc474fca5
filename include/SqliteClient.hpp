#pragma once

#include "ErrorHandler.hpp"
#include "QueryResult.hpp"
#include "SQLiteResultCode.hpp"
#include "Value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nodal {

// A statement compiled once and run many times. Each call binds the given
// parameters positionally (1..N) and rewinds the statement afterwards, so
// the next call starts from a clean cursor.
class PreparedStatement {
public:
    virtual ~PreparedStatement() = default;

    virtual void execute(const std::vector<Value>& params = {}) = 0;
    virtual QueryResult query(const std::vector<Value>& params = {}) = 0;

    // Idempotent. Further execute/query calls throw ClientException.
    virtual void close() = 0;
};

// Client over one SQLite connection. Every failure leaves through
// ClientException; native exceptions never cross this interface.
//
//   auto db = SqliteClient::inMemory();
//   db->execute("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)");
//   db->execute("INSERT INTO users (name) VALUES (?)", {"Alice"});
//   for (const auto& row : db->query("SELECT * FROM users")) {
//       std::cout << row["name"] << "\n";
//   }
class SqliteClient {
public:
    virtual ~SqliteClient() = default;

    static std::unique_ptr<SqliteClient> open(const std::string& path);
    static std::unique_ptr<SqliteClient> open(const std::string& path, OpenFlags flags);
    static std::unique_ptr<SqliteClient> inMemory();

    // Without parameters the text may hold several statements separated
    // by ';'. With parameters it must hold exactly one statement; trailing
    // statements are rejected before anything runs.
    virtual void execute(const std::string& sql, const std::vector<Value>& params = {}) = 0;

    virtual QueryResult query(const std::string& sql, const std::vector<Value>& params = {}) = 0;

    virtual std::unique_ptr<PreparedStatement> prepare(const std::string& sql) = 0;

    // Rows changed by the most recent INSERT, UPDATE or DELETE
    virtual int updatedRows() const = 0;

    virtual int64_t lastInsertRowId() const = 0;

    virtual bool isOpen() const = 0;

    // Idempotent. A failed native close still leaves the client closed.
    virtual void close() = 0;
};

}  // namespace nodal
