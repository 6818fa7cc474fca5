#include "SqliteClient.hpp"
#include "SQLiteConnection.hpp"
#include "SQLiteStatement.hpp"
#include <spdlog/spdlog.h>

namespace nodal {

namespace {

// Drain a statement into the client-level result representation
QueryResult collectRows(SQLiteStatement& stmt) {
    std::vector<std::string> names = stmt.columnNames();
    const int count = static_cast<int>(names.size());

    std::vector<std::vector<Value>> rows;
    while (stmt.step()) {
        std::vector<Value> values;
        values.reserve(names.size());
        for (int i = 0; i < count; ++i) {
            values.push_back(stmt.columnValue(i));
        }
        rows.push_back(std::move(values));
    }
    return QueryResult(std::move(names), std::move(rows));
}

// ============================================================================
// NativePreparedStatement
// ============================================================================

class NativePreparedStatement : public PreparedStatement {
public:
    explicit NativePreparedStatement(SQLiteStatement stmt)
        : m_stmt(std::move(stmt))
        , m_sql(m_stmt.sql()) {}

    void execute(const std::vector<Value>& params) override {
        try {
            m_stmt.clearBindings();
            m_stmt.execute(params);
        } catch (const SQLiteException& e) {
            m_stmt.rewind();
            throw ErrorHandler::translate(e, m_sql);
        }
    }

    QueryResult query(const std::vector<Value>& params) override {
        try {
            m_stmt.clearBindings();
            m_stmt.bind(params);
            QueryResult result = collectRows(m_stmt);
            m_stmt.reset();
            return result;
        } catch (const SQLiteException& e) {
            m_stmt.rewind();
            throw ErrorHandler::translate(e, m_sql);
        }
    }

    void close() override {
        m_stmt.finalize();
    }

private:
    SQLiteStatement m_stmt;
    std::string m_sql;
};

// ============================================================================
// NativeSqliteClient
// ============================================================================

class NativeSqliteClient : public SqliteClient {
public:
    explicit NativeSqliteClient(SQLiteConnection connection)
        : m_connection(std::move(connection)) {}

    ~NativeSqliteClient() override = default;

    void execute(const std::string& sql, const std::vector<Value>& params) override {
        try {
            if (params.empty()) {
                m_connection.execute(sql);
                return;
            }
            SQLiteStatement stmt = m_connection.prepareSingle(sql);
            stmt.execute(params);
        } catch (const SQLiteException& e) {
            throw ErrorHandler::translate(e, sql);
        }
    }

    QueryResult query(const std::string& sql, const std::vector<Value>& params) override {
        try {
            SQLiteStatement stmt = m_connection.prepare(sql);
            stmt.bind(params);
            return collectRows(stmt);
        } catch (const SQLiteException& e) {
            throw ErrorHandler::translate(e, sql);
        }
    }

    std::unique_ptr<PreparedStatement> prepare(const std::string& sql) override {
        try {
            return std::make_unique<NativePreparedStatement>(m_connection.prepare(sql));
        } catch (const SQLiteException& e) {
            throw ErrorHandler::translate(e, sql);
        }
    }

    int updatedRows() const override {
        try {
            return m_connection.session().changes();
        } catch (const SQLiteException& e) {
            throw ErrorHandler::translate(e);
        }
    }

    int64_t lastInsertRowId() const override {
        try {
            return m_connection.session().lastInsertRowId();
        } catch (const SQLiteException& e) {
            throw ErrorHandler::translate(e);
        }
    }

    bool isOpen() const override {
        return m_connection.isValid();
    }

    void close() override {
        try {
            m_connection.close();
        } catch (const SQLiteException& e) {
            throw ErrorHandler::translate(e);
        }
    }

private:
    SQLiteConnection m_connection;
};

}  // namespace

// ============================================================================
// Factories
// ============================================================================

std::unique_ptr<SqliteClient> SqliteClient::open(const std::string& path) {
    return open(path, kDefaultOpenFlags);
}

std::unique_ptr<SqliteClient> SqliteClient::open(const std::string& path, OpenFlags flags) {
    try {
        return std::make_unique<NativeSqliteClient>(SQLiteConnection(path, flags));
    } catch (const SQLiteException& e) {
        spdlog::debug("Opening SQLite client for '{}' failed: {}", path, e.what());
        throw ErrorHandler::translate(e);
    }
}

std::unique_ptr<SqliteClient> SqliteClient::inMemory() {
    return open(":memory:");
}

}  // namespace nodal
