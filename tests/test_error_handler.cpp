#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include <sqlite3.h>
#include <cerrno>

using namespace nodal;
using ::testing::HasSubstr;

class ErrorHandlerTest : public ::testing::Test {
};

// SQLite to errno mapping tests
TEST_F(ErrorHandlerTest, SuccessReturnsZero) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_OK), 0);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_ROW), 0);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_DONE), 0);
}

TEST_F(ErrorHandlerTest, PermissionErrorsMapToEACCES) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_PERM), EACCES);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_AUTH), EACCES);
}

TEST_F(ErrorHandlerTest, NotFoundErrorsMapToENOENT) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_CANTOPEN), ENOENT);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_NOTFOUND), ENOENT);
}

TEST_F(ErrorHandlerTest, UniqueViolationsMapToEEXIST) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_CONSTRAINT_UNIQUE), EEXIST);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_CONSTRAINT_PRIMARYKEY), EEXIST);
}

TEST_F(ErrorHandlerTest, OtherConstraintsMapToEINVAL) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_CONSTRAINT), EINVAL);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_CONSTRAINT_NOTNULL), EINVAL);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_ERROR), EINVAL);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_MISMATCH), EINVAL);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_RANGE), EINVAL);
}

TEST_F(ErrorHandlerTest, BusyErrorsMapToEBUSY) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_BUSY), EBUSY);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_LOCKED), EBUSY);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_BUSY_SNAPSHOT), EBUSY);
}

TEST_F(ErrorHandlerTest, ReadOnlyErrorsMapToEROFS) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_READONLY), EROFS);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_READONLY_DBMOVED), EROFS);
}

TEST_F(ErrorHandlerTest, ResourceErrors) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_FULL), ENOSPC);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_NOMEM), ENOMEM);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_TOOBIG), E2BIG);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_INTERRUPT), EINTR);
}

TEST_F(ErrorHandlerTest, UnknownErrorMapsToEIO) {
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_IOERR), EIO);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(SQLITE_CORRUPT), EIO);
    EXPECT_EQ(ErrorHandler::sqliteToErrno(99999), EIO);
}

// Retryable error tests
TEST_F(ErrorHandlerTest, BusyAndLockedAreRetryable) {
    EXPECT_TRUE(ErrorHandler::isRetryable(SQLITE_BUSY));
    EXPECT_TRUE(ErrorHandler::isRetryable(SQLITE_LOCKED));
    EXPECT_TRUE(ErrorHandler::isRetryable(SQLITE_BUSY_TIMEOUT));
}

TEST_F(ErrorHandlerTest, OtherErrorsAreNotRetryable) {
    EXPECT_FALSE(ErrorHandler::isRetryable(SQLITE_OK));
    EXPECT_FALSE(ErrorHandler::isRetryable(SQLITE_ERROR));
    EXPECT_FALSE(ErrorHandler::isRetryable(SQLITE_CONSTRAINT_NOTNULL));
    EXPECT_FALSE(ErrorHandler::isRetryable(SQLITE_READONLY));
    EXPECT_FALSE(ErrorHandler::isRetryable(99999));
}

// Error message tests
TEST_F(ErrorHandlerTest, GetErrorMessageKnownCodes) {
    EXPECT_EQ(ErrorHandler::getErrorMessage(SQLITE_OK), sqlite3_errstr(SQLITE_OK));
    EXPECT_EQ(ErrorHandler::getErrorMessage(SQLITE_BUSY), sqlite3_errstr(SQLITE_BUSY));
    EXPECT_THAT(ErrorHandler::getErrorMessage(SQLITE_CONSTRAINT), HasSubstr("constraint"));
}

TEST_F(ErrorHandlerTest, FromConnectionUsesConnectionMessage) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(":memory:", &db), SQLITE_OK);
    int rc = sqlite3_exec(db, "SELECT * FROM missing_table", nullptr, nullptr, nullptr);

    SQLiteException ex = ErrorHandler::fromConnection(db, rc, std::string("SELECT * FROM missing_table"));
    sqlite3_close(db);

    EXPECT_THAT(ex.message(), HasSubstr("no such table: missing_table"));
    EXPECT_EQ(ex.code(), SQLITE_ERROR);
    EXPECT_EQ(ex.sql(), std::optional<std::string>("SELECT * FROM missing_table"));
    ASSERT_TRUE(ex.explanation().has_value());
    EXPECT_EQ(*ex.explanation(), sqlite3_errstr(SQLITE_ERROR));
}

TEST_F(ErrorHandlerTest, FromConnectionWithoutHandle) {
    SQLiteException ex = ErrorHandler::fromConnection(nullptr, SQLITE_NOMEM);

    EXPECT_EQ(ex.message(), sqlite3_errstr(SQLITE_NOMEM));
    EXPECT_FALSE(ex.explanation().has_value());
    EXPECT_FALSE(ex.sql().has_value());
}

// Translation tests
TEST_F(ErrorHandlerTest, TranslateCarriesAllFields) {
    SQLiteException native("NOT NULL constraint failed: users.name",
                           SQLITE_CONSTRAINT_NOTNULL, std::string("INSERT INTO users VALUES (NULL)"),
                           std::string("constraint failed"));

    ClientException ex = ErrorHandler::translate(native);

    EXPECT_EQ(ex.message(), "NOT NULL constraint failed: users.name");
    EXPECT_EQ(ex.resultCode(), SQLITE_CONSTRAINT_NOTNULL);
    EXPECT_EQ(ex.sql(), std::optional<std::string>("INSERT INTO users VALUES (NULL)"));
    EXPECT_EQ(ex.explanation(), std::optional<std::string>("constraint failed"));
}

TEST_F(ErrorHandlerTest, TranslateFillsMissingSql) {
    SQLiteException native("boom", SQLITE_ERROR);

    ClientException ex = ErrorHandler::translate(native, std::string("SELECT 1"));

    EXPECT_EQ(ex.sql(), std::optional<std::string>("SELECT 1"));
}

TEST_F(ErrorHandlerTest, TranslateKeepsOriginalSql) {
    SQLiteException native("boom", SQLITE_ERROR, std::string("SELECT 2"));

    ClientException ex = ErrorHandler::translate(native, std::string("SELECT 1"));

    EXPECT_EQ(ex.sql(), std::optional<std::string>("SELECT 2"));
}

TEST_F(ErrorHandlerTest, TranslateEmptyMessageUsesGenericText) {
    ClientException ex = ErrorHandler::translate("", SQLITE_BUSY);

    EXPECT_EQ(ex.message(), sqlite3_errstr(SQLITE_BUSY));
}

// ExecuteWithRetry tests
TEST_F(ErrorHandlerTest, ExecuteWithRetrySuccessOnFirstTry) {
    int callCount = 0;
    auto result = ErrorHandler::executeWithRetry([&callCount]() {
        callCount++;
        return 7;
    }, 3, std::chrono::milliseconds(1));

    EXPECT_EQ(result, 7);
    EXPECT_EQ(callCount, 1);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryRecoversFromBusy) {
    int callCount = 0;
    auto result = ErrorHandler::executeWithRetry([&callCount]() {
        if (++callCount < 3) {
            throw ClientException("database is locked", SQLITE_BUSY);
        }
        return 42;
    }, 3, std::chrono::milliseconds(1));

    EXPECT_EQ(result, 42);
    EXPECT_EQ(callCount, 3);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryGivesUpAfterMaxRetries) {
    int callCount = 0;
    EXPECT_THROW(ErrorHandler::executeWithRetry([&callCount]() -> int {
        callCount++;
        throw ClientException("database is locked", SQLITE_BUSY);
    }, 3, std::chrono::milliseconds(1)), ClientException);

    EXPECT_EQ(callCount, 3);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryNonRetryableError) {
    int callCount = 0;
    EXPECT_THROW(ErrorHandler::executeWithRetry([&callCount]() -> int {
        callCount++;
        throw ClientException("constraint failed", SQLITE_CONSTRAINT);
    }, 3, std::chrono::milliseconds(1)), ClientException);

    EXPECT_EQ(callCount, 1);  // Should not retry
}

// SQLiteException tests
class SQLiteExceptionTest : public ::testing::Test {
};

TEST_F(SQLiteExceptionTest, WhatIncludesCodeNameAndMessage) {
    SQLiteException ex("UNIQUE constraint failed: t.id", SQLITE_CONSTRAINT_UNIQUE);

    EXPECT_EQ(ex.resultCode(), ResultCode::Constraint);
    EXPECT_THAT(ex.what(), HasSubstr("constraint="));
    EXPECT_THAT(ex.what(), HasSubstr("UNIQUE constraint failed: t.id"));
}

TEST_F(SQLiteExceptionTest, WithoutCode) {
    SQLiteException ex("Statement has been finalized");

    EXPECT_FALSE(ex.code().has_value());
    EXPECT_FALSE(ex.resultCode().has_value());
    EXPECT_STREQ(ex.what(), "SQLiteException: Statement has been finalized");
}

TEST_F(SQLiteExceptionTest, CanBeCaughtAsRuntimeError) {
    bool caught = false;

    try {
        throw SQLiteException("test", SQLITE_ERROR);
    } catch (const std::runtime_error&) {
        caught = true;
    }

    EXPECT_TRUE(caught);
}

// ClientException tests
class ClientExceptionTest : public ::testing::Test {
};

TEST_F(ClientExceptionTest, ToStringWithAllParts) {
    ClientException ex("NOT NULL constraint failed: users.name", 1299,
                       std::string("INSERT INTO users (name) VALUES (?)"),
                       std::string("constraint failed"));

    EXPECT_EQ(ex.toString(),
              "ClientException(1299): NOT NULL constraint failed: users.name, constraint failed\n"
              "  Causing statement: INSERT INTO users (name) VALUES (?)");
    EXPECT_EQ(ex.toString(), std::string(ex.what()));
}

TEST_F(ClientExceptionTest, ToStringOmitsMissingParts) {
    ClientException ex("Database connection is closed");

    EXPECT_EQ(ex.toString(), "ClientException: Database connection is closed");
}

TEST_F(ClientExceptionTest, ToStringWithCodeOnly) {
    ClientException ex("database is locked", SQLITE_BUSY);

    EXPECT_EQ(ex.toString(), "ClientException(5): database is locked");
}
