#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "QueryResult.hpp"
#include <algorithm>
#include <stdexcept>

using namespace nodal;
using ::testing::ElementsAre;

class QueryResultTest : public ::testing::Test {
protected:
    QueryResult makeUsers() {
        return QueryResult({"id", "name", "age"}, {
            {1, "Alice", 30},
            {2, "Bob", 17},
            {3, "Carol", nullptr},
        });
    }
};

// Sequence access
TEST_F(QueryResultTest, EmptyResult) {
    QueryResult result;

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(result.size(), 0u);
    EXPECT_TRUE(result.columnNames().empty());
    EXPECT_TRUE(result.begin() == result.end());
}

TEST_F(QueryResultTest, EmptyResultKeepsColumns) {
    QueryResult result({"id", "name"}, {});

    EXPECT_TRUE(result.empty());
    EXPECT_THAT(result.columnNames(), ElementsAre("id", "name"));
}

TEST_F(QueryResultTest, IndexedAccess) {
    auto result = makeUsers();

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0]["name"].asText(), "Alice");
    EXPECT_EQ(result.at(2)["id"].asInt(), 3);
    EXPECT_THROW(result.at(3), std::out_of_range);
}

TEST_F(QueryResultTest, FrontAndBack) {
    auto result = makeUsers();

    EXPECT_EQ(result.front()["name"].asText(), "Alice");
    EXPECT_EQ(result.back()["name"].asText(), "Carol");
}

TEST_F(QueryResultTest, FrontAndBackOnEmptyThrow) {
    QueryResult result({"x"}, {});

    EXPECT_THROW(result.front(), std::out_of_range);
    EXPECT_THROW(result.back(), std::out_of_range);
}

TEST_F(QueryResultTest, RepeatedIterationYieldsSameRows) {
    auto result = makeUsers();

    std::vector<std::string> first;
    for (const auto& row : result) first.push_back(row["name"].asText());
    std::vector<std::string> second;
    for (const auto& row : result) second.push_back(row["name"].asText());

    EXPECT_EQ(first, second);
    EXPECT_THAT(first, ElementsAre("Alice", "Bob", "Carol"));
}

TEST_F(QueryResultTest, WorksWithStandardAlgorithms) {
    auto result = makeUsers();

    auto count = std::count_if(result.begin(), result.end(),
                               [](const QueryRow& row) { return !row["age"].isNull(); });
    EXPECT_EQ(count, 2);
}

// Functional helpers
TEST_F(QueryResultTest, Map) {
    auto names = makeUsers().map([](const QueryRow& row) { return row["name"].asText(); });

    EXPECT_THAT(names, ElementsAre("Alice", "Bob", "Carol"));
}

TEST_F(QueryResultTest, Where) {
    auto adults = makeUsers().where([](const QueryRow& row) {
        return !row["age"].isNull() && row["age"].asInt() >= 18;
    });

    ASSERT_EQ(adults.size(), 1u);
    EXPECT_EQ(adults[0]["name"].asText(), "Alice");
}

TEST_F(QueryResultTest, Fold) {
    auto total = makeUsers().fold(std::int64_t{0}, [](std::int64_t sum, const QueryRow& row) {
        return sum + row["id"].asInt();
    });

    EXPECT_EQ(total, 6);
}

TEST_F(QueryResultTest, AnyAndEvery) {
    auto result = makeUsers();

    EXPECT_TRUE(result.any([](const QueryRow& row) { return row["age"].isNull(); }));
    EXPECT_FALSE(result.every([](const QueryRow& row) { return row["age"].isNull(); }));
    EXPECT_TRUE(result.every([](const QueryRow& row) { return row["id"].asInt() > 0; }));

    QueryResult empty;
    EXPECT_FALSE(empty.any([](const QueryRow&) { return true; }));
    EXPECT_TRUE(empty.every([](const QueryRow&) { return false; }));
}

TEST_F(QueryResultTest, FirstWhere) {
    auto result = makeUsers();

    auto bob = result.firstWhere([](const QueryRow& row) { return row["name"].asText() == "Bob"; });
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ((*bob)["id"].asInt(), 2);

    auto nobody = result.firstWhere([](const QueryRow& row) { return row["id"].asInt() > 10; });
    EXPECT_FALSE(nobody.has_value());
}

TEST_F(QueryResultTest, SkipAndTake) {
    auto result = makeUsers();

    auto rest = result.skip(1);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0]["name"].asText(), "Bob");

    auto head = result.take(2);
    ASSERT_EQ(head.size(), 2u);
    EXPECT_EQ(head[1]["name"].asText(), "Bob");

    EXPECT_TRUE(result.skip(10).empty());
    EXPECT_EQ(result.take(10).size(), 3u);
    EXPECT_EQ(result.slice(1, 1).size(), 1u);
}

TEST_F(QueryResultTest, ToVectorCopiesRows) {
    auto result = makeUsers();
    auto rows = result.toVector();

    ASSERT_EQ(rows.size(), result.size());
    EXPECT_EQ(rows[2], result[2]);
}

// Row access
class QueryRowTest : public ::testing::Test {
};

TEST_F(QueryRowTest, LookupByNameAndPosition) {
    QueryResult result({"id", "name"}, {{7, "Zed"}});
    const auto& row = result[0];

    EXPECT_EQ(row.size(), 2u);
    EXPECT_EQ(row["id"].asInt(), 7);
    EXPECT_EQ(row.columnAt(1).asText(), "Zed");
    EXPECT_THROW(row.columnAt(2), std::out_of_range);
    EXPECT_THAT(row.columnNames(), ElementsAre("id", "name"));
}

TEST_F(QueryRowTest, UnknownNameIsNull) {
    QueryResult result({"id"}, {{1}});

    EXPECT_TRUE(result[0]["missing"].isNull());
    EXPECT_FALSE(result[0].contains("missing"));
    EXPECT_TRUE(result[0].contains("id"));
}

TEST_F(QueryRowTest, DuplicateNamesFirstWins) {
    QueryResult result({"x", "x"}, {{1, 2}});
    const auto& row = result[0];

    EXPECT_EQ(row["x"].asInt(), 1);
    EXPECT_EQ(row.columnAt(1).asInt(), 2);

    auto map = row.toMap();
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(map.at("x").asInt(), 1);
}

TEST_F(QueryRowTest, ToString) {
    QueryResult result({"id", "name", "note"}, {{1, "Alice", nullptr}});

    EXPECT_EQ(result[0].toString(), "{id: 1, name: Alice, note: NULL}");
}

TEST_F(QueryRowTest, RowsCompareByColumnsAndValues) {
    QueryResult a({"id"}, {{1}, {2}});
    QueryResult b({"id"}, {{1}});
    QueryResult c({"other"}, {{1}});

    EXPECT_EQ(a[0], b[0]);
    EXPECT_NE(a[1], b[0]);
    EXPECT_NE(a[0], c[0]);
}
