#pragma once

#include "Value.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace nodal {

// One row of a QueryResult. Values are looked up by column name (first
// match wins) or by zero-based position.
class QueryRow {
public:
    QueryRow(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values);

    // NULL value when no column has this name
    const Value& operator[](const std::string& columnName) const;

    // Throws std::out_of_range
    const Value& columnAt(size_t index) const;

    bool contains(const std::string& columnName) const;

    const std::vector<std::string>& columnNames() const { return *m_columns; }
    const std::vector<Value>& values() const { return m_values; }
    size_t size() const { return m_values.size(); }

    // Column name -> value; on duplicate names the first column wins
    std::map<std::string, Value> toMap() const;

    // {id: 1, name: Alice}
    std::string toString() const;

    bool operator==(const QueryRow& other) const;
    bool operator!=(const QueryRow& other) const { return !(*this == other); }

private:
    std::shared_ptr<const std::vector<std::string>> m_columns;
    std::vector<Value> m_values;
};

std::ostream& operator<<(std::ostream& os, const QueryRow& row);

// Fully materialized result of a query: a frozen, ordered sequence of rows
// sharing one column-name list. Nothing here touches the database again,
// so iterating twice yields the same rows in the same order.
//
// Works with range-for and <algorithm>; map/where/fold and friends are
// thin helpers over the underlying vector.
class QueryResult {
public:
    using value_type = QueryRow;
    using size_type = std::size_t;
    using const_iterator = std::vector<QueryRow>::const_iterator;
    using iterator = const_iterator;

    QueryResult();
    QueryResult(std::vector<std::string> columnNames, std::vector<std::vector<Value>> rows);

    const std::vector<std::string>& columnNames() const { return *m_columns; }

    size_t size() const { return m_rows.size(); }
    bool empty() const { return m_rows.empty(); }

    const QueryRow& operator[](size_t index) const { return m_rows[index]; }

    // Bounds-checked access; throw std::out_of_range
    const QueryRow& at(size_t index) const;
    const QueryRow& front() const;
    const QueryRow& back() const;

    const_iterator begin() const { return m_rows.begin(); }
    const_iterator end() const { return m_rows.end(); }
    const_iterator cbegin() const { return m_rows.cbegin(); }
    const_iterator cend() const { return m_rows.cend(); }

    const std::vector<QueryRow>& rows() const { return m_rows; }
    std::vector<QueryRow> toVector() const { return m_rows; }

    template<typename Func>
    auto map(Func&& func) const {
        using Result = std::decay_t<std::invoke_result_t<Func&, const QueryRow&>>;
        std::vector<Result> out;
        out.reserve(m_rows.size());
        for (const auto& row : m_rows) {
            out.push_back(func(row));
        }
        return out;
    }

    template<typename Predicate>
    std::vector<QueryRow> where(Predicate&& predicate) const {
        std::vector<QueryRow> out;
        for (const auto& row : m_rows) {
            if (predicate(row)) {
                out.push_back(row);
            }
        }
        return out;
    }

    template<typename T, typename Func>
    T fold(T initial, Func&& combine) const {
        for (const auto& row : m_rows) {
            initial = combine(std::move(initial), row);
        }
        return initial;
    }

    template<typename Predicate>
    bool any(Predicate&& predicate) const {
        for (const auto& row : m_rows) {
            if (predicate(row)) return true;
        }
        return false;
    }

    template<typename Predicate>
    bool every(Predicate&& predicate) const {
        for (const auto& row : m_rows) {
            if (!predicate(row)) return false;
        }
        return true;
    }

    template<typename Predicate>
    std::optional<QueryRow> firstWhere(Predicate&& predicate) const {
        for (const auto& row : m_rows) {
            if (predicate(row)) return row;
        }
        return std::nullopt;
    }

    // Rows [start, start + count), clamped to the result size
    std::vector<QueryRow> slice(size_t start, size_t count) const;
    std::vector<QueryRow> skip(size_t count) const;
    std::vector<QueryRow> take(size_t count) const;

private:
    std::shared_ptr<const std::vector<std::string>> m_columns;
    std::vector<QueryRow> m_rows;
};

}  // namespace nodal
