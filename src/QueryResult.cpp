#include "QueryResult.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace nodal {

namespace {

const Value& nullValue() {
    static const Value kNull;
    return kNull;
}

}  // namespace

// ============================================================================
// QueryRow
// ============================================================================

QueryRow::QueryRow(std::shared_ptr<const std::vector<std::string>> columns,
                   std::vector<Value> values)
    : m_columns(std::move(columns))
    , m_values(std::move(values)) {
}

const Value& QueryRow::operator[](const std::string& columnName) const {
    const auto& names = *m_columns;
    for (size_t i = 0; i < names.size() && i < m_values.size(); ++i) {
        if (names[i] == columnName) {
            return m_values[i];
        }
    }
    return nullValue();
}

const Value& QueryRow::columnAt(size_t index) const {
    if (index >= m_values.size()) {
        throw std::out_of_range("Column index " + std::to_string(index) +
                                " out of range (" + std::to_string(m_values.size()) + " columns)");
    }
    return m_values[index];
}

bool QueryRow::contains(const std::string& columnName) const {
    const auto& names = *m_columns;
    return std::find(names.begin(), names.end(), columnName) != names.end();
}

std::map<std::string, Value> QueryRow::toMap() const {
    std::map<std::string, Value> out;
    const auto& names = *m_columns;
    for (size_t i = 0; i < names.size() && i < m_values.size(); ++i) {
        out.emplace(names[i], m_values[i]);
    }
    return out;
}

std::string QueryRow::toString() const {
    std::ostringstream out;
    out << "{";
    const auto& names = *m_columns;
    for (size_t i = 0; i < names.size() && i < m_values.size(); ++i) {
        if (i > 0) out << ", ";
        out << names[i] << ": " << m_values[i];
    }
    out << "}";
    return out.str();
}

bool QueryRow::operator==(const QueryRow& other) const {
    return columnNames() == other.columnNames() && m_values == other.m_values;
}

std::ostream& operator<<(std::ostream& os, const QueryRow& row) {
    return os << row.toString();
}

// ============================================================================
// QueryResult
// ============================================================================

QueryResult::QueryResult()
    : m_columns(std::make_shared<const std::vector<std::string>>()) {
}

QueryResult::QueryResult(std::vector<std::string> columnNames,
                         std::vector<std::vector<Value>> rows)
    : m_columns(std::make_shared<const std::vector<std::string>>(std::move(columnNames))) {
    m_rows.reserve(rows.size());
    for (auto& values : rows) {
        m_rows.emplace_back(m_columns, std::move(values));
    }
}

const QueryRow& QueryResult::at(size_t index) const {
    if (index >= m_rows.size()) {
        throw std::out_of_range("Row index " + std::to_string(index) +
                                " out of range (" + std::to_string(m_rows.size()) + " rows)");
    }
    return m_rows[index];
}

const QueryRow& QueryResult::front() const {
    if (m_rows.empty()) {
        throw std::out_of_range("No element");
    }
    return m_rows.front();
}

const QueryRow& QueryResult::back() const {
    if (m_rows.empty()) {
        throw std::out_of_range("No element");
    }
    return m_rows.back();
}

std::vector<QueryRow> QueryResult::slice(size_t start, size_t count) const {
    if (start >= m_rows.size()) {
        return {};
    }
    size_t end = start + std::min(count, m_rows.size() - start);
    return std::vector<QueryRow>(m_rows.begin() + static_cast<std::ptrdiff_t>(start),
                                 m_rows.begin() + static_cast<std::ptrdiff_t>(end));
}

std::vector<QueryRow> QueryResult::skip(size_t count) const {
    return slice(count, m_rows.size());
}

std::vector<QueryRow> QueryResult::take(size_t count) const {
    return slice(0, count);
}

}  // namespace nodal
