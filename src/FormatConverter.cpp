#include "FormatConverter.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <limits>
#include <sstream>
#include <type_traits>
#include <variant>

namespace nodal {

// ============================================================================
// CSV
// ============================================================================

std::string FormatConverter::toCSV(const QueryResult& result, const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        const auto& columns = result.columnNames();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (const auto& row : result) {
        const auto& values = row.values();
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out << options.delimiter;

            if (!values[i].isNull()) {
                out << escapeCSVField(valueToCSV(values[i]), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needsQuoting = options.quoteAll;

    if (!needsQuoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needsQuoting = true;
                break;
            }
        }
    }

    if (!needsQuoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

std::string FormatConverter::valueToCSV(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return toHex(v);
        }
    }, value.storage());
}

// ============================================================================
// JSON
// ============================================================================

namespace {

// TEXT read from SQLite is not guaranteed to be valid UTF-8; invalid bytes
// are written as U+FFFD instead of failing the whole document
std::string dumpJson(const json& doc, const JSONOptions& options) {
    return doc.dump(options.pretty ? options.indent : -1, ' ', false,
                    json::error_handler_t::replace);
}

}  // namespace

json FormatConverter::rowToObject(const QueryRow& row, const JSONOptions& options) {
    json obj = json::object();
    const auto& columns = row.columnNames();
    const auto& values = row.values();

    for (size_t i = 0; i < std::min(columns.size(), values.size()); ++i) {
        // Duplicate column names: the first one wins, as in QueryRow lookups
        if (obj.contains(columns[i])) continue;

        if (!values[i].isNull()) {
            obj[columns[i]] = valueToJson(values[i]);
        } else if (options.includeNull) {
            obj[columns[i]] = nullptr;
        }
    }
    return obj;
}

std::string FormatConverter::toJSON(const QueryResult& result, const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : result) {
        arr.push_back(rowToObject(row, options));
    }

    if (options.arrayFormat) {
        return dumpJson(arr, options);
    } else {
        json wrapper = json::object();
        wrapper["columns"] = result.columnNames();
        wrapper["rows"] = std::move(arr);
        return dumpJson(wrapper, options);
    }
}

std::string FormatConverter::rowToJSON(const QueryRow& row, const JSONOptions& options) {
    json obj = rowToObject(row, options);
    return dumpJson(obj, options);
}

json FormatConverter::valueToJson(const Value& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Blob>) {
            return toHex(v);
        } else {
            return v;
        }
    }, value.storage());
}

Value FormatConverter::valueFromJson(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return Value();
        case json::value_t::boolean:
            return Value(value.get<bool>());
        case json::value_t::number_integer:
            return Value(value.get<std::int64_t>());
        case json::value_t::number_unsigned: {
            auto u = value.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<double>(u));
            }
            return Value(static_cast<std::int64_t>(u));
        }
        case json::value_t::number_float:
            return Value(value.get<double>());
        case json::value_t::string:
            return Value(value.get<std::string>());
        default:
            throw SQLiteException(std::string("Unsupported bind type: ") + value.type_name());
    }
}

Value FormatConverter::parseParameter(const std::string& token) {
    json parsed = json::parse(token, nullptr, false);
    if (parsed.is_discarded() || parsed.is_structured()) {
        return Value(token);
    }
    return valueFromJson(parsed);
}

}  // namespace nodal
