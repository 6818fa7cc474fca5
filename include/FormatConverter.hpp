#pragma once

#include "QueryResult.hpp"
#include "Value.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace nodal {

using json = nlohmann::json;

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with rows array
};

// Renders query results as CSV or JSON and maps values to and from JSON
class FormatConverter {
public:
    // NULL is an empty field, blobs are lower-case hex
    static std::string toCSV(const QueryResult& result,
                             const CSVOptions& options = CSVOptions{});

    static std::string toJSON(const QueryResult& result,
                              const JSONOptions& options = JSONOptions{});

    static std::string rowToJSON(const QueryRow& row,
                                 const JSONOptions& options = JSONOptions{});

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});

    // Blobs become lower-case hex strings
    static json valueToJson(const Value& value);

    // Accepts null, boolean, number and string.
    // Throws SQLiteException "Unsupported bind type: <type>" for anything else.
    static Value valueFromJson(const json& value);

    // Command-line parameter: a JSON scalar ("42", "1.5", "null", "\"x\"")
    // or, failing that, the token itself as text
    static Value parseParameter(const std::string& token);

private:
    static std::string valueToCSV(const Value& value);
    static json rowToObject(const QueryRow& row, const JSONOptions& options);
};

}  // namespace nodal
