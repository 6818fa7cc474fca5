#pragma once

#include "SQLiteResultCode.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace nodal {

/// Raw byte sequence stored in a BLOB column.
using Blob = std::vector<std::uint8_t>;

/**
 * @class Value
 * @brief One SQL value: NULL, 64-bit integer, double, UTF-8 text or blob.
 *
 * Construction is restricted to types that map onto exactly one storage
 * class, so an unsupported host type is a compile error:
 * - nullptr / default construction  -> NULL
 * - bool                            -> INTEGER 0 or 1
 * - any other integral type         -> INTEGER
 * - float / double / long double    -> FLOAT
 * - const char*, std::string, std::string_view -> TEXT
 * - Blob                            -> BLOB
 *
 * @code
 *   std::vector<Value> params{"Alice", 30, nullptr, 1.5};
 *   stmt.bind(params);
 * @endcode
 */
class Value {
public:
    using Storage = std::variant<std::monostate, std::int64_t, double, std::string, Blob>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : m_data(static_cast<std::int64_t>(value ? 1 : 0)) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T value) : m_data(static_cast<std::int64_t>(value)) {}

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Value(T value) : m_data(static_cast<double>(value)) {}

    /// A null pointer yields NULL rather than undefined behaviour.
    Value(const char* value);
    Value(std::string value) : m_data(std::move(value)) {}
    Value(std::string_view value) : m_data(std::string(value)) {}
    Value(Blob value) : m_data(std::move(value)) {}

    /**
     * @brief Storage class this value binds as.
     */
    ColumnType type() const;

    bool isNull() const { return std::holds_alternative<std::monostate>(m_data); }

    /// @throws std::bad_variant_access if the value is not an INTEGER.
    std::int64_t asInt() const { return std::get<std::int64_t>(m_data); }

    /// @throws std::bad_variant_access if the value is not a FLOAT.
    double asDouble() const { return std::get<double>(m_data); }

    /// @throws std::bad_variant_access if the value is not TEXT.
    const std::string& asText() const { return std::get<std::string>(m_data); }

    /// @throws std::bad_variant_access if the value is not a BLOB.
    const Blob& asBlob() const { return std::get<Blob>(m_data); }

    const Storage& storage() const { return m_data; }

    /**
     * @brief Human-readable rendering: NULL, 42, 1.5, text, x'0aff'.
     */
    std::string toString() const;

    bool operator==(const Value& other) const { return m_data == other.m_data; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage m_data;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

// Lower-case hex, two digits per byte
std::string toHex(const Blob& bytes);

}  // namespace nodal
