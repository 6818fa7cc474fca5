/**
 * @file SQLiteValue.cpp
 * @brief sqlite3_bind_* / sqlite3_column_* dispatch for Value.
 */

#include "SQLiteValue.hpp"
#include <climits>

namespace nodal {

// ============================================================================
// Native marshaling
// ============================================================================

int bindValue(sqlite3_stmt* stmt, int index, const Value& value) {
    return std::visit([stmt, index](auto&& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (v.size() > static_cast<size_t>(INT_MAX)) {
                return SQLITE_TOOBIG;
            }
            return sqlite3_bind_text(stmt, index, v.data(), static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        } else {
            if (v.size() > static_cast<size_t>(INT_MAX)) {
                return SQLITE_TOOBIG;
            }
            if (v.empty()) {
                // sqlite3_bind_blob with a null pointer would store NULL
                return sqlite3_bind_zeroblob(stmt, index, 0);
            }
            return sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        }
    }, value.storage());
}

Value readColumn(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return Value(static_cast<std::int64_t>(sqlite3_column_int64(stmt, index)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(stmt, index));
        case SQLITE_TEXT: {
            const unsigned char* text = sqlite3_column_text(stmt, index);
            int length = sqlite3_column_bytes(stmt, index);
            if (!text) return Value(std::string());
            return Value(std::string(reinterpret_cast<const char*>(text),
                                     static_cast<size_t>(length)));
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int length = sqlite3_column_bytes(stmt, index);
            if (!data || length <= 0) return Value(Blob{});
            const auto* bytes = static_cast<const std::uint8_t*>(data);
            return Value(Blob(bytes, bytes + length));
        }
        case SQLITE_NULL:
        default:
            return Value();
    }
}

}  // namespace nodal
