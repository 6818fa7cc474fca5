#include "Value.hpp"
#include <spdlog/fmt/fmt.h>

namespace nodal {

std::string toHex(const Blob& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

Value::Value(const char* value) {
    if (value) {
        m_data = std::string(value);
    }
}

ColumnType Value::type() const {
    switch (m_data.index()) {
        case 1: return ColumnType::Integer;
        case 2: return ColumnType::Float;
        case 3: return ColumnType::Text;
        case 4: return ColumnType::Blob;
        default: return ColumnType::Null;
    }
}

std::string Value::toString() const {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return "x'" + toHex(v) + "'";
        }
    }, m_data);
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.toString();
}

}  // namespace nodal
