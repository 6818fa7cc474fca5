#pragma once

/**
 * @file SQLiteResultCode.hpp
 * @brief Closed enumerations over the SQLite status, open-flag and
 *        storage-class code spaces.
 *
 * Call sites switch on these enums instead of raw integers returned by
 * the C API. Codes outside the documented primary space map to
 * ResultCode::Unknown.
 *
 * Values mirror sqlite3.h; the header is not included so that client code
 * does not see native types.
 */

#include <optional>

namespace nodal {

/**
 * @enum ResultCode
 * @brief SQLite primary result codes.
 *
 * See https://www.sqlite.org/rescode.html for the meaning of each code.
 */
enum class ResultCode : int {
    Ok = 0,
    Error = 1,
    Internal = 2,
    Perm = 3,
    Abort = 4,
    Busy = 5,
    Locked = 6,
    NoMem = 7,
    ReadOnly = 8,
    Interrupt = 9,
    IoErr = 10,
    Corrupt = 11,
    NotFound = 12,
    Full = 13,
    CantOpen = 14,
    Protocol = 15,
    Empty = 16,
    Schema = 17,
    TooBig = 18,
    Constraint = 19,
    Mismatch = 20,
    Misuse = 21,
    NoLfs = 22,
    Auth = 23,
    Format = 24,
    Range = 25,
    NotADb = 26,
    Notice = 27,
    Warning = 28,
    Row = 100,
    Done = 101,

    Unknown = -1  ///< Code not part of the documented primary space
};

/**
 * @brief Exact lookup of a primary result code.
 * @param code Integer returned by the SQLite C API.
 * @return Matching variant, or std::nullopt if @p code is not a primary code.
 *
 * Extended codes (e.g. SQLITE_CONSTRAINT_NOTNULL) are not primary codes
 * and return std::nullopt; use toResultCode() to fold them.
 */
std::optional<ResultCode> lookupResultCode(int code);

/**
 * @brief Fold any native code (primary or extended) onto the catalog.
 * @param code Integer returned by the SQLite C API.
 * @return Primary variant for `code & 0xff`, or ResultCode::Unknown.
 */
ResultCode toResultCode(int code);

/**
 * @brief Lower-case name of a result code ("ok", "busy", "constraint").
 */
const char* resultCodeName(ResultCode code);

// Flags accepted by sqlite3_open_v2(). Combine with operator|.
enum class OpenFlags : int {
    None = 0,
    ReadOnly = 0x00000001,
    ReadWrite = 0x00000002,
    Create = 0x00000004,
    Uri = 0x00000040,
    Memory = 0x00000080,
    NoMutex = 0x00008000,
    FullMutex = 0x00010000,
    SharedCache = 0x00020000,
    PrivateCache = 0x00040000,
    NoFollow = 0x01000000
};

constexpr OpenFlags operator|(OpenFlags lhs, OpenFlags rhs) {
    return static_cast<OpenFlags>(static_cast<int>(lhs) | static_cast<int>(rhs));
}

constexpr OpenFlags operator&(OpenFlags lhs, OpenFlags rhs) {
    return static_cast<OpenFlags>(static_cast<int>(lhs) & static_cast<int>(rhs));
}

inline OpenFlags& operator|=(OpenFlags& lhs, OpenFlags rhs) {
    lhs = lhs | rhs;
    return lhs;
}

constexpr bool hasFlag(OpenFlags flags, OpenFlags flag) {
    return (flags & flag) == flag && flag != OpenFlags::None;
}

constexpr OpenFlags kDefaultOpenFlags = OpenFlags::ReadWrite | OpenFlags::Create;

/**
 * @enum ColumnType
 * @brief Storage class of a value in a result row.
 */
enum class ColumnType : int {
    Integer = 1,
    Float = 2,
    Text = 3,
    Blob = 4,
    Null = 5
};

/**
 * @brief Convert a sqlite3_column_type() value.
 * @throws std::invalid_argument if @p value is not a storage class.
 */
ColumnType toColumnType(int value);

const char* columnTypeName(ColumnType type);

}  // namespace nodal
