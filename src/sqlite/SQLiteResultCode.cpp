#include "SQLiteResultCode.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace nodal {

static_assert(static_cast<int>(ResultCode::Busy) == SQLITE_BUSY, "result code mismatch");
static_assert(static_cast<int>(ResultCode::Constraint) == SQLITE_CONSTRAINT, "result code mismatch");
static_assert(static_cast<int>(ResultCode::Warning) == SQLITE_WARNING, "result code mismatch");
static_assert(static_cast<int>(ResultCode::Row) == SQLITE_ROW, "result code mismatch");
static_assert(static_cast<int>(ResultCode::Done) == SQLITE_DONE, "result code mismatch");
static_assert(static_cast<int>(OpenFlags::ReadOnly) == SQLITE_OPEN_READONLY, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::ReadWrite) == SQLITE_OPEN_READWRITE, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::Create) == SQLITE_OPEN_CREATE, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::Uri) == SQLITE_OPEN_URI, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::Memory) == SQLITE_OPEN_MEMORY, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::NoMutex) == SQLITE_OPEN_NOMUTEX, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::FullMutex) == SQLITE_OPEN_FULLMUTEX, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::SharedCache) == SQLITE_OPEN_SHAREDCACHE, "open flag mismatch");
static_assert(static_cast<int>(OpenFlags::PrivateCache) == SQLITE_OPEN_PRIVATECACHE, "open flag mismatch");
static_assert(static_cast<int>(ColumnType::Integer) == SQLITE_INTEGER, "column type mismatch");
static_assert(static_cast<int>(ColumnType::Float) == SQLITE_FLOAT, "column type mismatch");
static_assert(static_cast<int>(ColumnType::Text) == SQLITE_TEXT, "column type mismatch");
static_assert(static_cast<int>(ColumnType::Blob) == SQLITE_BLOB, "column type mismatch");
static_assert(static_cast<int>(ColumnType::Null) == SQLITE_NULL, "column type mismatch");

std::optional<ResultCode> lookupResultCode(int code) {
    switch (code) {
        case SQLITE_OK:         return ResultCode::Ok;
        case SQLITE_ERROR:      return ResultCode::Error;
        case SQLITE_INTERNAL:   return ResultCode::Internal;
        case SQLITE_PERM:       return ResultCode::Perm;
        case SQLITE_ABORT:      return ResultCode::Abort;
        case SQLITE_BUSY:       return ResultCode::Busy;
        case SQLITE_LOCKED:     return ResultCode::Locked;
        case SQLITE_NOMEM:      return ResultCode::NoMem;
        case SQLITE_READONLY:   return ResultCode::ReadOnly;
        case SQLITE_INTERRUPT:  return ResultCode::Interrupt;
        case SQLITE_IOERR:      return ResultCode::IoErr;
        case SQLITE_CORRUPT:    return ResultCode::Corrupt;
        case SQLITE_NOTFOUND:   return ResultCode::NotFound;
        case SQLITE_FULL:       return ResultCode::Full;
        case SQLITE_CANTOPEN:   return ResultCode::CantOpen;
        case SQLITE_PROTOCOL:   return ResultCode::Protocol;
        case SQLITE_EMPTY:      return ResultCode::Empty;
        case SQLITE_SCHEMA:     return ResultCode::Schema;
        case SQLITE_TOOBIG:     return ResultCode::TooBig;
        case SQLITE_CONSTRAINT: return ResultCode::Constraint;
        case SQLITE_MISMATCH:   return ResultCode::Mismatch;
        case SQLITE_MISUSE:     return ResultCode::Misuse;
        case SQLITE_NOLFS:      return ResultCode::NoLfs;
        case SQLITE_AUTH:       return ResultCode::Auth;
        case SQLITE_FORMAT:     return ResultCode::Format;
        case SQLITE_RANGE:      return ResultCode::Range;
        case SQLITE_NOTADB:     return ResultCode::NotADb;
        case SQLITE_NOTICE:     return ResultCode::Notice;
        case SQLITE_WARNING:    return ResultCode::Warning;
        case SQLITE_ROW:        return ResultCode::Row;
        case SQLITE_DONE:       return ResultCode::Done;
        default:
            return std::nullopt;
    }
}

ResultCode toResultCode(int code) {
    if (code < 0) {
        return ResultCode::Unknown;
    }
    // Extended codes keep the primary code in the low byte
    return lookupResultCode(code & 0xff).value_or(ResultCode::Unknown);
}

const char* resultCodeName(ResultCode code) {
    switch (code) {
        case ResultCode::Ok:         return "ok";
        case ResultCode::Error:      return "error";
        case ResultCode::Internal:   return "internal";
        case ResultCode::Perm:       return "perm";
        case ResultCode::Abort:      return "abort";
        case ResultCode::Busy:       return "busy";
        case ResultCode::Locked:     return "locked";
        case ResultCode::NoMem:      return "nomem";
        case ResultCode::ReadOnly:   return "readonly";
        case ResultCode::Interrupt:  return "interrupt";
        case ResultCode::IoErr:      return "ioerr";
        case ResultCode::Corrupt:    return "corrupt";
        case ResultCode::NotFound:   return "notfound";
        case ResultCode::Full:       return "full";
        case ResultCode::CantOpen:   return "cantopen";
        case ResultCode::Protocol:   return "protocol";
        case ResultCode::Empty:      return "empty";
        case ResultCode::Schema:     return "schema";
        case ResultCode::TooBig:     return "toobig";
        case ResultCode::Constraint: return "constraint";
        case ResultCode::Mismatch:   return "mismatch";
        case ResultCode::Misuse:     return "misuse";
        case ResultCode::NoLfs:      return "nolfs";
        case ResultCode::Auth:       return "auth";
        case ResultCode::Format:     return "format";
        case ResultCode::Range:      return "range";
        case ResultCode::NotADb:     return "notadb";
        case ResultCode::Notice:     return "notice";
        case ResultCode::Warning:    return "warning";
        case ResultCode::Row:        return "row";
        case ResultCode::Done:       return "done";
        case ResultCode::Unknown:    return "unknown";
    }
    return "unknown";
}

ColumnType toColumnType(int value) {
    switch (value) {
        case SQLITE_INTEGER: return ColumnType::Integer;
        case SQLITE_FLOAT:   return ColumnType::Float;
        case SQLITE_TEXT:    return ColumnType::Text;
        case SQLITE_BLOB:    return ColumnType::Blob;
        case SQLITE_NULL:    return ColumnType::Null;
        default:
            throw std::invalid_argument("Unknown SQLite column type: " +
                                        std::to_string(value));
    }
}

const char* columnTypeName(ColumnType type) {
    switch (type) {
        case ColumnType::Integer: return "integer";
        case ColumnType::Float:   return "float";
        case ColumnType::Text:    return "text";
        case ColumnType::Blob:    return "blob";
        case ColumnType::Null:    return "null";
    }
    return "unknown";
}

}  // namespace nodal
