#include "SQLiteLibrary.hpp"
#include <sqlite3.h>

namespace nodal {

std::string SQLiteLibrary::version() {
    return sqlite3_libversion();
}

int SQLiteLibrary::versionNumber() {
    return sqlite3_libversion_number();
}

std::string SQLiteLibrary::sourceId() {
    return sqlite3_sourceid();
}

bool SQLiteLibrary::isThreadSafe() {
    return sqlite3_threadsafe() != 0;
}

}  // namespace nodal
