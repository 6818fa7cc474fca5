#pragma once

/**
 * @file SQLiteLibrary.hpp
 * @brief Version information about the linked SQLite library.
 */

#include <string>

namespace nodal {

/**
 * @class SQLiteLibrary
 * @brief Static queries against the SQLite library itself.
 */
class SQLiteLibrary {
public:
    /**
     * @brief Version string of the linked library, e.g. "3.45.1".
     */
    static std::string version();

    /**
     * @brief Version as major*1000000 + minor*1000 + patch.
     */
    static int versionNumber();

    /**
     * @brief Check-in hash and date the library was built from.
     */
    static std::string sourceId();

    /**
     * @brief Whether the library was compiled with mutexes enabled.
     */
    static bool isThreadSafe();
};

}  // namespace nodal
