#pragma once

#include "SQLiteResultCode.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace nodal {

struct DatabaseConfig {
    std::string path;            // file path, ":memory:" or a file: URI
    bool read_only = false;
    bool create = true;          // create the file when missing
    bool uri = false;            // interpret path as a file: URI
    bool shared_cache = false;
    bool no_follow = false;      // refuse symbolic links
};

struct OutputConfig {
    std::string format = "csv";  // csv, json
    bool pretty_json = false;
    bool include_header = true;
    bool include_null = true;
};

struct LoggingConfig {
    std::string level = "warn";  // trace, debug, info, warn, err, critical, off
    std::string file;            // empty = console only
};

struct Config {
    DatabaseConfig database;
    OutputConfig output;
    LoggingConfig logging;

    std::string sql;
    std::vector<std::string> params;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments; options given on the command line
    // override the values of a --config file
    static Config parseArgs(int argc, char* argv[]);

    // sqlite3_open_v2 flags for the [database] settings
    OpenFlags openFlags() const;

    // Validate configuration
    bool validate() const;
};

}  // namespace nodal
