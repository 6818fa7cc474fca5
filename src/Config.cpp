#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace nodal {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool parseBool(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

bool isMemoryPath(const std::string& path) {
    return path == ":memory:" || path.rfind("file:", 0) == 0;
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = toLower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "database") {
            if (key == "path") config.database.path = value;
            else if (key == "read_only") config.database.read_only = parseBool(value);
            else if (key == "create") config.database.create = parseBool(value);
            else if (key == "uri") config.database.uri = parseBool(value);
            else if (key == "shared_cache") config.database.shared_cache = parseBool(value);
            else if (key == "no_follow") config.database.no_follow = parseBool(value);
            else spdlog::warn("Unknown key '{}' in [database]", key);
        }
        else if (current_section == "output") {
            if (key == "format") config.output.format = toLower(value);
            else if (key == "pretty_json") config.output.pretty_json = parseBool(value);
            else if (key == "include_header") config.output.include_header = parseBool(value);
            else if (key == "include_null") config.output.include_null = parseBool(value);
            else spdlog::warn("Unknown key '{}' in [output]", key);
        }
        else if (current_section == "logging") {
            if (key == "level") config.logging.level = toLower(value);
            else if (key == "file") config.logging.file = value;
            else spdlog::warn("Unknown key '{}' in [logging]", key);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"nodal-sql - run SQL against an SQLite database"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Database options
    std::string database;
    app.add_option("database", database,
                   "Database file path, :memory: or a file: URI")
        ->required();
    bool read_only = false;
    app.add_flag("--read-only", read_only, "Open the database read-only");
    bool no_create = false;
    app.add_flag("--no-create", no_create, "Fail if the database file does not exist");
    bool uri = false;
    app.add_flag("--uri", uri, "Interpret the database argument as a file: URI");

    // Statement
    std::string sql;
    app.add_option("sql", sql, "SQL statement to run")->required();
    std::vector<std::string> params;
    app.add_option("params", params,
                   "Positional parameters as JSON scalars (42, 1.5, null, \"text\")");

    // Output options
    std::string format;
    app.add_option("--format", format, "Output format")
        ->check(CLI::IsMember({"csv", "json"}));
    bool pretty = false;
    app.add_flag("--pretty", pretty, "Indent JSON output");
    bool no_header = false;
    app.add_flag("--no-header", no_header, "Omit the CSV header line");

    // Logging
    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");
    std::string log_file;
    app.add_option("--log-file", log_file, "Also write the log to this file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Load config file if specified
    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = std::move(*file_config);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line args override file config
    config.database.path = database;
    config.sql = sql;
    config.params = params;
    if (read_only) config.database.read_only = true;
    if (no_create) config.database.create = false;
    if (uri) config.database.uri = true;
    if (!format.empty()) config.output.format = format;
    if (pretty) config.output.pretty_json = true;
    if (no_header) config.output.include_header = false;
    if (!log_file.empty()) config.logging.file = log_file;
    if (debug) config.logging.level = "debug";

    // A read-only database is never created
    if (config.database.read_only) {
        config.database.create = false;
    }

    return config;
}

OpenFlags Config::openFlags() const {
    OpenFlags flags = database.read_only ? OpenFlags::ReadOnly : OpenFlags::ReadWrite;
    if (!database.read_only && database.create) flags |= OpenFlags::Create;
    if (database.uri) flags |= OpenFlags::Uri;
    if (database.shared_cache) flags |= OpenFlags::SharedCache;
    if (database.no_follow) flags |= OpenFlags::NoFollow;
    return flags;
}

bool Config::validate() const {
    if (database.path.empty()) {
        spdlog::error("Database path is required");
        return false;
    }

    if (output.format != "csv" && output.format != "json") {
        spdlog::error("Unknown output format: {}", output.format);
        return false;
    }

    if (database.read_only && database.create) {
        spdlog::error("A read-only database cannot be created");
        return false;
    }

    if (database.read_only && !database.uri && !isMemoryPath(database.path) &&
        !std::filesystem::exists(database.path)) {
        spdlog::error("Database file not found: {}", database.path);
        return false;
    }

    return true;
}

}  // namespace nodal
