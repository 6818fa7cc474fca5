#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "SQLiteLibrary.hpp"
#include "SqliteClient.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <string>
#include <vector>

using namespace nodal;

namespace {

constexpr const char* kVersion = "1.0.0";

void setupLogging(const LoggingConfig& logging) {
    spdlog::level::level_enum level = spdlog::level::from_str(logging.level);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Query output goes to stdout; diagnostics go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!logging.file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logging.file << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("nodal-sql", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printVersion() {
    std::cout << "nodal-sql version " << kVersion << "\n";
    std::cout << "SQLite " << SQLiteLibrary::version()
              << (SQLiteLibrary::isThreadSafe() ? " (thread-safe)" : "") << "\n";
    std::cout << SQLiteLibrary::sourceId() << std::endl;
}

std::string render(const QueryResult& result, const OutputConfig& output) {
    if (output.format == "json") {
        JSONOptions options;
        options.pretty = output.pretty_json;
        options.includeNull = output.include_null;
        return FormatConverter::toJSON(result, options) + "\n";
    }
    CSVOptions options;
    options.includeHeader = output.include_header;
    return FormatConverter::toCSV(result, options);
}

int run(const Config& config) {
    std::vector<Value> params;
    params.reserve(config.params.size());
    for (const auto& token : config.params) {
        params.push_back(FormatConverter::parseParameter(token));
    }

    auto client = SqliteClient::open(config.database.path, config.openFlags());

    // A busy database is retried with backoff before giving up
    QueryResult result = ErrorHandler::executeWithRetry([&]() {
        return client->query(config.sql, params);
    });

    if (!result.columnNames().empty()) {
        std::cout << render(result, config.output);
    } else {
        std::cout << "changes: " << client->updatedRows() << std::endl;
    }

    client->close();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-V" || arg == "--version") {
            printVersion();
            return 0;
        }
    }

    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.logging);

    spdlog::debug("nodal-sql {} with SQLite {}", kVersion, SQLiteLibrary::version());
    spdlog::debug("Database: {}", config.database.path);

    try {
        if (!config.validate()) {
            return 1;
        }
        return run(config);
    } catch (const ClientException& e) {
        spdlog::error("{}", e.toString());
        int code = e.resultCode() ? ErrorHandler::sqliteToErrno(*e.resultCode()) : 0;
        return code != 0 ? code : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
