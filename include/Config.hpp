#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace sqlquote {

struct DialectConfig {
    std::string database_type = "mysql";  // mysql, sqlite, postgresql, oracle, mssql
    std::vector<std::string> reserved_words;  // added to the built-in list
};

struct QuotingConfig {
    std::string mode = "table_and_columns";
    std::string policy = "add_always";
};

// What the sql-quote tool does with its arguments
struct OutputConfig {
    bool tables = false;   // quote as table names instead of columns
    bool columns = false;  // each argument is a comma-separated column list
    bool unquote = false;
    bool json = false;
    bool pretty_json = true;
};

struct Config {
    DialectConfig dialect;
    QuotingConfig quoting;
    OutputConfig output;

    std::vector<std::string> identifiers;
    bool debug = false;
    std::string log_file;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;
};

}  // namespace sqlquote
