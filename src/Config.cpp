#include "Config.hpp"
#include "Dialect.hpp"
#include "Quoter.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace sqlquote {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            if (!current.empty()) {
                result.push_back(trim(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        result.push_back(trim(current));
    }
    return result;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
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
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            spdlog::warn("Ignoring malformed line in {}: {}", path.string(), line);
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

        if (current_section == "dialect") {
            if (key == "type") config.dialect.database_type = value;
            else if (key == "reserved_words") config.dialect.reserved_words = split(value, ',');
        }
        else if (current_section == "quoting") {
            if (key == "mode") config.quoting.mode = value;
            else if (key == "policy") config.quoting.policy = value;
        }
        else if (current_section == "output") {
            if (key == "tables") config.output.tables = parseBool(value);
            else if (key == "columns") config.output.columns = parseBool(value);
            else if (key == "json") config.output.json = parseBool(value);
            else if (key == "pretty_json") config.output.pretty_json = parseBool(value);
        }
        else if (current_section == "logging") {
            if (key == "debug") config.debug = parseBool(value);
            else if (key == "file") config.log_file = value;
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"sql-quote - Quote SQL identifiers for a database dialect"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    std::string database_type;
    app.add_option("-t,--type", database_type,
                   "Database type (mysql, sqlite, postgresql, oracle, mssql)");
    std::string mode;
    app.add_option("-m,--mode", mode,
                   "Quote mode (table_and_columns, table_only, columns_only)");
    std::string policy;
    app.add_option("-p,--policy", policy,
                   "Quote policy (add_always, no_add, add_reserved)");
    std::string reserved_str;
    app.add_option("-r,--reserved", reserved_str,
                   "Comma-separated extra reserved words");

    bool tables = false;
    bool columns = false;
    bool unquote = false;
    bool json = false;
    bool debug = false;
    app.add_flag("--table", tables, "Quote arguments as table names");
    app.add_flag("--columns", columns, "Treat each argument as a comma-separated column list");
    app.add_flag("-u,--unquote", unquote, "Strip quotes instead of adding them");
    app.add_flag("-j,--json", json, "Print results as a JSON array");
    app.add_flag("-d,--debug", debug, "Enable debug output");
    std::string log_file;
    app.add_option("-l,--log-file", log_file, "Also write the log to this file");

    std::vector<std::string> identifiers;
    app.add_option("identifiers", identifiers, "Identifiers to quote")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Command line args override file config
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    if (!database_type.empty()) config.dialect.database_type = database_type;
    if (!mode.empty()) config.quoting.mode = mode;
    if (!policy.empty()) config.quoting.policy = policy;
    if (!reserved_str.empty()) {
        for (auto& word : split(reserved_str, ',')) {
            config.dialect.reserved_words.push_back(std::move(word));
        }
    }

    config.output.tables = config.output.tables || tables;
    config.output.columns = config.output.columns || columns;
    config.output.unquote = unquote;
    config.output.json = config.output.json || json;
    config.debug = config.debug || debug;
    if (!log_file.empty()) config.log_file = log_file;

    config.identifiers = std::move(identifiers);

    return config;
}

bool Config::validate() const {
    try {
        parseDatabaseType(dialect.database_type);
        parseQuoteMode(quoting.mode);
        parseQuotePolicy(quoting.policy);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    if (output.tables && output.columns) {
        spdlog::error("--table and --columns cannot be combined");
        return false;
    }

    if (identifiers.empty()) {
        spdlog::error("No identifiers given");
        return false;
    }

    return true;
}

}  // namespace sqlquote
