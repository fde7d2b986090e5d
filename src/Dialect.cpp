#include "Dialect.hpp"
#include "MySQLDialect.hpp"
#include "SQLiteDialect.hpp"
#include "PostgreSQLDialect.hpp"
#include "OracleDialect.hpp"
#include "MSSQLDialect.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace sqlquote {

DatabaseType parseDatabaseType(const std::string& type) {
    std::string lower = type;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "mysql" || lower == "mariadb") {
        return DatabaseType::MySQL;
    } else if (lower == "sqlite" || lower == "sqlite3") {
        return DatabaseType::SQLite;
    } else if (lower == "postgresql" || lower == "postgres" || lower == "pgsql") {
        return DatabaseType::PostgreSQL;
    } else if (lower == "oracle") {
        return DatabaseType::Oracle;
    } else if (lower == "mssql" || lower == "sqlserver") {
        return DatabaseType::MSSQL;
    }

    throw std::invalid_argument("Unknown database type: " + type);
}

std::string databaseTypeToString(DatabaseType type) {
    switch (type) {
        case DatabaseType::MySQL:
            return "mysql";
        case DatabaseType::SQLite:
            return "sqlite";
        case DatabaseType::PostgreSQL:
            return "postgresql";
        case DatabaseType::Oracle:
            return "oracle";
        case DatabaseType::MSSQL:
            return "mssql";
        default:
            return "unknown";
    }
}

Dialect::Dialect(std::initializer_list<const char*> reserved,
                 const std::vector<std::string>& extraReserved) {
    m_reserved.reserve(reserved.size() + extraReserved.size());
    for (const char* word : reserved) {
        m_reserved.insert(word);
    }
    for (const auto& word : extraReserved) {
        if (!word.empty()) {
            m_reserved.insert(toUpper(word));
        }
    }
}

bool Dialect::isReserved(const std::string& value) const {
    return m_reserved.count(toUpper(value)) > 0;
}

std::string Dialect::toUpper(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

std::unique_ptr<Dialect> createDialect(DatabaseType type,
                                       const std::vector<std::string>& extraReserved) {
    std::unique_ptr<Dialect> dialect;
    switch (type) {
        case DatabaseType::MySQL:
            dialect = std::make_unique<MySQLDialect>(extraReserved);
            break;
        case DatabaseType::SQLite:
            dialect = std::make_unique<SQLiteDialect>(extraReserved);
            break;
        case DatabaseType::PostgreSQL:
            dialect = std::make_unique<PostgreSQLDialect>(extraReserved);
            break;
        case DatabaseType::Oracle:
            dialect = std::make_unique<OracleDialect>(extraReserved);
            break;
        case DatabaseType::MSSQL:
            dialect = std::make_unique<MSSQLDialect>(extraReserved);
            break;
        default:
            throw std::invalid_argument("Unsupported database type");
    }

    spdlog::debug("Created {} dialect ({} reserved words, {} from configuration)",
                  dialect->name(), dialect->reservedWordCount(), extraReserved.size());
    return dialect;
}

}  // namespace sqlquote
