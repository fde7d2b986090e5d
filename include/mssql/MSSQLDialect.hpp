#pragma once

/**
 * @file MSSQLDialect.hpp
 * @brief Microsoft SQL Server identifier quoting dialect.
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class MSSQLDialect
 * @brief Dialect for SQL Server: identifiers are quoted with square brackets.
 *
 * This is the only built-in dialect whose opening and closing quote
 * characters differ ([name]).
 */
class MSSQLDialect : public Dialect {
public:
    explicit MSSQLDialect(const std::vector<std::string>& extraReserved = {});
    ~MSSQLDialect() override = default;

    DatabaseType type() const override { return DatabaseType::MSSQL; }
    std::string quote(const std::string& name) const override;
};

}  // namespace sqlquote
