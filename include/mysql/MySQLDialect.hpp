#pragma once

/**
 * @file MySQLDialect.hpp
 * @brief MySQL/MariaDB identifier quoting dialect.
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class MySQLDialect
 * @brief Dialect for MySQL and MariaDB: identifiers are quoted with backticks.
 */
class MySQLDialect : public Dialect {
public:
    explicit MySQLDialect(const std::vector<std::string>& extraReserved = {});
    ~MySQLDialect() override = default;

    DatabaseType type() const override { return DatabaseType::MySQL; }
    std::string quote(const std::string& name) const override;
};

}  // namespace sqlquote
