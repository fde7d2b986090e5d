#pragma once

/**
 * @file PostgreSQLDialect.hpp
 * @brief PostgreSQL identifier quoting dialect.
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class PostgreSQLDialect
 * @brief Dialect for PostgreSQL: identifiers are quoted with double quotes.
 */
class PostgreSQLDialect : public Dialect {
public:
    explicit PostgreSQLDialect(const std::vector<std::string>& extraReserved = {});
    ~PostgreSQLDialect() override = default;

    DatabaseType type() const override { return DatabaseType::PostgreSQL; }
    std::string quote(const std::string& name) const override;
};

}  // namespace sqlquote
