#pragma once

/**
 * @file OracleDialect.hpp
 * @brief Oracle identifier quoting dialect.
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class OracleDialect
 * @brief Dialect for Oracle: identifiers are quoted with double quotes.
 */
class OracleDialect : public Dialect {
public:
    explicit OracleDialect(const std::vector<std::string>& extraReserved = {});
    ~OracleDialect() override = default;

    DatabaseType type() const override { return DatabaseType::Oracle; }
    std::string quote(const std::string& name) const override;
};

}  // namespace sqlquote
