#pragma once

/**
 * @file SQLiteDialect.hpp
 * @brief SQLite identifier quoting dialect.
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class SQLiteDialect
 * @brief Dialect for SQLite: identifiers are quoted with double quotes.
 */
class SQLiteDialect : public Dialect {
public:
    explicit SQLiteDialect(const std::vector<std::string>& extraReserved = {});
    ~SQLiteDialect() override = default;

    DatabaseType type() const override { return DatabaseType::SQLite; }
    std::string quote(const std::string& name) const override;
};

}  // namespace sqlquote
