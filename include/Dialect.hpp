#pragma once

#include <string>
#include <vector>
#include <memory>
#include <initializer_list>
#include <unordered_set>

namespace sqlquote {

// Database type enumeration
enum class DatabaseType {
    MySQL,
    SQLite,
    PostgreSQL,
    Oracle,
    MSSQL
};

// Convert string to DatabaseType
DatabaseType parseDatabaseType(const std::string& type);

// Convert DatabaseType to string
std::string databaseTypeToString(DatabaseType type);

// Abstract base class for a SQL dialect: identifier quote characters and
// reserved-word membership. Instances are immutable once constructed.
class Dialect {
public:
    virtual ~Dialect() = default;

    virtual DatabaseType type() const = 0;
    virtual std::string name() const { return databaseTypeToString(type()); }

    // Wrap name in the dialect's identifier quotes; quote("") yields the pair
    virtual std::string quote(const std::string& name) const = 0;

    // Case-insensitive reserved word test
    virtual bool isReserved(const std::string& value) const;

    size_t reservedWordCount() const { return m_reserved.size(); }

protected:
    Dialect(std::initializer_list<const char*> reserved,
            const std::vector<std::string>& extraReserved);

    static std::string toUpper(const std::string& value);

private:
    std::unordered_set<std::string> m_reserved;
};

// Create the dialect for a database type. Extra reserved words are merged
// into the built-in list.
std::unique_ptr<Dialect> createDialect(DatabaseType type,
                                       const std::vector<std::string>& extraReserved = {});

}  // namespace sqlquote
