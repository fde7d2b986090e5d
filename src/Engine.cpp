#include "Engine.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sqlquote {

Engine::Engine(std::unique_ptr<Dialect> dialect, QuoteMode mode, QuotePolicy policy)
    : m_dialect(std::move(dialect))
    , m_mode(mode)
    , m_policy(policy) {
    if (!m_dialect) {
        throw std::invalid_argument("Engine requires a dialect");
    }
    // Rejects dialects without a two-character quote pair up front
    dialectQuotes(*m_dialect);

    spdlog::debug("Quoting engine initialized: dialect={}, mode={}, policy={}",
                  m_dialect->name(), toString(m_mode), toString(m_policy));
}

std::unique_ptr<Engine> Engine::create(const Config& config) {
    DatabaseType type = parseDatabaseType(config.dialect.database_type);
    QuoteMode mode = parseQuoteMode(config.quoting.mode);
    QuotePolicy policy = parseQuotePolicy(config.quoting.policy);

    return std::make_unique<Engine>(createDialect(type, config.dialect.reserved_words),
                                    mode, policy);
}

std::pair<char, char> Engine::quotes() const {
    return dialectQuotes(*m_dialect);
}

bool Engine::isReserved(const std::string& value) const {
    return m_dialect->isReserved(value);
}

std::string Engine::quote(const std::string& value, bool isColumn) const {
    return sqlquote::quote(*this, value, isColumn);
}

std::string Engine::quoteColumns(const std::string& columns) const {
    return sqlquote::quoteColumns(*this, columns);
}

std::string Engine::quoteJoin(const std::vector<std::string>& items) const {
    return sqlquote::quoteJoin(*this, items);
}

std::string Engine::unquote(const std::string& value) const {
    return sqlquote::unquote(*this, value);
}

}  // namespace sqlquote
