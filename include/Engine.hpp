#pragma once

#include "Config.hpp"
#include "Dialect.hpp"
#include "Quoter.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sqlquote {

// Owns the active dialect and its quoting configuration; the entry point
// the statement builder uses to quote identifiers.
class Engine : public Quoter {
public:
    Engine(std::unique_ptr<Dialect> dialect, QuoteMode mode, QuotePolicy policy);
    ~Engine() override = default;

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Build from configuration; throws std::invalid_argument on unknown
    // database type, mode or policy
    static std::unique_ptr<Engine> create(const Config& config);

    // Quoter
    std::pair<char, char> quotes() const override;
    QuoteMode quoteMode() const override { return m_mode; }
    QuotePolicy quotePolicy() const override { return m_policy; }
    bool isReserved(const std::string& value) const override;

    const Dialect& dialect() const { return *m_dialect; }

    std::string quote(const std::string& value, bool isColumn) const;
    std::string quoteColumns(const std::string& columns) const;
    std::string quoteJoin(const std::vector<std::string>& items) const;
    std::string unquote(const std::string& value) const;

private:
    std::unique_ptr<Dialect> m_dialect;
    QuoteMode m_mode;
    QuotePolicy m_policy;
};

}  // namespace sqlquote
