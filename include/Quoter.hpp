#pragma once

/**
 * @file Quoter.hpp
 * @brief Dialect-aware quoting of SQL table and column identifiers.
 *
 * Identifiers may be dot-qualified (schema.table) and may already carry
 * quotes, either the target dialect's own or backticks written for another
 * dialect. Quoting rewrites every segment into the target dialect's quote
 * characters without double-quoting segments that are already quoted.
 *
 * All functions here are pure and allocate only local buffers; a Quoter is
 * read-only after construction and may be shared between threads.
 */

#include "Dialect.hpp"
#include <string>
#include <vector>
#include <utility>
#include <functional>

namespace sqlquote {

// Which identifier kinds the quoting rules apply to
enum class QuoteMode {
    TableAndColumns,
    TableOnly,
    ColumnsOnly
};

// When quotes are added to an identifier the rules apply to
enum class QuotePolicy {
    AddAlways,
    NoAdd,
    AddReserved
};

QuoteMode parseQuoteMode(const std::string& mode);
QuotePolicy parseQuotePolicy(const std::string& policy);
std::string toString(QuoteMode mode);
std::string toString(QuotePolicy policy);

/**
 * @class Quoter
 * @brief Quoting capability: quote pair, mode, policy and reserved word test.
 */
class Quoter {
public:
    virtual ~Quoter() = default;

    // Opening and closing identifier quote characters
    virtual std::pair<char, char> quotes() const = 0;
    virtual QuoteMode quoteMode() const = 0;
    virtual QuotePolicy quotePolicy() const = 0;
    virtual bool isReserved(const std::string& value) const = 0;
};

/**
 * @class DialectQuoter
 * @brief Standalone Quoter over a borrowed Dialect.
 *
 * The dialect must outlive the quoter. Several quoters with different
 * mode/policy may share one dialect.
 */
class DialectQuoter : public Quoter {
public:
    DialectQuoter(const Dialect& dialect, QuoteMode mode, QuotePolicy policy);

    std::pair<char, char> quotes() const override { return m_quotes; }
    QuoteMode quoteMode() const override { return m_mode; }
    QuotePolicy quotePolicy() const override { return m_policy; }
    bool isReserved(const std::string& value) const override;

    const Dialect& dialect() const { return m_dialect; }

private:
    const Dialect& m_dialect;
    std::pair<char, char> m_quotes;
    QuoteMode m_mode;
    QuotePolicy m_policy;
};

// Derive the (prefix, suffix) pair from dialect.quote("")
std::pair<char, char> dialectQuotes(const Dialect& dialect);

/**
 * @brief Decide whether an identifier must be quoted.
 * @param isColumn true for column identifiers, false for table identifiers.
 * @param isReserved consulted only when the mode applies and the policy is
 *        AddReserved.
 *
 * When the mode does not cover the identifier kind the value is emitted
 * verbatim, without any normalization of existing quotes.
 */
bool shouldQuote(bool isColumn, QuoteMode mode, QuotePolicy policy,
                 const std::string& value,
                 const std::function<bool(const std::string&)>& isReserved);
bool shouldQuote(const Quoter& quoter, const std::string& value, bool isColumn);

/**
 * @brief Rewrite an identifier with the canonical quote characters.
 *
 * Surrounding whitespace is trimmed; an empty value yields "" and a lone
 * "*" is returned as is. Each dot-separated segment is wrapped in
 * prefix/suffix. A segment opened by prefix (closed by suffix) or by a
 * backtick (closed by a backtick) is copied up to its closing quote,
 * dots included; an unterminated segment runs to the end of the input.
 * Quote characters inside an unquoted segment are copied unescaped.
 */
std::string normalizeIdentifier(const std::string& value, char prefix, char suffix);

// Append the quoted form of value to out; no-op when out is null
void quoteTo(const Quoter& quoter, std::string* out, const std::string& value, bool isColumn);

// Quote a single identifier
std::string quote(const Quoter& quoter, const std::string& value, bool isColumn);

// Quote each column of a comma-separated list; rejoined with ","
std::string quoteColumns(const Quoter& quoter, const std::string& columns);

// Quote each item as a column; joined with ","
std::string quoteJoin(const Quoter& quoter, const std::vector<std::string>& items);

// Apply quoteFunc to each item; joined with sep followed by a space
std::string quoteJoinFunc(const std::vector<std::string>& items,
                          const std::function<std::string(const std::string&)>& quoteFunc,
                          const std::string& sep);

// Strip the quoter's quote characters and backticks from both ends
std::string unquote(const Quoter& quoter, const std::string& value);

}  // namespace sqlquote
