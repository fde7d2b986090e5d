#include "Quoter.hpp"
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace sqlquote {

namespace {

constexpr char kBacktick = '`';

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

// Split on delimiter, keeping empty fields
std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            result.push_back(str.substr(start));
            break;
        }
        result.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return result;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += sep;
        result += items[i];
    }
    return result;
}

std::string canonicalName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    std::replace(lower.begin(), lower.end(), '-', '_');
    return lower;
}

}  // namespace

QuoteMode parseQuoteMode(const std::string& mode) {
    std::string name = canonicalName(mode);
    if (name == "table_and_columns" || name == "all") {
        return QuoteMode::TableAndColumns;
    } else if (name == "table_only" || name == "table") {
        return QuoteMode::TableOnly;
    } else if (name == "columns_only" || name == "columns") {
        return QuoteMode::ColumnsOnly;
    }
    throw std::invalid_argument("Unknown quote mode: " + mode);
}

QuotePolicy parseQuotePolicy(const std::string& policy) {
    std::string name = canonicalName(policy);
    if (name == "add_always" || name == "always") {
        return QuotePolicy::AddAlways;
    } else if (name == "no_add" || name == "never") {
        return QuotePolicy::NoAdd;
    } else if (name == "add_reserved" || name == "reserved") {
        return QuotePolicy::AddReserved;
    }
    throw std::invalid_argument("Unknown quote policy: " + policy);
}

std::string toString(QuoteMode mode) {
    switch (mode) {
        case QuoteMode::TableAndColumns: return "table_and_columns";
        case QuoteMode::TableOnly:       return "table_only";
        case QuoteMode::ColumnsOnly:     return "columns_only";
        default:                         return "unknown";
    }
}

std::string toString(QuotePolicy policy) {
    switch (policy) {
        case QuotePolicy::AddAlways:   return "add_always";
        case QuotePolicy::NoAdd:       return "no_add";
        case QuotePolicy::AddReserved: return "add_reserved";
        default:                       return "unknown";
    }
}

std::pair<char, char> dialectQuotes(const Dialect& dialect) {
    std::string pair = dialect.quote("");
    if (pair.size() != 2) {
        throw std::invalid_argument("Dialect " + dialect.name() +
                                    " does not define a two-character quote pair");
    }
    return {pair[0], pair[1]};
}

DialectQuoter::DialectQuoter(const Dialect& dialect, QuoteMode mode, QuotePolicy policy)
    : m_dialect(dialect)
    , m_quotes(dialectQuotes(dialect))
    , m_mode(mode)
    , m_policy(policy) {
}

bool DialectQuoter::isReserved(const std::string& value) const {
    return m_dialect.isReserved(value);
}

bool shouldQuote(bool isColumn, QuoteMode mode, QuotePolicy policy,
                 const std::string& value,
                 const std::function<bool(const std::string&)>& isReserved) {
    bool applies = isColumn
        ? (mode == QuoteMode::TableAndColumns || mode == QuoteMode::ColumnsOnly)
        : (mode == QuoteMode::TableAndColumns || mode == QuoteMode::TableOnly);
    if (!applies) {
        return false;
    }

    switch (policy) {
        case QuotePolicy::AddAlways:
            return true;
        case QuotePolicy::AddReserved:
            return isReserved && isReserved(value);
        case QuotePolicy::NoAdd:
        default:
            return false;
    }
}

bool shouldQuote(const Quoter& quoter, const std::string& value, bool isColumn) {
    return shouldQuote(isColumn, quoter.quoteMode(), quoter.quotePolicy(), value,
                       [&quoter](const std::string& v) { return quoter.isReserved(v); });
}

std::string normalizeIdentifier(const std::string& raw, char prefix, char suffix) {
    std::string value = trim(raw);
    if (value.empty()) {
        return "";
    } else if (value == "*") {
        return "*";
    }

    std::string out;
    out.reserve(value.size() + 8);

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '.') {
            out += '.';
            ++i;
        } else if (value[i] == prefix || value[i] == kBacktick) {
            // Already quoted: re-quote the span up to the matching close
            char close = (value[i] == prefix) ? suffix : kBacktick;
            ++i;
            out += prefix;
            for (; i < value.size() && value[i] != close; ++i) {
                out += value[i];
            }
            out += suffix;
            ++i;
        } else {
            out += prefix;
            for (; i < value.size() && value[i] != '.'; ++i) {
                out += value[i];
            }
            out += suffix;
        }
    }

    return out;
}

void quoteTo(const Quoter& quoter, std::string* out, const std::string& value, bool isColumn) {
    if (!out) {
        return;
    }

    if (!shouldQuote(quoter, value, isColumn)) {
        *out += value;
        return;
    }

    auto quotes = quoter.quotes();
    *out += normalizeIdentifier(value, quotes.first, quotes.second);
}

std::string quote(const Quoter& quoter, const std::string& value, bool isColumn) {
    std::string out;
    quoteTo(quoter, &out, value, isColumn);
    return out;
}

std::string quoteColumns(const Quoter& quoter, const std::string& columns) {
    return quoteJoin(quoter, split(columns, ','));
}

std::string quoteJoin(const Quoter& quoter, const std::vector<std::string>& items) {
    std::vector<std::string> quoted;
    quoted.reserve(items.size());
    for (const auto& item : items) {
        quoted.push_back(quote(quoter, item, true));
    }
    return join(quoted, ",");
}

std::string quoteJoinFunc(const std::vector<std::string>& items,
                          const std::function<std::string(const std::string&)>& quoteFunc,
                          const std::string& sep) {
    std::vector<std::string> quoted;
    quoted.reserve(items.size());
    for (const auto& item : items) {
        quoted.push_back(quoteFunc(item));
    }
    return join(quoted, sep + " ");
}

std::string unquote(const Quoter& quoter, const std::string& value) {
    auto quotes = quoter.quotes();
    const std::string cutset{quotes.first, quotes.second, kBacktick};

    auto start = value.find_first_not_of(cutset);
    if (start == std::string::npos) return "";
    auto end = value.find_last_not_of(cutset);
    return value.substr(start, end - start + 1);
}

}  // namespace sqlquote
