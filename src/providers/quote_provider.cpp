#include "riskdesk/providers/quote_provider.hpp"
#include <algorithm>
#include <cctype>

namespace riskdesk {

namespace {

constexpr size_t MAX_SYMBOL_LENGTH = 15;

bool is_symbol_char(char c) {
    return std::isupper(static_cast<unsigned char>(c)) ||
           std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '^' || c == '=' ||
           c == '-';
}

}  // namespace

ErrorCode classify_http_status(long status) {
    if (status >= 200 && status < 300) {
        return ErrorCode::NONE;
    }
    if (status == 404) {
        return ErrorCode::NOT_FOUND;
    }
    if (status == 429) {
        return ErrorCode::RATE_LIMITED;
    }
    // 5xx, redirects that were not followed and unexpected 4xx are all worth
    // a try on the next provider
    return ErrorCode::TRANSIENT_ERROR;
}

Result<std::string> normalize_symbol(const std::string& symbol) {
    std::string normalized;
    normalized.reserve(symbol.size());
    for (char c : symbol) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (normalized.empty()) {
        return make_error<std::string>(ErrorCode::VALIDATION_ERROR, "Symbol cannot be empty",
                                       "SymbolValidator");
    }
    if (normalized.size() > MAX_SYMBOL_LENGTH) {
        return make_error<std::string>(ErrorCode::VALIDATION_ERROR,
                                       "Symbol too long: " + normalized, "SymbolValidator");
    }
    if (!std::all_of(normalized.begin(), normalized.end(), is_symbol_char)) {
        return make_error<std::string>(ErrorCode::VALIDATION_ERROR,
                                       "Symbol contains invalid characters: " + normalized,
                                       "SymbolValidator");
    }
    return Result<std::string>(std::move(normalized));
}

std::vector<PriceBar> normalize_bars(std::vector<PriceBar> bars, const DateRange& range) {
    bars.erase(std::remove_if(bars.begin(), bars.end(),
                              [&range](const PriceBar& bar) { return !range.contains(bar.date); }),
               bars.end());

    // Stable sort keeps input order within a date, so the last duplicate wins
    std::stable_sort(bars.begin(), bars.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });

    std::vector<PriceBar> out;
    out.reserve(bars.size());
    for (auto& bar : bars) {
        if (!out.empty() && out.back().date == bar.date) {
            out.back() = std::move(bar);
        } else {
            out.push_back(std::move(bar));
        }
    }
    return out;
}

}  // namespace riskdesk
