#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "riskdesk/core/logger.hpp"
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/data/credential_store.hpp"
#include "riskdesk/engine/engine_config.hpp"
#include "riskdesk/engine/market_data_service.hpp"

using namespace riskdesk;

namespace {

void print_usage() {
    std::cerr << "Usage: riskdesk_cli [--config engine.json] [--credentials credentials.json] "
                 "<command>\n"
              << "Commands:\n"
              << "  history SYMBOL START END      Daily bars, dates as YYYY-MM-DD\n"
              << "  quote SYMBOL                  Latest quote\n"
              << "  metrics SYMBOL START END      Risk metrics of one symbol\n"
              << "  portfolio SYMBOL=DOLLARS...   Risk metrics of an allocation\n"
              << "  pnl SYMBOL=QTY@COST...        P&L of holdings at latest quotes\n"
              << "  invalidate [SYMBOL]           Drop cached data, all symbols if none given\n";
}

nlohmann::json bar_to_json(const PriceBar& bar) {
    return {{"date", core::format_date(bar.date)}, {"open", bar.open},   {"high", bar.high},
            {"low", bar.low},                      {"close", bar.close}, {"volume", bar.volume}};
}

nlohmann::json series_to_json(const SeriesResult& result) {
    nlohmann::json bars = nlohmann::json::array();
    for (const auto& bar : result.series.bars) {
        bars.push_back(bar_to_json(bar));
    }
    return {{"symbol", result.series.symbol},
            {"start", core::format_date(result.series.range.start)},
            {"end", core::format_date(result.series.range.end)},
            {"fetched_at", core::format_timestamp(result.series.fetched_at)},
            {"stale", result.stale},
            {"bars", bars}};
}

nlohmann::json quote_to_json(const QuoteResult& result) {
    nlohmann::json j = bar_to_json(result.quote);
    j["symbol"] = result.quote.symbol;
    j["fetched_at"] = core::format_timestamp(result.fetched_at);
    j["stale"] = result.stale;
    return j;
}

nlohmann::json pnl_to_json(const PortfolioPnl& pnl) {
    nlohmann::json positions = nlohmann::json::array();
    for (const auto& p : pnl.positions) {
        positions.push_back({{"symbol", p.symbol},
                             {"quantity", p.quantity},
                             {"cost_basis", p.cost_basis},
                             {"current_price", p.current_price},
                             {"market_value", p.market_value},
                             {"pnl", p.pnl},
                             {"pnl_percent", p.pnl_percent ? nlohmann::json(*p.pnl_percent)
                                                           : nlohmann::json(nullptr)},
                             {"stale", p.stale}});
    }
    return {{"positions", positions},
            {"total_cost", pnl.total_cost},
            {"total_value", pnl.total_value},
            {"total_pnl", pnl.total_pnl},
            {"pnl_percent",
             pnl.pnl_percent ? nlohmann::json(*pnl.pnl_percent) : nlohmann::json(nullptr)},
            {"stale", pnl.stale}};
}

bool parse_range(const std::string& start, const std::string& end, DateRange& range) {
    auto s = core::parse_date(start);
    auto e = core::parse_date(end);
    if (!s || !e) {
        std::cerr << "Dates must be YYYY-MM-DD" << std::endl;
        return false;
    }
    range = DateRange(*s, *e);
    return true;
}

// "KEY=VALUE" with a numeric value
bool split_assignment(const std::string& arg, std::string& key, std::string& value) {
    auto pos = arg.find('=');
    if (pos == std::string::npos || pos == 0 || pos + 1 == arg.size()) {
        std::cerr << "Expected SYMBOL=VALUE, got " << arg << std::endl;
        return false;
    }
    key = arg.substr(0, pos);
    value = arg.substr(pos + 1);
    return true;
}

bool parse_number(const std::string& text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        if (used != text.size()) {
            std::cerr << "Not a number: " << text << std::endl;
            return false;
        }
        return true;
    } catch (const std::exception&) {
        std::cerr << "Not a number: " << text << std::endl;
        return false;
    }
}

template <typename T>
int report(const Result<T>& result, nlohmann::json (*to_json)(const T&), bool stale,
           const std::string& warning) {
    if (result.is_error()) {
        std::cerr << result.error()->to_string() << std::endl;
        return 1;
    }
    if (stale) {
        std::cerr << "WARNING: stale data returned: " << warning << std::endl;
    }
    std::cout << std::setw(2) << to_json(result.value()) << std::endl;
    return 0;
}

nlohmann::json analysis_to_json(const analytics::AnalysisResult& result) {
    return result.to_json();
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string credentials_path = "credentials.json";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--credentials" && i + 1 < argc) {
            credentials_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = config.load_from_file(config_path);
        if (loaded.is_error()) {
            std::cerr << "Failed to load config: " << loaded.error()->what() << std::endl;
            return 1;
        }
    }

    try {
        Logger::instance().initialize(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }
    Logger::register_component("riskdesk_cli");

    CredentialStore credentials(credentials_path);
    auto credentials_loaded = credentials.load_config();
    if (credentials_loaded.is_error()) {
        // Environment variables may still supply every secret
        WARN("Credentials file not loaded: " << credentials_loaded.error()->what());
    }

    auto service_result = MarketDataService::create(config, credentials);
    if (service_result.is_error()) {
        std::cerr << "Failed to start engine: " << service_result.error()->to_string() << std::endl;
        return 1;
    }
    const auto& service = service_result.value();

    const std::string& command = args[0];

    if (command == "history" && args.size() == 4) {
        DateRange range;
        if (!parse_range(args[2], args[3], range)) {
            return 1;
        }
        auto result = service->get_historical_series(args[1], range.start, range.end);
        bool stale = result.is_ok() && result.value().stale;
        std::string warning = stale ? result.value().warning_message : "";
        return report<SeriesResult>(result, series_to_json, stale, warning);
    }

    if (command == "quote" && args.size() == 2) {
        auto result = service->get_live_quote(args[1]);
        bool stale = result.is_ok() && result.value().stale;
        std::string warning = stale ? result.value().warning_message : "";
        return report<QuoteResult>(result, quote_to_json, stale, warning);
    }

    if (command == "metrics" && args.size() == 4) {
        DateRange range;
        if (!parse_range(args[2], args[3], range)) {
            return 1;
        }
        auto result = service->get_symbol_metrics(args[1], range);
        bool stale = result.is_ok() && result.value().stale;
        std::string warning = stale ? result.value().warning_message : "";
        return report<analytics::AnalysisResult>(result, analysis_to_json, stale, warning);
    }

    if (command == "portfolio" && args.size() >= 2) {
        std::vector<Allocation> allocations;
        for (size_t i = 1; i < args.size(); ++i) {
            std::string symbol, amount_text;
            double amount = 0.0;
            if (!split_assignment(args[i], symbol, amount_text) ||
                !parse_number(amount_text, amount)) {
                return 1;
            }
            allocations.push_back(Allocation{symbol, amount});
        }
        auto result = service->get_portfolio_metrics(allocations);
        bool stale = result.is_ok() && result.value().stale;
        std::string warning = stale ? result.value().warning_message : "";
        return report<analytics::AnalysisResult>(result, analysis_to_json, stale, warning);
    }

    if (command == "pnl" && args.size() >= 2) {
        std::vector<Holding> holdings;
        for (size_t i = 1; i < args.size(); ++i) {
            std::string symbol, position;
            if (!split_assignment(args[i], symbol, position)) {
                return 1;
            }
            auto at = position.find('@');
            double quantity = 0.0;
            double cost = 0.0;
            if (at == std::string::npos || !parse_number(position.substr(0, at), quantity) ||
                !parse_number(position.substr(at + 1), cost)) {
                std::cerr << "Expected SYMBOL=QTY@COST, got " << args[i] << std::endl;
                return 1;
            }
            holdings.push_back(Holding{symbol, quantity, cost});
        }
        auto result = service->get_portfolio_pnl(holdings);
        bool stale = result.is_ok() && result.value().stale;
        return report<PortfolioPnl>(result, pnl_to_json, stale, "one or more quotes are stale");
    }

    if (command == "invalidate" && args.size() <= 2) {
        size_t removed = args.size() == 2 ? service->invalidate_cache(CacheScope::symbol(args[1]))
                                          : service->invalidate_cache(CacheScope::all());
        std::cout << std::setw(2) << nlohmann::json{{"removed", removed}} << std::endl;
        return 0;
    }

    print_usage();
    return 1;
}
