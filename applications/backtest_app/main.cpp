// applications/backtest_app/main.cpp
#include "strata/backtest/report.hpp"
#include "strata/core/market_data.hpp"
#include "strata/core/price_series.hpp"
#include "strata/strategy/strategy_factory.hpp"
#include "strata/utils/config.hpp"
#include "strata/utils/logger.hpp"
#include "strata/utils/performance_analyzer.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

// Reads "<PARAM> = value", "<PARAM>_RANGE = start,stop,step" and "TC" for the
// parameters of one family.
strata::strategy::StrategyOptions options_from_config(const strata::utils::Config& config,
                                                      const std::string& tag) {
    using strata::strategy::StrategyFactory;
    using strata::strategy::StrategyOptions;

    StrategyOptions options;
    const auto& desc = strata::strategy::describe(StrategyFactory::parse_family(tag));

    std::vector<std::string> value_keys = desc.parameter_names;
    value_keys.push_back(StrategyFactory::kTransactionCostKey);
    for (const auto& key : value_keys) {
        auto values = config.get_list(key);
        if (values.size() == 1) {
            options.values[key] = values[0];
        }
    }

    for (const auto& name : desc.parameter_names) {
        std::string key = StrategyOptions::range_key(name);
        if (!config.contains(key)) {
            key = StrategyOptions::upper_range_key(name);
            if (!config.contains(key)) {
                continue;
            }
        }
        auto triple = config.get_list(key);
        if (triple.size() != 3) {
            strata::utils::Logger::warn() << "Ignoring " << key << ": expected start,stop,step"
                                          << strata::utils::Logger::endl;
            continue;
        }
        options.ranges[key] = strata::backtest::ParameterRange(triple[0], triple[1], triple[2]);
    }
    return options;
}

void print_metrics(const strata::utils::PerformanceMetrics& metrics, const strata::backtest::StrategyResult& result) {
    std::cout << "Absolute performance: " << result.performance << std::endl;
    std::cout << "Out-/underperformance: " << result.outperformance << std::endl;
    std::cout << "Trades: " << metrics.total_trades << std::endl;
    std::cout << "Annualized return: " << metrics.annualized_return << std::endl;
    std::cout << "Volatility: " << metrics.volatility << std::endl;
    std::cout << "Sharpe ratio: " << metrics.sharpe_ratio << std::endl;
    std::cout << "Max drawdown: " << (metrics.max_drawdown * 100.0) << "%" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    using strata::utils::Logger;

    try {
        auto config = strata::utils::Config::instance();
        const std::string config_file = argc > 1 ? argv[1] : "strata.conf";
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << std::endl;
            return 1;
        }

        Logger::set_level(Logger::parse_level(config->get("log_level", "info")));

        const std::string data_file = config->get("data_file", "data.csv");
        std::vector<strata::core::Candle> candles;
        if (!strata::core::load_csv_candles(data_file, candles)) {
            std::cerr << "Failed to load data from " << data_file << std::endl;
            return 1;
        }

        strata::core::PriceSeries series(config->get("symbol", "UNKNOWN"), std::move(candles));

        const std::string tag = config->get("strategy", "SMA");
        const std::string mode = config->get("mode", "backtest");
        using strata::strategy::StrategyFactory;
        auto options = options_from_config(*config, tag);
        if (mode == "optimize") {
            options = StrategyFactory::with_range_defaults(StrategyFactory::parse_family(tag), options);
        }

        auto variant = StrategyFactory::create(tag, series, options);

        if (mode == "optimize") {
            const int threads = config->get<int>("threads", 1);
            auto ranges = StrategyFactory::ranges_for(variant.family(), options);
            auto best = threads > 1 ? variant.optimize_parallel(ranges, static_cast<size_t>(threads))
                                    : variant.optimize(ranges);
            std::cout << "Best parameters " << strata::backtest::format_parameters(best.parameters)
                      << " over " << best.evaluated << " grid points" << std::endl;
        } else if (mode == "backtest") {
            variant.run_backtest();
        } else {
            std::cerr << "Unknown mode '" << mode << "', expected backtest or optimize" << std::endl;
            return 1;
        }

        const auto& result = *variant.last_result();
        strata::utils::PerformanceAnalyzer analyzer(config->get<int>("periods_per_year", 252));

        std::cout << variant.summary() << std::endl;
        print_metrics(analyzer.calculate_metrics(result), result);

        const std::string output_file = config->get("output_file", "");
        if (!output_file.empty()
            && !strata::backtest::export_results_csv(output_file, result, variant.display_label())) {
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        Logger::error() << e.what() << Logger::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
