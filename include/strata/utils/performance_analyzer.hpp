// include/strata/utils/performance_analyzer.hpp
#pragma once
#include <strata/backtest/backtest_executor.hpp>
#include <vector>

namespace strata {
namespace utils {

struct PerformanceMetrics {
    double total_return = 0.0;           // final cstrategy - 1
    double benchmark_return = 0.0;       // final creturns - 1
    double annualized_return = 0.0;      // mean net log return * periods per year
    double volatility = 0.0;             // annualized std of net log returns
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;           // fraction of running peak
    double max_drawdown_duration = 0.0;  // periods
    int total_trades = 0;                // sum of trade indicators
    size_t periods = 0;                  // strategy returns (rows - 1)
};

// Descriptive statistics over one backtest result.
class PerformanceAnalyzer {
private:
    int periods_per_year_;
    double risk_free_rate_;

public:
    explicit PerformanceAnalyzer(int periods_per_year = 252, double risk_free_rate = 0.0)
        : periods_per_year_(periods_per_year), risk_free_rate_(risk_free_rate) {}

    PerformanceMetrics calculate_metrics(const backtest::StrategyResult& result) const;

    double calculate_sharpe_ratio(const std::vector<double>& returns) const;
    double calculate_max_drawdown(const std::vector<double>& curve, double& duration) const;
};

} // namespace utils
} // namespace strata
