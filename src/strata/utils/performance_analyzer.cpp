#include "strata/utils/performance_analyzer.hpp"
#include <cmath>
#include <numeric>

namespace strata {
namespace utils {

namespace {

double mean_of(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double std_dev_of(const std::vector<double>& values, double mean) {
    if (values.empty()) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double r : values) {
        sq_sum += (r - mean) * (r - mean);
    }
    return std::sqrt(sq_sum / values.size());
}

} // namespace

double PerformanceAnalyzer::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    const double mean = mean_of(returns);
    const double std_dev = std_dev_of(returns, mean);
    if (std_dev < 0.000001) {
        return 0.0;
    }

    // Annualize
    double annualized_return = mean * periods_per_year_;
    double annualized_std_dev = std_dev * std::sqrt(static_cast<double>(periods_per_year_));

    return (annualized_return - risk_free_rate_) / annualized_std_dev;
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<double>& curve, double& duration) const {
    if (curve.size() < 2) {
        duration = 0.0;
        return 0.0;
    }

    double max_dd = 0.0;
    double peak = curve[0];
    double max_duration = 0.0;
    double current_duration = 0.0;

    for (size_t i = 1; i < curve.size(); i++) {
        if (curve[i] > peak) {
            peak = curve[i];
            current_duration = 0.0;
        } else {
            current_duration += 1.0;
            double dd = (peak - curve[i]) / peak;
            if (dd > max_dd) {
                max_dd = dd;
                max_duration = current_duration;
            }
        }
    }

    duration = max_duration;
    return max_dd;
}

PerformanceMetrics PerformanceAnalyzer::calculate_metrics(const backtest::StrategyResult& result) const {
    PerformanceMetrics metrics;
    if (result.size() < 2) {
        return metrics;
    }

    // Row 0 is the anchor and carries no return
    std::vector<double> returns(result.strategy.begin() + 1, result.strategy.end());
    metrics.periods = returns.size();

    metrics.total_return = result.cstrategy.back() - 1.0;
    metrics.benchmark_return = result.creturns.back() - 1.0;

    const double mean = mean_of(returns);
    metrics.annualized_return = mean * periods_per_year_;
    metrics.volatility = std_dev_of(returns, mean) * std::sqrt(static_cast<double>(periods_per_year_));
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns);
    metrics.max_drawdown = calculate_max_drawdown(result.cstrategy, metrics.max_drawdown_duration);
    metrics.total_trades = result.trade_count();

    return metrics;
}

} // namespace utils
} // namespace strata
