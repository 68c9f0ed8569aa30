#include <strata/backtest/backtest_executor.hpp>
#include <strata/core/errors.hpp>
#include <strata/utils/logger.hpp>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <string>

namespace strata::backtest {

int StrategyResult::trade_count() const {
    return std::accumulate(trades.begin(), trades.end(), 0);
}

bool StrategyResult::operator==(const StrategyResult& other) const {
    return timestamps == other.timestamps
        && returns == other.returns
        && positions == other.positions
        && strategy == other.strategy
        && trades == other.trades
        && creturns == other.creturns
        && cstrategy == other.cstrategy
        && performance == other.performance
        && outperformance == other.outperformance;
}

BacktestExecutor::BacktestExecutor(double transaction_cost)
    : transaction_cost_(transaction_cost) {
    if (!(transaction_cost >= 0.0)) {
        throw core::InvalidParameterError("transaction cost must be >= 0, got "
                                          + std::to_string(transaction_cost));
    }
}

StrategyResult BacktestExecutor::run(const core::PriceSeries& series,
                                     const core::PositionSeries& positions) const {
    if (positions.size() != series.size()) {
        throw core::InvalidSeriesError("position series has " + std::to_string(positions.size())
                                       + " entries, price series has " + std::to_string(series.size()));
    }

    const core::Column& returns = series.returns();

    StrategyResult result;
    for (size_t i = 0; i < series.size(); ++i) {
        if (!positions[i] || !core::is_defined(returns[i])) {
            continue;
        }
        result.timestamps.push_back(series.candle(i).timestamp);
        result.returns.push_back(returns[i]);
        result.positions.push_back(*positions[i]);
    }

    const size_t rows = result.size();
    if (rows < 2) {
        utils::Logger::warn() << "Backtest of " << series.symbol() << " has " << rows
                              << " valid rows after warm-up" << utils::Logger::endl;
        throw core::InsufficientDataError("need at least 2 valid periods for " + series.symbol()
                                          + ", got " + std::to_string(rows));
    }

    result.strategy.assign(rows, 0.0);
    result.trades.assign(rows, 0);
    result.creturns.assign(rows, 1.0);
    result.cstrategy.assign(rows, 1.0);

    double returns_sum = 0.0;
    double strategy_sum = 0.0;
    for (size_t k = 1; k < rows; ++k) {
        // Exposure during period k was decided at k - 1
        double net = result.positions[k - 1] * result.returns[k];
        result.trades[k] = std::abs(result.positions[k] - result.positions[k - 1]);
        if (result.trades[k] != 0) {
            net -= result.trades[k] * transaction_cost_;
        }
        result.strategy[k] = net;

        returns_sum += result.returns[k];
        strategy_sum += net;
        result.creturns[k] = std::exp(returns_sum);
        result.cstrategy[k] = std::exp(strategy_sum);
    }

    result.performance = result.cstrategy.back();
    result.outperformance = result.performance - result.creturns.back();
    return result;
}

} // namespace strata::backtest
