#pragma once

#include <strata/core/price_series.hpp>
#include <strata/core/signal.hpp>
#include <cstdint>
#include <vector>

namespace strata::backtest {

// Output of one backtest. All vectors have one entry per valid row, i.e. per
// index where both the log return and the position are defined. Row 0 is the
// anchor: its strategy return and trade are 0 and both cumulative series
// start at 1.0 there.
struct StrategyResult {
    std::vector<int64_t> timestamps;
    std::vector<double> returns;      // log return of the close
    std::vector<int> positions;
    std::vector<double> strategy;     // position[k-1] * returns[k] - trades[k] * tc
    std::vector<int> trades;          // |position[k] - position[k-1]|
    std::vector<double> creturns;     // cumulative buy-and-hold
    std::vector<double> cstrategy;    // cumulative strategy

    double performance = 0.0;         // final cstrategy
    double outperformance = 0.0;      // performance - final creturns

    size_t size() const { return timestamps.size(); }
    int trade_count() const;

    bool operator==(const StrategyResult& other) const;
    bool operator!=(const StrategyResult& other) const { return !(*this == other); }
};

/**
 * @class BacktestExecutor
 * @brief Turns a position series into net strategy returns for one price series
 */
class BacktestExecutor {
public:
    /**
     * @param transaction_cost proportional cost charged per unit of position change
     * @throws InvalidParameterError if transaction_cost is negative
     */
    explicit BacktestExecutor(double transaction_cost = 0.0);

    double transaction_cost() const { return transaction_cost_; }

    /**
     * @throws InvalidSeriesError if positions and series differ in length
     * @throws InsufficientDataError if fewer than 2 valid rows remain
     */
    StrategyResult run(const core::PriceSeries& series, const core::PositionSeries& positions) const;

private:
    double transaction_cost_;
};

} // namespace strata::backtest
