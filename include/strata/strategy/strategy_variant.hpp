// include/strata/strategy/strategy_variant.hpp
#pragma once
#include <strata/backtest/backtest_executor.hpp>
#include <strata/backtest/parameter_optimizer.hpp>
#include <strata/core/price_series.hpp>
#include <strata/core/signal.hpp>
#include <strata/strategy/strategy_family.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace strategy {

using backtest::OptimizationResult;
using backtest::ParameterRange;
using backtest::ParameterVector;
using backtest::StrategyResult;

// One optional entry per family parameter; std::nullopt leaves it unchanged.
using ParameterUpdate = std::vector<std::optional<int>>;

/**
 * @class StrategyVariant
 * @brief A strategy family bound to one price series, its parameters and cost
 *
 * Owns its PriceSeries and the indicator columns attached to it. Changing a
 * parameter recomputes, over the full series, only the columns that depend on
 * it. Not safe for concurrent use; copy the variant per thread instead.
 */
class StrategyVariant {
public:
    /**
     * @param family strategy family
     * @param series price series, copied into the variant
     * @param parameters one value per descriptor parameter, in order
     * @param transaction_cost proportional cost per unit of position change
     * @throws InvalidParameterError for a wrong arity, window <= 0, inverted
     *         thresholds or a negative cost
     */
    StrategyVariant(StrategyFamily family, core::PriceSeries series,
                    ParameterVector parameters, double transaction_cost = 0.0);

    StrategyFamily family() const { return family_; }
    const FamilyDescriptor& descriptor() const { return describe(family_); }
    const std::string& symbol() const { return series_.symbol(); }
    const ParameterVector& parameters() const { return parameters_; }
    double transaction_cost() const { return executor_.transaction_cost(); }
    const core::PriceSeries& series() const { return series_; }

    /**
     * @throws InvalidParameterError if the family has no such parameter
     */
    int parameter(const std::string& name) const;

    /**
     * @brief Update some or all parameters
     *
     * The resulting parameter vector is validated before any column changes,
     * so a rejected update leaves the variant untouched.
     *
     * @throws InvalidParameterError if updates.size() differs from the arity
     *         or the new values are invalid
     */
    void set_parameters(const ParameterUpdate& updates);

    void set_parameter(const std::string& name, int value);

    core::PositionSeries positions() const;

    /**
     * @brief Backtest the current parameters; replaces the stored result
     * @throws InsufficientDataError if fewer than 2 valid periods remain
     */
    const StrategyResult& run_backtest();

    const std::optional<StrategyResult>& last_result() const { return result_; }

    /**
     * @brief Grid search over one range per parameter
     *
     * Leaves the variant at the best parameters with its result stored.
     */
    OptimizationResult optimize(const std::vector<ParameterRange>& ranges);

    // Same result as optimize(); each worker thread runs its own copy.
    OptimizationResult optimize_parallel(const std::vector<ParameterRange>& ranges, size_t thread_count);

    // e.g. "SMA(symbol = EURUSD, SMA_S = 50, SMA_L = 200, tc = 0)"
    std::string summary() const;

    // e.g. "EURUSD | SMA | SMA_S = 50 | SMA_L = 200 | TC = 0"
    std::string display_label() const;

private:
    void validate(const ParameterVector& candidate) const;
    void assign_parameters(const ParameterVector& values);
    void recompute(const std::vector<bool>& changed);
    void check_ranges(const std::vector<ParameterRange>& ranges) const;

    StrategyFamily family_;
    core::PriceSeries series_;
    ParameterVector parameters_;
    backtest::BacktestExecutor executor_;
    std::optional<StrategyResult> result_;
};

} // namespace strategy
} // namespace strata
