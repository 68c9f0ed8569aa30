// include/strata/strategy/strategy_factory.hpp
#pragma once
#include <strata/strategy/strategy_variant.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {
namespace strategy {

// Flat options keyed by parameter name ("SMA_S", "TC") and by range name
// ("SMA_S_RANGE"). Range names are also accepted fully upper-cased
// ("RSI_PERIODS_RANGE").
struct StrategyOptions {
    std::unordered_map<std::string, double> values;
    std::unordered_map<std::string, ParameterRange> ranges;

    static std::string range_key(const std::string& parameter) { return parameter + "_RANGE"; }
    static std::string upper_range_key(const std::string& parameter);

    // range_key(parameter) first, then upper_range_key(parameter); nullptr if neither is set.
    const ParameterRange* find_range(const std::string& parameter) const;
};

class StrategyFactory {
public:
    static constexpr const char* kTransactionCostKey = "TC";

    /**
     * @throws UnknownStrategyError for a tag outside SMA, EMA, MACD, RSI, BB, SO
     */
    static StrategyFamily parse_family(const std::string& tag);

    static std::vector<std::string> registered_tags();

    /**
     * @brief Build a variant from flat options; TC defaults to 0
     * @throws UnknownStrategyError, InvalidParameterError if a parameter is
     *         missing, not finite or outside the int range
     */
    static StrategyVariant create(const std::string& tag, const core::PriceSeries& series,
                                  const StrategyOptions& options);

    static StrategyResult run(const std::string& tag, const core::PriceSeries& series,
                              const StrategyOptions& options);

    /**
     * @brief Grid search using the "<PARAM>_RANGE" entry of every parameter
     * @param thread_count 1 runs the serial search
     * @throws InvalidParameterError if a range is missing
     */
    static OptimizationResult optimize(const std::string& tag, const core::PriceSeries& series,
                                       const StrategyOptions& options, size_t thread_count = 1);

    static std::vector<ParameterRange> ranges_for(StrategyFamily family, const StrategyOptions& options);

    // Copy of options where each parameter without a value takes its range start.
    static StrategyOptions with_range_defaults(StrategyFamily family, const StrategyOptions& options);
};

} // namespace strategy
} // namespace strata
