// include/strata/strategy/strategy_family.hpp
#pragma once
#include <strata/core/signal.hpp>
#include <array>
#include <string>
#include <vector>

namespace strata {
namespace strategy {

enum class StrategyFamily {
    SMA,   // simple moving-average crossover
    EMA,   // exponential moving-average crossover
    MACD,  // convergence/divergence oscillator
    RSI,   // relative-strength index
    BB,    // Bollinger band mean reversion
    SO     // stochastic oscillator
};

inline constexpr std::array<StrategyFamily, 6> kAllFamilies = {
    StrategyFamily::SMA, StrategyFamily::EMA, StrategyFamily::MACD,
    StrategyFamily::RSI, StrategyFamily::BB, StrategyFamily::SO
};

// Static facts about a family: its tag, parameter names in grid order and
// which of them are lookback windows.
struct FamilyDescriptor {
    StrategyFamily family;
    std::string tag;
    std::vector<std::string> parameter_names;
    std::vector<bool> is_window;
    core::SignalRule rule;

    size_t arity() const { return parameter_names.size(); }

    // Index of a parameter name, or arity() if unknown.
    size_t index_of(const std::string& name) const;
};

const FamilyDescriptor& describe(StrategyFamily family);

const std::string& to_string(StrategyFamily family);

} // namespace strategy
} // namespace strata
