// src/strata/strategy/strategy_family.cpp
#include "strata/strategy/strategy_family.hpp"
#include <algorithm>

namespace strata {
namespace strategy {

size_t FamilyDescriptor::index_of(const std::string& name) const {
    auto it = std::find(parameter_names.begin(), parameter_names.end(), name);
    return static_cast<size_t>(std::distance(parameter_names.begin(), it));
}

const FamilyDescriptor& describe(StrategyFamily family) {
    using core::SignalRule;
    static const FamilyDescriptor sma{StrategyFamily::SMA, "SMA",
        {"SMA_S", "SMA_L"}, {true, true}, SignalRule::CROSSOVER};
    static const FamilyDescriptor ema{StrategyFamily::EMA, "EMA",
        {"EMA_S", "EMA_L"}, {true, true}, SignalRule::CROSSOVER};
    static const FamilyDescriptor macd{StrategyFamily::MACD, "MACD",
        {"EMA_S", "EMA_L", "MACD_signal"}, {true, true, true}, SignalRule::CROSSOVER};
    static const FamilyDescriptor rsi{StrategyFamily::RSI, "RSI",
        {"RSI_periods", "RSI_upper", "RSI_lower"}, {true, false, false}, SignalRule::THRESHOLD};
    static const FamilyDescriptor bb{StrategyFamily::BB, "BB",
        {"SMA", "DEV"}, {true, false}, SignalRule::THRESHOLD};
    static const FamilyDescriptor so{StrategyFamily::SO, "SO",
        {"SO_periods", "SO_D_mw"}, {true, true}, SignalRule::CROSSOVER};

    switch (family) {
        case StrategyFamily::SMA: return sma;
        case StrategyFamily::EMA: return ema;
        case StrategyFamily::MACD: return macd;
        case StrategyFamily::RSI: return rsi;
        case StrategyFamily::BB: return bb;
        case StrategyFamily::SO: return so;
    }
    return sma;
}

const std::string& to_string(StrategyFamily family) {
    return describe(family).tag;
}

} // namespace strategy
} // namespace strata
