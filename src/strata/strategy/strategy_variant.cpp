// src/strata/strategy/strategy_variant.cpp
#include "strata/strategy/strategy_variant.hpp"
#include "strata/core/errors.hpp"
#include "strata/indicators/indicators.hpp"
#include "strata/utils/logger.hpp"
#include <memory>
#include <sstream>

namespace strata {
namespace strategy {

namespace ind = indicators;

StrategyVariant::StrategyVariant(StrategyFamily family, core::PriceSeries series,
                                 ParameterVector parameters, double transaction_cost)
    : family_(family),
      series_(std::move(series)),
      executor_(transaction_cost) {
    validate(parameters);
    parameters_ = std::move(parameters);

    if (family_ == StrategyFamily::RSI) {
        auto moves = ind::gains_and_losses(series_.closes());
        series_.set_column("U", std::move(moves.up));
        series_.set_column("D", std::move(moves.down));
    }
    recompute(std::vector<bool>(parameters_.size(), true));

    utils::Logger::debug() << "Created " << summary() << " over " << series_.size() << " candles"
                           << utils::Logger::endl;
}

int StrategyVariant::parameter(const std::string& name) const {
    const auto& desc = descriptor();
    const size_t index = desc.index_of(name);
    if (index >= desc.arity()) {
        throw core::InvalidParameterError(desc.tag + " has no parameter '" + name + "'");
    }
    return parameters_[index];
}

void StrategyVariant::validate(const ParameterVector& candidate) const {
    const auto& desc = descriptor();
    if (candidate.size() != desc.arity()) {
        throw core::InvalidParameterError(desc.tag + " takes " + std::to_string(desc.arity())
                                          + " parameters, got " + std::to_string(candidate.size()));
    }

    for (size_t i = 0; i < candidate.size(); ++i) {
        if (desc.is_window[i] && candidate[i] <= 0) {
            throw core::InvalidParameterError(desc.tag + " " + desc.parameter_names[i]
                                              + " must be positive, got " + std::to_string(candidate[i]));
        }
    }

    if (family_ == StrategyFamily::RSI && candidate[1] <= candidate[2]) {
        throw core::InvalidParameterError("RSI upper threshold " + std::to_string(candidate[1])
                                          + " must exceed lower threshold " + std::to_string(candidate[2]));
    }
    // Bands sit at +DEV and -DEV standard deviations
    if (family_ == StrategyFamily::BB && candidate[1] <= 0) {
        throw core::InvalidParameterError("BB DEV must be positive, got " + std::to_string(candidate[1]));
    }
}

void StrategyVariant::set_parameters(const ParameterUpdate& updates) {
    const auto& desc = descriptor();
    if (updates.size() != desc.arity()) {
        throw core::InvalidParameterError(desc.tag + " takes " + std::to_string(desc.arity())
                                          + " parameters, update has " + std::to_string(updates.size()));
    }

    ParameterVector candidate = parameters_;
    std::vector<bool> changed(updates.size(), false);
    for (size_t i = 0; i < updates.size(); ++i) {
        if (updates[i]) {
            candidate[i] = *updates[i];
            changed[i] = true;
        }
    }

    validate(candidate);
    parameters_ = std::move(candidate);
    recompute(changed);
}

void StrategyVariant::set_parameter(const std::string& name, int value) {
    const auto& desc = descriptor();
    const size_t index = desc.index_of(name);
    if (index >= desc.arity()) {
        throw core::InvalidParameterError(desc.tag + " has no parameter '" + name + "'");
    }
    ParameterUpdate update(desc.arity());
    update[index] = value;
    set_parameters(update);
}

void StrategyVariant::assign_parameters(const ParameterVector& values) {
    set_parameters(ParameterUpdate(values.begin(), values.end()));
}

void StrategyVariant::recompute(const std::vector<bool>& changed) {
    const auto& close = series_.closes();
    const auto& p = parameters_;

    switch (family_) {
        case StrategyFamily::SMA:
            if (changed[0]) series_.set_column("SMA_S", ind::rolling_mean(close, p[0]));
            if (changed[1]) series_.set_column("SMA_L", ind::rolling_mean(close, p[1]));
            break;

        case StrategyFamily::EMA:
            if (changed[0]) series_.set_column("EMA_S", ind::ewm_mean(close, p[0], p[0]));
            if (changed[1]) series_.set_column("EMA_L", ind::ewm_mean(close, p[1], p[1]));
            break;

        case StrategyFamily::MACD:
            if (changed[0]) series_.set_column("EMA_S", ind::ewm_mean(close, p[0], p[0]));
            if (changed[1]) series_.set_column("EMA_L", ind::ewm_mean(close, p[1], p[1]));
            if (changed[0] || changed[1]) {
                auto lines = ind::macd(series_.column("EMA_S"), series_.column("EMA_L"), p[2]);
                series_.set_column("MACD", std::move(lines.macd));
                series_.set_column("MACD_Signal", std::move(lines.signal));
            } else if (changed[2]) {
                series_.set_column("MACD_Signal", ind::macd_signal(series_.column("MACD"), p[2]));
            }
            break;

        case StrategyFamily::RSI:
            // Thresholds only affect the signal rule
            if (changed[0]) {
                auto mean_up = ind::rolling_mean(series_.column("U"), p[0]);
                auto mean_down = ind::rolling_mean(series_.column("D"), p[0]);
                series_.set_column("RSI", ind::relative_strength(mean_up, mean_down));
                series_.set_column("MA_U", std::move(mean_up));
                series_.set_column("MA_D", std::move(mean_down));
            }
            break;

        case StrategyFamily::BB:
            if (changed[0]) {
                auto bands = ind::bollinger(close, p[0], p[1]);
                series_.set_column("SMA", std::move(bands.mean));
                series_.set_column("STD", std::move(bands.std_dev));
                series_.set_column("Upper", std::move(bands.upper));
                series_.set_column("Lower", std::move(bands.lower));
                series_.set_column("distance", std::move(bands.distance));
            } else if (changed[1]) {
                ind::BandColumns bands;
                bands.mean = series_.column("SMA");
                bands.std_dev = series_.column("STD");
                ind::bollinger_bands(bands, p[1]);
                series_.set_column("Upper", std::move(bands.upper));
                series_.set_column("Lower", std::move(bands.lower));
            }
            break;

        case StrategyFamily::SO:
            if (changed[0]) {
                auto so = ind::stochastic(series_.highs(), series_.lows(), close, p[0], p[1]);
                series_.set_column("roll_low", std::move(so.roll_low));
                series_.set_column("roll_high", std::move(so.roll_high));
                series_.set_column("K", std::move(so.k));
                series_.set_column("D", std::move(so.d));
            } else if (changed[1]) {
                series_.set_column("D", ind::rolling_mean(series_.column("K"), p[1]));
            }
            break;
    }
}

core::PositionSeries StrategyVariant::positions() const {
    const auto& p = parameters_;
    switch (family_) {
        case StrategyFamily::SMA:
            return core::crossover_positions(series_.column("SMA_S"), series_.column("SMA_L"));
        case StrategyFamily::EMA:
            return core::crossover_positions(series_.column("EMA_S"), series_.column("EMA_L"));
        case StrategyFamily::MACD:
            return core::crossover_positions(series_.column("MACD"), series_.column("MACD_Signal"));
        case StrategyFamily::RSI:
            return core::threshold_positions(series_.column("RSI"), p[1], p[2]);
        case StrategyFamily::BB:
            return core::threshold_positions(series_.column("distance"), p[1], -p[1]);
        case StrategyFamily::SO:
            return core::crossover_positions(series_.column("K"), series_.column("D"));
    }
    return core::PositionSeries(series_.size());
}

const StrategyResult& StrategyVariant::run_backtest() {
    result_ = executor_.run(series_, positions());
    return *result_;
}

void StrategyVariant::check_ranges(const std::vector<ParameterRange>& ranges) const {
    const auto& desc = descriptor();
    if (ranges.size() != desc.arity()) {
        throw core::InvalidParameterError(desc.tag + " needs " + std::to_string(desc.arity())
                                          + " ranges, got " + std::to_string(ranges.size()));
    }
}

OptimizationResult StrategyVariant::optimize(const std::vector<ParameterRange>& ranges) {
    check_ranges(ranges);
    utils::Logger::info() << "Optimizing " << summary() << utils::Logger::endl;

    auto best = backtest::ParameterOptimizer::optimize(ranges, [this](const ParameterVector& point) {
        assign_parameters(point);
        return run_backtest().performance;
    });

    assign_parameters(best.parameters);
    run_backtest();
    return best;
}

OptimizationResult StrategyVariant::optimize_parallel(const std::vector<ParameterRange>& ranges,
                                                      size_t thread_count) {
    check_ranges(ranges);
    utils::Logger::info() << "Optimizing " << summary() << " on " << thread_count << " threads"
                          << utils::Logger::endl;

    auto make_objective = [this]() -> backtest::Objective {
        auto worker = std::make_shared<StrategyVariant>(*this);
        return [worker](const ParameterVector& point) {
            worker->assign_parameters(point);
            return worker->run_backtest().performance;
        };
    };

    auto best = backtest::ParameterOptimizer::optimize_parallel(ranges, make_objective, thread_count);

    assign_parameters(best.parameters);
    run_backtest();
    return best;
}

std::string StrategyVariant::summary() const {
    const auto& desc = descriptor();
    std::ostringstream oss;
    oss << desc.tag << "(symbol = " << symbol();
    for (size_t i = 0; i < parameters_.size(); ++i) {
        oss << ", " << desc.parameter_names[i] << " = " << parameters_[i];
    }
    oss << ", tc = " << transaction_cost() << ")";
    return oss.str();
}

std::string StrategyVariant::display_label() const {
    const auto& desc = descriptor();
    std::ostringstream oss;
    oss << symbol() << " | " << desc.tag;
    for (size_t i = 0; i < parameters_.size(); ++i) {
        oss << " | " << desc.parameter_names[i] << " = " << parameters_[i];
    }
    oss << " | TC = " << transaction_cost();
    return oss.str();
}

} // namespace strategy
} // namespace strata
