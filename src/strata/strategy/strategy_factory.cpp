// src/strata/strategy/strategy_factory.cpp
#include "strata/strategy/strategy_factory.hpp"
#include "strata/core/errors.hpp"
#include "strata/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>

namespace strata {
namespace strategy {

namespace {

int to_parameter(const std::string& name, double value) {
    if (!std::isfinite(value) || value < std::numeric_limits<int>::min()
        || value > std::numeric_limits<int>::max()) {
        throw core::InvalidParameterError("parameter '" + name + "' is not a representable integer: "
                                          + std::to_string(value));
    }
    return static_cast<int>(std::trunc(value));
}

std::string upper_case(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

std::string StrategyOptions::upper_range_key(const std::string& parameter) {
    return upper_case(range_key(parameter));
}

const ParameterRange* StrategyOptions::find_range(const std::string& parameter) const {
    auto it = ranges.find(range_key(parameter));
    if (it == ranges.end()) {
        it = ranges.find(upper_range_key(parameter));
    }
    return it != ranges.end() ? &it->second : nullptr;
}

StrategyFamily StrategyFactory::parse_family(const std::string& tag) {
    for (auto family : kAllFamilies) {
        if (describe(family).tag == tag) {
            return family;
        }
    }
    utils::Logger::error() << "Unknown strategy '" << tag << "'" << utils::Logger::endl;
    throw core::UnknownStrategyError("unknown strategy '" + tag + "'");
}

std::vector<std::string> StrategyFactory::registered_tags() {
    std::vector<std::string> tags;
    for (auto family : kAllFamilies) {
        tags.push_back(describe(family).tag);
    }
    return tags;
}

StrategyVariant StrategyFactory::create(const std::string& tag, const core::PriceSeries& series,
                                        const StrategyOptions& options) {
    const StrategyFamily family = parse_family(tag);
    const auto& desc = describe(family);

    ParameterVector parameters;
    for (const auto& name : desc.parameter_names) {
        auto it = options.values.find(name);
        if (it == options.values.end()) {
            throw core::InvalidParameterError(tag + " requires parameter '" + name + "'");
        }
        parameters.push_back(to_parameter(name, it->second));
    }

    double tc = 0.0;
    auto tc_it = options.values.find(kTransactionCostKey);
    if (tc_it != options.values.end()) {
        tc = tc_it->second;
    }

    return StrategyVariant(family, series, std::move(parameters), tc);
}

StrategyResult StrategyFactory::run(const std::string& tag, const core::PriceSeries& series,
                                    const StrategyOptions& options) {
    auto variant = create(tag, series, options);
    return variant.run_backtest();
}

std::vector<ParameterRange> StrategyFactory::ranges_for(StrategyFamily family, const StrategyOptions& options) {
    const auto& desc = describe(family);
    std::vector<ParameterRange> ranges;
    for (const auto& name : desc.parameter_names) {
        const ParameterRange* range = options.find_range(name);
        if (!range) {
            throw core::InvalidParameterError(desc.tag + " optimization requires range '"
                                              + StrategyOptions::range_key(name) + "'");
        }
        ranges.push_back(*range);
    }
    return ranges;
}

StrategyOptions StrategyFactory::with_range_defaults(StrategyFamily family, const StrategyOptions& options) {
    StrategyOptions filled = options;
    for (const auto& name : describe(family).parameter_names) {
        if (const ParameterRange* range = options.find_range(name)) {
            filled.values.emplace(name, range->start);
        }
    }
    return filled;
}

OptimizationResult StrategyFactory::optimize(const std::string& tag, const core::PriceSeries& series,
                                             const StrategyOptions& options, size_t thread_count) {
    const StrategyFamily family = parse_family(tag);
    auto ranges = ranges_for(family, options);
    auto variant = create(tag, series, with_range_defaults(family, options));
    if (thread_count > 1) {
        return variant.optimize_parallel(ranges, thread_count);
    }
    return variant.optimize(ranges);
}

} // namespace strategy
} // namespace strata
