#include <gtest/gtest.h>
#include <strata/backtest/parameter_optimizer.hpp>
#include <strata/core/errors.hpp>
#include <strata/strategy/strategy_factory.hpp>
#include <strata/strategy/strategy_variant.hpp>

#include <cmath>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using strata::backtest::Objective;
using strata::backtest::ParameterOptimizer;
using strata::core::Candle;
using strata::core::Column;
using strata::core::PriceSeries;
using namespace strata::strategy;

namespace {

// Oscillating closes with a slight upward drift
PriceSeries synthetic_series(size_t count = 120) {
    std::vector<Candle> candles;
    for (size_t i = 0; i < count; ++i) {
        const double close = 100.0 + 10.0 * std::sin(static_cast<double>(i) / 7.0) + 0.05 * i;
        candles.emplace_back(static_cast<int64_t>(1000 + i * 60), close, close + 1.0, close - 1.0, close, 1000.0);
    }
    return PriceSeries("SYN", candles);
}

bool same_bits(const Column& a, const Column& b) {
    return a.size() == b.size() && std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) == 0;
}

double brute_force_best(StrategyFamily family, const PriceSeries& series,
                        const std::vector<ParameterRange>& ranges, ParameterVector& best_point) {
    double best = -std::numeric_limits<double>::infinity();
    for (const auto& point : ParameterOptimizer::grid_points(ranges)) {
        StrategyVariant variant(family, series, point);
        const double performance = variant.run_backtest().performance;
        if (best_point.empty() || performance > best) {
            best = performance;
            best_point = point;
        }
    }
    return best;
}

} // namespace

class StrategyVariantTest : public ::testing::Test {
protected:
    PriceSeries series = synthetic_series();
};

TEST_F(StrategyVariantTest, WarmupLengthPerFamily) {
    const size_t n = series.size();
    struct Case {
        StrategyFamily family;
        ParameterVector parameters;
        size_t warmup;
    };
    const std::vector<Case> cases = {
        {StrategyFamily::SMA, {5, 20}, 19},
        {StrategyFamily::EMA, {8, 21}, 20},
        {StrategyFamily::MACD, {12, 26, 9}, 25 + 8},
        {StrategyFamily::RSI, {14, 70, 30}, 13},
        {StrategyFamily::BB, {20, 2}, 19},
        {StrategyFamily::SO, {14, 3}, 13 + 2},
    };

    for (const auto& c : cases) {
        StrategyVariant variant(c.family, series, c.parameters);
        auto positions = variant.positions();

        ASSERT_EQ(positions.size(), n) << to_string(c.family);
        EXPECT_EQ(strata::core::defined_count(positions), n - c.warmup) << to_string(c.family);
        EXPECT_FALSE(positions[c.warmup - 1].has_value()) << to_string(c.family);
        EXPECT_TRUE(positions[c.warmup].has_value()) << to_string(c.family);

        const auto& result = variant.run_backtest();
        EXPECT_EQ(result.size(), n - c.warmup) << to_string(c.family);
        for (int p : result.positions) {
            EXPECT_TRUE(p == -1 || p == 0 || p == 1) << to_string(c.family);
        }
    }
}

TEST_F(StrategyVariantTest, ChangingShortWindowKeepsLongColumn) {
    StrategyVariant variant(StrategyFamily::SMA, series, {10, 30});
    const Column long_before = variant.series().column("SMA_L");
    const Column short_before = variant.series().column("SMA_S");

    variant.set_parameter("SMA_S", 12);

    EXPECT_EQ(variant.parameters(), (ParameterVector{12, 30}));
    EXPECT_TRUE(same_bits(variant.series().column("SMA_L"), long_before));
    EXPECT_FALSE(same_bits(variant.series().column("SMA_S"), short_before));
}

TEST_F(StrategyVariantTest, ChangingSignalSpanKeepsAverages) {
    StrategyVariant variant(StrategyFamily::MACD, series, {12, 26, 9});
    const Column ema_short = variant.series().column("EMA_S");
    const Column ema_long = variant.series().column("EMA_L");
    const Column line = variant.series().column("MACD");

    variant.set_parameters({std::nullopt, std::nullopt, 5});

    EXPECT_TRUE(same_bits(variant.series().column("EMA_S"), ema_short));
    EXPECT_TRUE(same_bits(variant.series().column("EMA_L"), ema_long));
    EXPECT_TRUE(same_bits(variant.series().column("MACD"), line));

    StrategyVariant fresh(StrategyFamily::MACD, series, {12, 26, 5});
    EXPECT_TRUE(same_bits(variant.series().column("MACD_Signal"), fresh.series().column("MACD_Signal")));
}

TEST_F(StrategyVariantTest, PartialUpdateMatchesFreshVariant) {
    StrategyVariant bands(StrategyFamily::BB, series, {20, 1});
    bands.set_parameter("DEV", 2);
    StrategyVariant fresh_bands(StrategyFamily::BB, series, {20, 2});
    EXPECT_TRUE(bands.run_backtest() == fresh_bands.run_backtest());

    StrategyVariant stochastic(StrategyFamily::SO, series, {14, 3});
    stochastic.set_parameter("SO_D_mw", 5);
    StrategyVariant fresh_stochastic(StrategyFamily::SO, series, {14, 5});
    EXPECT_TRUE(stochastic.run_backtest() == fresh_stochastic.run_backtest());

    StrategyVariant rsi(StrategyFamily::RSI, series, {14, 70, 30});
    rsi.set_parameters({10, 65, 35});
    StrategyVariant fresh_rsi(StrategyFamily::RSI, series, {10, 65, 35});
    EXPECT_TRUE(rsi.run_backtest() == fresh_rsi.run_backtest());
}

TEST_F(StrategyVariantTest, RejectedUpdateLeavesStateUnchanged) {
    StrategyVariant variant(StrategyFamily::SMA, series, {10, 30});
    const Column short_before = variant.series().column("SMA_S");

    EXPECT_THROW(variant.set_parameters({5, -1}), strata::core::InvalidParameterError);
    EXPECT_THROW(variant.set_parameters({5}), strata::core::InvalidParameterError);
    EXPECT_THROW(variant.set_parameter("EMA_S", 5), strata::core::InvalidParameterError);
    EXPECT_THROW(variant.parameter("RSI_upper"), strata::core::InvalidParameterError);

    EXPECT_EQ(variant.parameters(), (ParameterVector{10, 30}));
    EXPECT_TRUE(same_bits(variant.series().column("SMA_S"), short_before));
    EXPECT_EQ(variant.parameter("SMA_L"), 30);
}

TEST_F(StrategyVariantTest, ConstructorValidatesParameters) {
    using strata::core::InvalidParameterError;

    EXPECT_THROW(StrategyVariant(StrategyFamily::SMA, series, {10}), InvalidParameterError);
    EXPECT_THROW(StrategyVariant(StrategyFamily::EMA, series, {0, 20}), InvalidParameterError);
    EXPECT_THROW(StrategyVariant(StrategyFamily::RSI, series, {14, 30, 70}), InvalidParameterError);
    EXPECT_THROW(StrategyVariant(StrategyFamily::BB, series, {20, 0}), InvalidParameterError);
    EXPECT_THROW(StrategyVariant(StrategyFamily::SO, series, {14, 0}), InvalidParameterError);
    EXPECT_THROW(StrategyVariant(StrategyFamily::SMA, series, {10, 30}, -0.5), InvalidParameterError);

    StrategyVariant rsi(StrategyFamily::RSI, series, {14, 70, 30});
    EXPECT_THROW(rsi.set_parameter("RSI_upper", 20), InvalidParameterError);
    EXPECT_EQ(rsi.parameter("RSI_upper"), 70);
}

TEST_F(StrategyVariantTest, SummaryAndLabel) {
    StrategyVariant variant(StrategyFamily::SMA, series, {10, 30});
    EXPECT_EQ(variant.summary(), "SMA(symbol = SYN, SMA_S = 10, SMA_L = 30, tc = 0)");
    EXPECT_EQ(variant.display_label(), "SYN | SMA | SMA_S = 10 | SMA_L = 30 | TC = 0");

    StrategyVariant rsi(StrategyFamily::RSI, series, {14, 70, 30}, 0.001);
    EXPECT_EQ(rsi.summary(), "RSI(symbol = SYN, RSI_periods = 14, RSI_upper = 70, RSI_lower = 30, tc = 0.001)");
}

TEST_F(StrategyVariantTest, CostReducesPerformance) {
    StrategyVariant frictionless(StrategyFamily::SMA, series, {5, 20});
    StrategyVariant costly(StrategyFamily::SMA, series, {5, 20}, 0.002);

    const auto& a = frictionless.run_backtest();
    const auto& b = costly.run_backtest();

    ASSERT_GT(a.trade_count(), 0);
    EXPECT_EQ(a.positions, b.positions);
    EXPECT_LT(b.performance, a.performance);
}

// Grid search

TEST(ParameterRangeTest, InclusiveTruncatedValues) {
    EXPECT_EQ(ParameterRange(5, 15, 5).values(), (std::vector<int>{5, 10, 15}));
    EXPECT_EQ(ParameterRange(1, 2, 0.5).values(), (std::vector<int>{1, 1, 2}));
    EXPECT_EQ(ParameterRange(7, 7).values(), (std::vector<int>{7}));
    EXPECT_EQ(ParameterRange(0, 0.3, 0.1).values().size(), 4u);
}

TEST(ParameterRangeTest, RejectsMalformedRanges) {
    EXPECT_THROW(ParameterRange(1, 5, 0).values(), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterRange(1, 5, -1).values(), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterRange(5, 1, 1).values(), strata::core::InvalidParameterError);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(ParameterRange(1, nan, 1).values(), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterRange(nan, 5, 1).values(), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterRange(1, 5, nan).values(), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterRange(1, inf, 1).values(), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterRange(1, 5, inf).values(), strata::core::InvalidParameterError);

    // Bounds must fit the int parameter domain
    EXPECT_THROW(ParameterRange(3e9, 3e9, 1).values(), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterRange(-3e9, 5, 1).values(), strata::core::InvalidParameterError);
    EXPECT_EQ(ParameterRange(2147483646, 2147483647).values(),
              (std::vector<int>{2147483646, 2147483647}));
}

TEST(ParameterOptimizerTest, RowMajorEnumeration) {
    std::vector<ParameterVector> visited;
    Objective record = [&visited](const ParameterVector& point) {
        visited.push_back(point);
        return 0.0;
    };

    auto result = ParameterOptimizer::optimize({ParameterRange(1, 2), ParameterRange(10, 30, 10)}, record);

    const std::vector<ParameterVector> expected = {
        {1, 10}, {1, 20}, {1, 30}, {2, 10}, {2, 20}, {2, 30}};
    EXPECT_EQ(visited, expected);
    EXPECT_EQ(result.evaluated, 6u);
}

TEST(ParameterOptimizerTest, TiesKeepFirstPoint) {
    auto result = ParameterOptimizer::optimize(
        {ParameterRange(1, 3), ParameterRange(4, 6)},
        [](const ParameterVector&) { return 1.5; });

    EXPECT_EQ(result.parameters, (ParameterVector{1, 4}));
    EXPECT_EQ(result.performance, 1.5);
}

TEST(ParameterOptimizerTest, FirstFailureAbortsSearch) {
    int calls = 0;
    Objective failing = [&calls](const ParameterVector&) -> double {
        if (++calls == 3) {
            throw std::runtime_error("objective failed");
        }
        return 1.0;
    };

    EXPECT_THROW(ParameterOptimizer::optimize({ParameterRange(1, 10)}, failing), std::runtime_error);
    EXPECT_EQ(calls, 3);
}

TEST(ParameterOptimizerTest, AxisCountLimits) {
    Objective zero = [](const ParameterVector&) { return 0.0; };

    EXPECT_THROW(ParameterOptimizer::optimize({}, zero), strata::core::InvalidParameterError);
    EXPECT_THROW(ParameterOptimizer::optimize(
                     {ParameterRange(1, 2), ParameterRange(1, 2), ParameterRange(1, 2), ParameterRange(1, 2)}, zero),
                 strata::core::InvalidParameterError);

    auto three_axes = ParameterOptimizer::grid_points({ParameterRange(1, 2), ParameterRange(1, 3), ParameterRange(1, 2)});
    EXPECT_EQ(three_axes.size(), 12u);
    EXPECT_EQ(three_axes.front(), (ParameterVector{1, 1, 1}));
    EXPECT_EQ(three_axes[1], (ParameterVector{1, 1, 2}));
    EXPECT_EQ(three_axes.back(), (ParameterVector{2, 3, 2}));
}

TEST(ParameterOptimizerTest, ParallelMatchesSerial) {
    const std::vector<ParameterRange> ranges = {ParameterRange(1, 12), ParameterRange(20, 40, 2)};
    Objective peak = [](const ParameterVector& p) {
        return -std::pow(p[0] - 7.0, 2) - std::pow(p[1] - 26.0, 2);
    };

    auto serial = ParameterOptimizer::optimize(ranges, peak);
    auto parallel = ParameterOptimizer::optimize_parallel(ranges, [&peak]() { return peak; }, 4);

    EXPECT_EQ(serial.parameters, (ParameterVector{7, 26}));
    EXPECT_EQ(parallel.parameters, serial.parameters);
    EXPECT_EQ(parallel.performance, serial.performance);
    EXPECT_EQ(parallel.evaluated, serial.evaluated);

    auto tied = ParameterOptimizer::optimize_parallel(
        ranges, []() -> Objective { return [](const ParameterVector&) { return 0.0; }; }, 3);
    EXPECT_EQ(tied.parameters, (ParameterVector{1, 20}));
}

TEST(ParameterOptimizerTest, NonFiniteValuesNeverWin) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Objective spotty = [nan](const ParameterVector& p) {
        if (p[0] == 1) return nan;
        if (p[0] == 3) return std::numeric_limits<double>::infinity();
        return static_cast<double>(p[0] % 3);
    };

    auto serial = ParameterOptimizer::optimize({ParameterRange(1, 6)}, spotty);
    EXPECT_EQ(serial.parameters, (ParameterVector{2}));
    EXPECT_EQ(serial.performance, 2.0);
    EXPECT_EQ(serial.evaluated, 6u);

    // A chunk holding only non-finite points is skipped in the merge
    auto parallel = ParameterOptimizer::optimize_parallel({ParameterRange(1, 6)}, [&spotty]() { return spotty; }, 6);
    EXPECT_EQ(parallel.parameters, serial.parameters);
    EXPECT_EQ(parallel.performance, serial.performance);
    EXPECT_EQ(parallel.evaluated, 6u);
}

TEST(ParameterOptimizerTest, AllNonFiniteIsInsufficientData) {
    Objective undefined = [](const ParameterVector&) { return std::numeric_limits<double>::quiet_NaN(); };

    EXPECT_THROW(ParameterOptimizer::optimize({ParameterRange(1, 4)}, undefined),
                 strata::core::InsufficientDataError);
    EXPECT_THROW(ParameterOptimizer::optimize_parallel({ParameterRange(1, 4)}, [&undefined]() { return undefined; }, 2),
                 strata::core::InsufficientDataError);
}

TEST(ParameterOptimizerTest, ParallelPropagatesFailure) {
    auto make = []() -> Objective {
        return [](const ParameterVector& p) -> double {
            if (p[0] == 5) {
                throw std::runtime_error("bad point");
            }
            return p[0];
        };
    };

    EXPECT_THROW(ParameterOptimizer::optimize_parallel({ParameterRange(1, 8)}, make, 4), std::runtime_error);
}

TEST_F(StrategyVariantTest, SingletonRangeMatchesBacktest) {
    StrategyVariant variant(StrategyFamily::SMA, series, {5, 5});
    auto best = variant.optimize({ParameterRange(10, 10), ParameterRange(30, 30)});

    StrategyVariant fresh(StrategyFamily::SMA, series, {10, 30});
    EXPECT_EQ(best.evaluated, 1u);
    EXPECT_EQ(best.parameters, (ParameterVector{10, 30}));
    EXPECT_EQ(best.performance, fresh.run_backtest().performance);
}

TEST_F(StrategyVariantTest, GridSearchMatchesBruteForce) {
    const std::vector<ParameterRange> ranges = {ParameterRange(5, 15, 5), ParameterRange(20, 40, 10)};
    StrategyVariant variant(StrategyFamily::SMA, series, {5, 20});

    auto best = variant.optimize(ranges);

    ParameterVector expected_point;
    const double expected = brute_force_best(StrategyFamily::SMA, series, ranges, expected_point);
    EXPECT_EQ(best.evaluated, 9u);
    EXPECT_EQ(best.parameters, expected_point);
    EXPECT_EQ(best.performance, expected);

    // The variant is left at the optimum
    EXPECT_EQ(variant.parameters(), best.parameters);
    ASSERT_TRUE(variant.last_result().has_value());
    EXPECT_EQ(variant.last_result()->performance, best.performance);
}

TEST_F(StrategyVariantTest, ParallelGridSearchMatchesSerial) {
    const std::vector<ParameterRange> ranges = {
        ParameterRange(10, 20, 5), ParameterRange(65, 75, 5), ParameterRange(25, 35, 5)};
    StrategyVariant serial(StrategyFamily::RSI, series, {14, 70, 30});
    StrategyVariant parallel(StrategyFamily::RSI, series, {14, 70, 30});

    auto a = serial.optimize(ranges);
    auto b = parallel.optimize_parallel(ranges, 4);

    EXPECT_EQ(a.evaluated, 27u);
    EXPECT_EQ(b.evaluated, 27u);
    EXPECT_EQ(a.parameters, b.parameters);
    EXPECT_EQ(a.performance, b.performance);
    EXPECT_TRUE(*serial.last_result() == *parallel.last_result());
}

TEST_F(StrategyVariantTest, OptimizeRejectsWrongRangeCount) {
    StrategyVariant variant(StrategyFamily::MACD, series, {12, 26, 9});
    EXPECT_THROW(variant.optimize({ParameterRange(5, 10), ParameterRange(20, 30)}),
                 strata::core::InvalidParameterError);
}

TEST_F(StrategyVariantTest, InsufficientDataPropagatesFromSearch) {
    StrategyVariant variant(StrategyFamily::SMA, series, {5, 20});
    EXPECT_THROW(variant.optimize({ParameterRange(5, 5), ParameterRange(200, 200)}),
                 strata::core::InsufficientDataError);
}

// Factory

TEST(StrategyFactoryTest, RegisteredTags) {
    EXPECT_EQ(StrategyFactory::registered_tags(),
              (std::vector<std::string>{"SMA", "EMA", "MACD", "RSI", "BB", "SO"}));
    EXPECT_EQ(StrategyFactory::parse_family("BB"), StrategyFamily::BB);
    EXPECT_THROW(StrategyFactory::parse_family("VWAP"), strata::core::UnknownStrategyError);
}

TEST(StrategyFactoryTest, CreateAndRun) {
    PriceSeries series = synthetic_series();
    StrategyOptions options;
    options.values = {{"EMA_S", 8.0}, {"EMA_L", 21.9}, {"TC", 0.001}};

    StrategyVariant variant = StrategyFactory::create("EMA", series, options);
    EXPECT_EQ(variant.parameters(), (ParameterVector{8, 21}));
    EXPECT_EQ(variant.transaction_cost(), 0.001);

    StrategyVariant direct(StrategyFamily::EMA, series, {8, 21}, 0.001);
    EXPECT_TRUE(StrategyFactory::run("EMA", series, options) == direct.run_backtest());
}

TEST(StrategyFactoryTest, MissingInputs) {
    PriceSeries series = synthetic_series();
    StrategyOptions options;
    options.values = {{"SMA_S", 10.0}};

    EXPECT_THROW(StrategyFactory::create("SMA", series, options), strata::core::InvalidParameterError);
    EXPECT_THROW(StrategyFactory::create("FOO", series, options), strata::core::UnknownStrategyError);
    EXPECT_THROW(StrategyFactory::optimize("SMA", series, options), strata::core::InvalidParameterError);
}

TEST(StrategyFactoryTest, RejectsUnrepresentableParameters) {
    PriceSeries series = synthetic_series();
    StrategyOptions options;

    options.values = {{"SMA_S", std::numeric_limits<double>::quiet_NaN()}, {"SMA_L", 30.0}};
    EXPECT_THROW(StrategyFactory::create("SMA", series, options), strata::core::InvalidParameterError);

    options.values = {{"SMA_S", 10.0}, {"SMA_L", 3e9}};
    EXPECT_THROW(StrategyFactory::create("SMA", series, options), strata::core::InvalidParameterError);

    options.values = {{"SMA_S", 10.0}, {"SMA_L", -std::numeric_limits<double>::infinity()}};
    EXPECT_THROW(StrategyFactory::create("SMA", series, options), strata::core::InvalidParameterError);
}

TEST(StrategyFactoryTest, UpperCaseRangeKeys) {
    PriceSeries series = synthetic_series();
    StrategyOptions options;
    options.ranges["RSI_PERIODS_RANGE"] = ParameterRange(10, 14, 2);
    options.ranges["RSI_UPPER_RANGE"] = ParameterRange(70, 70);
    options.ranges["RSI_LOWER_RANGE"] = ParameterRange(30, 30);

    EXPECT_EQ(StrategyOptions::upper_range_key("SO_D_mw"), "SO_D_MW_RANGE");
    ASSERT_NE(options.find_range("RSI_periods"), nullptr);
    EXPECT_EQ(options.find_range("RSI_periods")->start, 10.0);
    EXPECT_EQ(options.find_range("EMA_S"), nullptr);

    auto best = StrategyFactory::optimize("RSI", series, options);
    EXPECT_EQ(best.evaluated, 3u);
    EXPECT_EQ(best.parameters[1], 70);
    EXPECT_EQ(best.parameters[2], 30);

    // The exact spelling wins over the upper-cased one
    options.ranges["RSI_periods_RANGE"] = ParameterRange(12, 12);
    auto ranges = StrategyFactory::ranges_for(StrategyFamily::RSI, options);
    EXPECT_EQ(ranges[0].start, 12.0);
}

TEST(StrategyFactoryTest, OptimizeFromRangesOnly) {
    PriceSeries series = synthetic_series();
    StrategyOptions options;
    options.ranges[StrategyOptions::range_key("SO_periods")] = ParameterRange(10, 14, 2);
    options.ranges[StrategyOptions::range_key("SO_D_mw")] = ParameterRange(3, 5);

    auto serial = StrategyFactory::optimize("SO", series, options);
    auto parallel = StrategyFactory::optimize("SO", series, options, 2);

    EXPECT_EQ(serial.evaluated, 9u);
    EXPECT_EQ(serial.parameters, parallel.parameters);
    EXPECT_EQ(serial.performance, parallel.performance);

    StrategyOptions filled = StrategyFactory::with_range_defaults(StrategyFamily::SO, options);
    EXPECT_EQ(filled.values.at("SO_periods"), 10.0);
    EXPECT_EQ(filled.values.at("SO_D_mw"), 3.0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
