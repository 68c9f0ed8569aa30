#pragma once
#include <strata/core/price_series.hpp>
#include <optional>
#include <vector>

namespace strata::core {

enum class Position : int {
    SHORT = -1,
    FLAT = 0,
    LONG = 1
};

// One entry per candle; std::nullopt where a governing indicator is undefined.
// Defined entries hold -1, 0 or +1.
using PositionSeries = std::vector<std::optional<int>>;

enum class SignalRule {
    CROSSOVER,  // long when fast > slow, short otherwise
    THRESHOLD   // short above upper, long below lower, hold in between
};

/**
 * @brief Crossover rule: +1 where fast > slow, else -1. No flat state.
 * @throws InvalidSeriesError if the columns differ in length
 */
PositionSeries crossover_positions(const Column& fast, const Column& slow);

/**
 * @brief Threshold rule with carry-forward
 *
 * -1 when indicator > upper, +1 when indicator < lower, otherwise the last
 * emitted state. The state starts flat, so entries before the first crossing
 * are 0. Undefined indicator entries give undefined positions and keep the
 * carried state.
 *
 * @throws InvalidParameterError if upper <= lower
 */
PositionSeries threshold_positions(const Column& indicator, double upper, double lower);

// Number of defined entries.
size_t defined_count(const PositionSeries& positions);

} // namespace strata::core
