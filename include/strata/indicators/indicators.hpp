// include/strata/indicators/indicators.hpp
#pragma once
#include <strata/core/price_series.hpp>
#include <vector>

namespace strata {
namespace indicators {

using core::Column;

// Rolling windows are trailing and non-centered. Output i is undefined when
// fewer than `window` inputs exist or any input in the window is undefined.
// A window <= 0 throws InvalidParameterError.

Column rolling_mean(const Column& values, int window);

/**
 * @brief Rolling sample standard deviation (divisor window - 1)
 * A window of 1 yields an all-undefined column.
 */
Column rolling_std(const Column& values, int window);

Column rolling_min(const Column& values, int window);
Column rolling_max(const Column& values, int window);

/**
 * @brief Exponentially weighted mean with adjusted weights
 *
 * alpha = 2 / (span + 1) and
 *   y_t = sum_i (1 - alpha)^i x_{t-i} / sum_i (1 - alpha)^i
 * over the defined inputs seen so far. Leading undefined inputs are skipped.
 * Output is undefined until min_periods defined inputs have been seen.
 */
Column ewm_mean(const Column& values, int span, int min_periods);

// ln(close[t] / close[t-1]); entry 0 is undefined.
Column log_returns(const Column& close);

// Elementwise a - b, undefined where either side is.
Column difference(const Column& a, const Column& b);

struct MacdColumns {
    Column macd;
    Column signal;
};

/**
 * @brief MACD line (ema_short - ema_long) and its signal line
 * @param signal_span span of the EMA applied to the MACD line
 */
MacdColumns macd(const Column& ema_short, const Column& ema_long, int signal_span);

// Recomputes only the signal line from an existing MACD line.
Column macd_signal(const Column& macd_line, int signal_span);

struct GainLossColumns {
    Column up;    // max(close[t] - close[t-1], 0), 0 at t = 0
    Column down;  // max(close[t-1] - close[t], 0), 0 at t = 0
};

GainLossColumns gains_and_losses(const Column& close);

// 100 * mean_up / (mean_up + mean_down); undefined when the denominator is 0.
Column relative_strength(const Column& mean_up, const Column& mean_down);

struct BandColumns {
    Column mean;
    Column std_dev;
    Column upper;
    Column lower;
    Column distance;  // (close - mean) / std_dev
};

BandColumns bollinger(const Column& close, int window, int deviations);

// Upper/lower bands only; mean and std_dev unchanged.
void bollinger_bands(BandColumns& bands, int deviations);

struct StochasticColumns {
    Column roll_low;
    Column roll_high;
    Column k;
    Column d;
};

/**
 * @brief %K = 100 * (close - min(low)) / (max(high) - min(low)) over k_window,
 *        %D = rolling mean of %K over d_window
 */
StochasticColumns stochastic(const Column& high, const Column& low, const Column& close,
                             int k_window, int d_window);

} // namespace indicators
} // namespace strata
