#include <strata/indicators/indicators.hpp>
#include <strata/core/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace strata {
namespace indicators {

using core::is_defined;
using core::kUndefined;

namespace {

void require_window(int window, const char* what) {
    if (window <= 0) {
        throw core::InvalidParameterError(std::string(what) + " window must be positive, got "
                                          + std::to_string(window));
    }
}

// Applies reduce(first, last) to every full window of defined values.
template<typename Reduce>
Column rolling_apply(const Column& values, int window, Reduce reduce) {
    Column out(values.size(), kUndefined);
    const size_t w = static_cast<size_t>(window);
    if (values.size() < w) {
        return out;
    }

    // Consecutive defined inputs ending at i
    size_t defined_run = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        defined_run = is_defined(values[i]) ? defined_run + 1 : 0;
        if (defined_run >= w) {
            out[i] = reduce(values.begin() + (i + 1 - w), values.begin() + (i + 1));
        }
    }
    return out;
}

} // namespace

Column rolling_mean(const Column& values, int window) {
    require_window(window, "rolling mean");
    return rolling_apply(values, window, [window](auto first, auto last) {
        double sum = 0.0;
        for (auto it = first; it != last; ++it) {
            sum += *it;
        }
        return sum / window;
    });
}

Column rolling_std(const Column& values, int window) {
    require_window(window, "rolling std");
    if (window == 1) {
        return Column(values.size(), kUndefined);
    }
    return rolling_apply(values, window, [window](auto first, auto last) {
        double sum = 0.0;
        for (auto it = first; it != last; ++it) {
            sum += *it;
        }
        const double mean = sum / window;
        double sq_sum = 0.0;
        for (auto it = first; it != last; ++it) {
            sq_sum += (*it - mean) * (*it - mean);
        }
        return std::sqrt(sq_sum / (window - 1));
    });
}

Column rolling_min(const Column& values, int window) {
    require_window(window, "rolling min");
    return rolling_apply(values, window, [](auto first, auto last) {
        return *std::min_element(first, last);
    });
}

Column rolling_max(const Column& values, int window) {
    require_window(window, "rolling max");
    return rolling_apply(values, window, [](auto first, auto last) {
        return *std::max_element(first, last);
    });
}

Column ewm_mean(const Column& values, int span, int min_periods) {
    require_window(span, "ewm span");
    Column out(values.size(), kUndefined);
    if (values.empty()) {
        return out;
    }

    const double alpha = 2.0 / (span + 1.0);
    const double decay = 1.0 - alpha;

    double weighted = values[0];
    double old_weight = 1.0;
    int observations = is_defined(values[0]) ? 1 : 0;
    if (observations >= min_periods) {
        out[0] = weighted;
    }

    for (size_t i = 1; i < values.size(); ++i) {
        const double current = values[i];
        const bool observed = is_defined(current);
        observations += observed ? 1 : 0;

        if (is_defined(weighted)) {
            // Weights decay over gaps too
            old_weight *= decay;
            if (observed) {
                if (weighted != current) {
                    weighted = (old_weight * weighted + current) / (old_weight + 1.0);
                }
                old_weight += 1.0;
            }
        } else if (observed) {
            weighted = current;
        }

        if (observations >= min_periods) {
            out[i] = weighted;
        }
    }
    return out;
}

Column log_returns(const Column& close) {
    Column out(close.size(), kUndefined);
    for (size_t i = 1; i < close.size(); ++i) {
        out[i] = std::log(close[i] / close[i - 1]);
    }
    return out;
}

Column difference(const Column& a, const Column& b) {
    Column out(a.size(), kUndefined);
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (is_defined(a[i]) && is_defined(b[i])) {
            out[i] = a[i] - b[i];
        }
    }
    return out;
}

MacdColumns macd(const Column& ema_short, const Column& ema_long, int signal_span) {
    MacdColumns result;
    result.macd = difference(ema_short, ema_long);
    result.signal = macd_signal(result.macd, signal_span);
    return result;
}

Column macd_signal(const Column& macd_line, int signal_span) {
    return ewm_mean(macd_line, signal_span, signal_span);
}

GainLossColumns gains_and_losses(const Column& close) {
    GainLossColumns result;
    result.up.assign(close.size(), 0.0);
    result.down.assign(close.size(), 0.0);
    for (size_t i = 1; i < close.size(); ++i) {
        const double change = close[i] - close[i - 1];
        if (change > 0) {
            result.up[i] = change;
        } else if (change < 0) {
            result.down[i] = -change;
        }
    }
    return result;
}

Column relative_strength(const Column& mean_up, const Column& mean_down) {
    Column out(mean_up.size(), kUndefined);
    for (size_t i = 0; i < mean_up.size() && i < mean_down.size(); ++i) {
        const double total = mean_up[i] + mean_down[i];
        if (is_defined(total) && total != 0.0) {
            out[i] = mean_up[i] / total * 100.0;
        }
    }
    return out;
}

BandColumns bollinger(const Column& close, int window, int deviations) {
    BandColumns bands;
    bands.mean = rolling_mean(close, window);
    bands.std_dev = rolling_std(close, window);
    bands.distance.assign(close.size(), kUndefined);
    for (size_t i = 0; i < close.size(); ++i) {
        const double sd = bands.std_dev[i];
        if (is_defined(sd) && sd != 0.0 && is_defined(bands.mean[i])) {
            bands.distance[i] = (close[i] - bands.mean[i]) / sd;
        }
    }
    bollinger_bands(bands, deviations);
    return bands;
}

void bollinger_bands(BandColumns& bands, int deviations) {
    const size_t n = bands.mean.size();
    bands.upper.assign(n, kUndefined);
    bands.lower.assign(n, kUndefined);
    for (size_t i = 0; i < n; ++i) {
        if (is_defined(bands.mean[i]) && is_defined(bands.std_dev[i])) {
            bands.upper[i] = bands.mean[i] + deviations * bands.std_dev[i];
            bands.lower[i] = bands.mean[i] - deviations * bands.std_dev[i];
        }
    }
}

StochasticColumns stochastic(const Column& high, const Column& low, const Column& close,
                             int k_window, int d_window) {
    require_window(d_window, "stochastic %D");
    StochasticColumns result;
    result.roll_low = rolling_min(low, k_window);
    result.roll_high = rolling_max(high, k_window);
    result.k.assign(close.size(), kUndefined);
    for (size_t i = 0; i < close.size(); ++i) {
        const double range = result.roll_high[i] - result.roll_low[i];
        if (is_defined(range) && range != 0.0) {
            result.k[i] = (close[i] - result.roll_low[i]) / range * 100.0;
        }
    }
    result.d = rolling_mean(result.k, d_window);
    return result;
}

} // namespace indicators
} // namespace strata
