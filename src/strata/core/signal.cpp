#include <strata/core/signal.hpp>
#include <strata/core/errors.hpp>
#include <algorithm>
#include <string>

namespace strata::core {

PositionSeries crossover_positions(const Column& fast, const Column& slow) {
    if (fast.size() != slow.size()) {
        throw InvalidSeriesError("crossover columns differ in length: " + std::to_string(fast.size())
                                 + " vs " + std::to_string(slow.size()));
    }

    PositionSeries positions(fast.size());
    for (size_t i = 0; i < fast.size(); ++i) {
        if (is_defined(fast[i]) && is_defined(slow[i])) {
            positions[i] = fast[i] > slow[i] ? static_cast<int>(Position::LONG)
                                             : static_cast<int>(Position::SHORT);
        }
    }
    return positions;
}

PositionSeries threshold_positions(const Column& indicator, double upper, double lower) {
    if (upper <= lower) {
        throw InvalidParameterError("upper threshold " + std::to_string(upper)
                                    + " must exceed lower threshold " + std::to_string(lower));
    }

    PositionSeries positions(indicator.size());
    Position state = Position::FLAT;
    for (size_t i = 0; i < indicator.size(); ++i) {
        const double value = indicator[i];
        if (!is_defined(value)) {
            continue;
        }
        if (value > upper) {
            state = Position::SHORT;  // overbought
        } else if (value < lower) {
            state = Position::LONG;   // oversold
        }
        positions[i] = static_cast<int>(state);
    }
    return positions;
}

size_t defined_count(const PositionSeries& positions) {
    return static_cast<size_t>(std::count_if(positions.begin(), positions.end(),
                                             [](const std::optional<int>& p) { return p.has_value(); }));
}

} // namespace strata::core
