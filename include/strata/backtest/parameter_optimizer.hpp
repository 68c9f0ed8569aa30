#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace strata::backtest {

// One grid axis: start, start + step, ... up to and including stop. Each value
// is truncated toward zero to an int before use.
struct ParameterRange {
    double start = 0.0;
    double stop = 0.0;
    double step = 1.0;

    ParameterRange() = default;
    ParameterRange(double start, double stop, double step = 1.0);

    /**
     * @throws InvalidParameterError if a bound or the step is not finite,
     *         a bound lies outside the int range, step <= 0 or stop < start
     */
    std::vector<int> values() const;
};

struct OptimizationResult {
    std::vector<int> parameters;
    double performance = 0.0;
    size_t evaluated = 0;
};

using ParameterVector = std::vector<int>;
using Objective = std::function<double(const ParameterVector&)>;

/**
 * @class ParameterOptimizer
 * @brief Exhaustive grid search maximizing an objective
 *
 * Points are enumerated row-major (last axis fastest). Ties keep the first
 * point in that order. Non-finite objective values never win; if no point is
 * finite the search throws InsufficientDataError. The first exception thrown
 * by the objective aborts the search and propagates.
 */
class ParameterOptimizer {
public:
    static constexpr size_t kMaxAxes = 3;

    /**
     * @throws InvalidParameterError for 0 or more than kMaxAxes ranges, or a malformed range
     */
    static std::vector<ParameterVector> grid_points(const std::vector<ParameterRange>& ranges);

    static OptimizationResult optimize(const std::vector<ParameterRange>& ranges, const Objective& objective);

    /**
     * @brief Grid search split over worker threads
     *
     * Each worker evaluates a contiguous chunk of the grid with its own
     * objective from make_objective(), so objectives must not share mutable
     * state. Returns the same point as optimize().
     */
    static OptimizationResult optimize_parallel(const std::vector<ParameterRange>& ranges,
                                                const std::function<Objective()>& make_objective,
                                                size_t thread_count);
};

std::string format_parameters(const ParameterVector& parameters);

} // namespace strata::backtest
