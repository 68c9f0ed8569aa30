#include <strata/backtest/parameter_optimizer.hpp>
#include <strata/core/errors.hpp>
#include <strata/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <limits>
#include <sstream>
#include <string>

namespace strata::backtest {

ParameterRange::ParameterRange(double start, double stop, double step)
    : start(start), stop(stop), step(step) {}

std::vector<int> ParameterRange::values() const {
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step)) {
        throw core::InvalidParameterError("range bounds and step must be finite");
    }
    constexpr double lowest = std::numeric_limits<int>::min();
    constexpr double highest = std::numeric_limits<int>::max();
    if (start < lowest || stop > highest) {
        throw core::InvalidParameterError("range [" + std::to_string(start) + ", " + std::to_string(stop)
                                          + "] exceeds the int parameter domain");
    }
    if (!(step > 0.0)) {
        throw core::InvalidParameterError("range step must be positive, got " + std::to_string(step));
    }
    if (stop < start) {
        throw core::InvalidParameterError("range stop " + std::to_string(stop)
                                          + " is below start " + std::to_string(start));
    }

    std::vector<int> result;
    // Tolerate float drift on the last step, e.g. 0.1 increments
    const double tolerance = step * 1e-9;
    for (size_t i = 0;; ++i) {
        const double value = start + static_cast<double>(i) * step;
        if (value > stop + tolerance) {
            break;
        }
        result.push_back(static_cast<int>(std::trunc(value)));
    }
    return result;
}

std::string format_parameters(const ParameterVector& parameters) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < parameters.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << parameters[i];
    }
    oss << ")";
    return oss.str();
}

std::vector<ParameterVector> ParameterOptimizer::grid_points(const std::vector<ParameterRange>& ranges) {
    if (ranges.empty() || ranges.size() > kMaxAxes) {
        throw core::InvalidParameterError("grid search takes 1 to " + std::to_string(kMaxAxes)
                                          + " ranges, got " + std::to_string(ranges.size()));
    }

    std::vector<std::vector<int>> axes;
    axes.reserve(ranges.size());
    size_t total = 1;
    for (const auto& range : ranges) {
        axes.push_back(range.values());
        total *= axes.back().size();
    }

    std::vector<ParameterVector> points;
    points.reserve(total);
    std::vector<size_t> cursor(axes.size(), 0);
    for (size_t n = 0; n < total; ++n) {
        ParameterVector point(axes.size());
        for (size_t a = 0; a < axes.size(); ++a) {
            point[a] = axes[a][cursor[a]];
        }
        points.push_back(std::move(point));

        // Odometer increment, last axis fastest
        for (size_t a = axes.size(); a-- > 0;) {
            if (++cursor[a] < axes[a].size()) {
                break;
            }
            cursor[a] = 0;
        }
    }
    return points;
}

namespace {

OptimizationResult search_chunk(const std::vector<ParameterVector>& points, size_t begin, size_t end,
                                const Objective& objective) {
    OptimizationResult best;
    best.performance = -std::numeric_limits<double>::infinity();
    for (size_t i = begin; i < end; ++i) {
        const double value = objective(points[i]);
        ++best.evaluated;
        utils::Logger::debug() << "Grid point " << format_parameters(points[i]) << " -> " << value
                               << utils::Logger::endl;
        if (!std::isfinite(value)) {
            continue;
        }
        if (best.parameters.empty() || value > best.performance) {
            best.parameters = points[i];
            best.performance = value;
        }
    }
    return best;
}

void require_finite_best(const OptimizationResult& best) {
    if (best.parameters.empty()) {
        utils::Logger::warn() << "None of " << best.evaluated << " grid points gave a finite performance"
                              << utils::Logger::endl;
        throw core::InsufficientDataError("no grid point produced a finite performance");
    }
}

} // namespace

OptimizationResult ParameterOptimizer::optimize(const std::vector<ParameterRange>& ranges,
                                                const Objective& objective) {
    const auto points = grid_points(ranges);
    utils::Logger::info() << "Grid search over " << points.size() << " points" << utils::Logger::endl;

    auto start_time = std::chrono::high_resolution_clock::now();
    OptimizationResult best = search_chunk(points, 0, points.size(), objective);
    require_finite_best(best);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    utils::Logger::info() << "Best point " << format_parameters(best.parameters) << " with performance "
                          << best.performance << " (" << duration << "ms)" << utils::Logger::endl;
    return best;
}

OptimizationResult ParameterOptimizer::optimize_parallel(const std::vector<ParameterRange>& ranges,
                                                         const std::function<Objective()>& make_objective,
                                                         size_t thread_count) {
    const auto points = grid_points(ranges);
    const size_t workers = std::max<size_t>(1, std::min(thread_count, points.size()));
    const size_t chunk_size = (points.size() + workers - 1) / workers;

    utils::Logger::info() << "Grid search over " << points.size() << " points on " << workers
                          << " threads" << utils::Logger::endl;

    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<std::future<OptimizationResult>> futures;
    futures.reserve(workers);
    for (size_t begin = 0; begin < points.size(); begin += chunk_size) {
        const size_t end = std::min(begin + chunk_size, points.size());
        Objective objective = make_objective();
        futures.push_back(std::async(std::launch::async,
            [&points, begin, end, objective = std::move(objective)]() {
                return search_chunk(points, begin, end, objective);
            }));
    }

    // Collect every future first so no worker outlives `points`, then rethrow
    // the failure of the earliest chunk.
    std::vector<OptimizationResult> chunk_results(futures.size());
    std::exception_ptr failure;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            chunk_results[i] = futures[i].get();
        } catch (...) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    OptimizationResult best;
    for (const auto& chunk : chunk_results) {
        best.evaluated += chunk.evaluated;
        if (chunk.parameters.empty()) {
            continue;
        }
        if (best.parameters.empty() || chunk.performance > best.performance) {
            best.parameters = chunk.parameters;
            best.performance = chunk.performance;
        }
    }

    require_finite_best(best);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    utils::Logger::info() << "Best point " << format_parameters(best.parameters) << " with performance "
                          << best.performance << " (" << duration << "ms)" << utils::Logger::endl;
    return best;
}

} // namespace strata::backtest
