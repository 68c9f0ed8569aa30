#pragma once
#include <strata/core/market_data.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace strata::core {

// Value stored for entries that are not defined yet (indicator warm-up).
inline constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

inline bool is_defined(double value) {
    return !std::isnan(value);
}

using Column = std::vector<double>;

/**
 * @class PriceSeries
 * @brief Timestamp-ordered candles of one symbol with named derived columns.
 *
 * Every attached column has exactly one entry per candle. The "returns" column
 * (log returns of the close) is attached on construction.
 */
class PriceSeries {
public:
    static constexpr const char* kReturnsColumn = "returns";

    PriceSeries() = default;

    /**
     * @throws InvalidSeriesError if timestamps are not strictly increasing
     */
    PriceSeries(std::string symbol, std::vector<Candle> candles);

    const std::string& symbol() const { return symbol_; }
    size_t size() const { return candles_.size(); }
    bool empty() const { return candles_.empty(); }

    const Candle& candle(size_t i) const { return candles_.at(i); }
    const std::vector<Candle>& candles() const { return candles_; }

    std::vector<int64_t> timestamps() const;
    const Column& closes() const { return close_; }
    const Column& highs() const { return high_; }
    const Column& lows() const { return low_; }
    const Column& returns() const { return column(kReturnsColumn); }

    /**
     * @brief Attach or replace a derived column
     * @throws InvalidSeriesError if the column length differs from size()
     */
    void set_column(const std::string& name, Column values);

    /**
     * @throws InvalidSeriesError if no column of that name is attached
     */
    const Column& column(const std::string& name) const;

    bool has_column(const std::string& name) const;
    std::vector<std::string> column_names() const;

private:
    std::string symbol_;
    std::vector<Candle> candles_;
    Column close_;
    Column high_;
    Column low_;
    std::map<std::string, Column> columns_;
};

} // namespace strata::core
