#include <strata/core/price_series.hpp>
#include <strata/core/errors.hpp>
#include <strata/indicators/indicators.hpp>

namespace strata::core {

PriceSeries::PriceSeries(std::string symbol, std::vector<Candle> candles)
    : symbol_(std::move(symbol)), candles_(std::move(candles)) {
    for (size_t i = 1; i < candles_.size(); ++i) {
        if (candles_[i].timestamp <= candles_[i - 1].timestamp) {
            throw InvalidSeriesError("timestamps of " + symbol_ + " are not strictly increasing at index "
                                     + std::to_string(i));
        }
    }

    close_.reserve(candles_.size());
    high_.reserve(candles_.size());
    low_.reserve(candles_.size());
    for (const auto& c : candles_) {
        close_.push_back(c.close);
        high_.push_back(c.high);
        low_.push_back(c.low);
    }

    columns_[kReturnsColumn] = indicators::log_returns(close_);
}

std::vector<int64_t> PriceSeries::timestamps() const {
    std::vector<int64_t> result;
    result.reserve(candles_.size());
    for (const auto& c : candles_) {
        result.push_back(c.timestamp);
    }
    return result;
}

void PriceSeries::set_column(const std::string& name, Column values) {
    if (values.size() != candles_.size()) {
        throw InvalidSeriesError("column '" + name + "' has " + std::to_string(values.size())
                                 + " entries, series has " + std::to_string(candles_.size()));
    }
    columns_[name] = std::move(values);
}

const Column& PriceSeries::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw InvalidSeriesError("no column '" + name + "' attached to " + symbol_);
    }
    return it->second;
}

bool PriceSeries::has_column(const std::string& name) const {
    return columns_.count(name) > 0;
}

std::vector<std::string> PriceSeries::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& [name, _] : columns_) {
        names.push_back(name);
    }
    return names;
}

} // namespace strata::core
