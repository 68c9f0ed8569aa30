#pragma once

#include <strata/backtest/backtest_executor.hpp>
#include <ostream>
#include <string>

namespace strata::backtest {

// Writes "# <label>" followed by one CSV row per result row:
// timestamp,returns,position,strategy,trades,creturns,cstrategy
void write_results_csv(std::ostream& out, const StrategyResult& result, const std::string& label);

// Returns false if the file cannot be written.
bool export_results_csv(const std::string& csv_file, const StrategyResult& result, const std::string& label);

} // namespace strata::backtest
