#include <strata/backtest/report.hpp>
#include <strata/utils/logger.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>

namespace strata::backtest {

void write_results_csv(std::ostream& out, const StrategyResult& result, const std::string& label) {
    out << "# " << label << "\n";
    out << "timestamp,returns,position,strategy,trades,creturns,cstrategy\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (size_t k = 0; k < result.size(); ++k) {
        out << result.timestamps[k] << ','
            << result.returns[k] << ','
            << result.positions[k] << ','
            << result.strategy[k] << ','
            << result.trades[k] << ','
            << result.creturns[k] << ','
            << result.cstrategy[k] << '\n';
    }
}

bool export_results_csv(const std::string& csv_file, const StrategyResult& result, const std::string& label) {
    const auto parent = std::filesystem::path(csv_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            utils::Logger::error() << "Cannot create directory " << parent.string() << ": " << ec.message()
                                   << utils::Logger::endl;
            return false;
        }
    }

    std::ofstream file(csv_file);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to open output file: " << csv_file << utils::Logger::endl;
        return false;
    }

    write_results_csv(file, result, label);
    file.flush();
    if (!file) {
        utils::Logger::error() << "Failed writing results to " << csv_file << utils::Logger::endl;
        return false;
    }

    utils::Logger::info() << "Wrote " << result.size() << " result rows to " << csv_file << utils::Logger::endl;
    return true;
}

} // namespace strata::backtest
