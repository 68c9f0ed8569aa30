#include <strata/core/market_data.hpp>
#include <strata/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace strata::core {

Candle::Candle()
    : timestamp(0), open(0.0), high(0.0), low(0.0), close(0.0), volume(0.0) {}

Candle::Candle(int64_t ts, double o, double h, double l, double c, double vol)
    : timestamp(ts), open(o), high(h), low(l), close(c), volume(vol) {}

Candle Candle::from_close(int64_t ts, double close) {
    return Candle(ts, close, close, close, close, 0.0);
}

namespace {

std::optional<Candle> parse_line(const std::string& line) {
    std::stringstream ss(line);
    std::string ts_str, open_str, high_str, low_str, close_str, volume_str;

    std::getline(ss, ts_str, ',');
    std::getline(ss, open_str, ',');
    std::getline(ss, high_str, ',');
    std::getline(ss, low_str, ',');
    std::getline(ss, close_str, ',');
    std::getline(ss, volume_str, ',');

    if (ts_str.empty() || close_str.empty()) {
        return std::nullopt;
    }

    try {
        Candle candle;
        candle.timestamp = std::stoll(ts_str);
        candle.open = std::stod(open_str);
        candle.high = std::stod(high_str);
        candle.low = std::stod(low_str);
        candle.close = std::stod(close_str);
        candle.volume = volume_str.empty() ? 0.0 : std::stod(volume_str);
        return candle;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

bool load_csv_candles(const std::string& csv_file, std::vector<Candle>& candles) {
    auto start_time = std::chrono::high_resolution_clock::now();

    if (!std::filesystem::exists(csv_file)) {
        utils::Logger::error() << "CSV file does not exist: " << csv_file << utils::Logger::endl;
        return false;
    }

    std::ifstream file(csv_file);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to open CSV file: " << csv_file << utils::Logger::endl;
        return false;
    }

    candles.clear();

    std::string line;
    // Skip header line
    std::getline(file, line);

    size_t line_count = 0;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        ++line_count;

        auto candle = parse_line(line);
        if (candle) {
            candles.push_back(*candle);
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        utils::Logger::warn() << "Skipped " << skipped << " malformed rows in " << csv_file
                              << utils::Logger::endl;
    }

    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) {
                         return a.timestamp < b.timestamp;
                     });

    auto last = std::unique(candles.begin(), candles.end(),
                            [](const Candle& a, const Candle& b) {
                                return a.timestamp == b.timestamp;
                            });
    size_t duplicates = static_cast<size_t>(std::distance(last, candles.end()));
    candles.erase(last, candles.end());

    if (duplicates > 0) {
        utils::Logger::warn() << "Dropped " << duplicates << " duplicate timestamps in " << csv_file
                              << utils::Logger::endl;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    utils::Logger::info() << "Loaded " << candles.size() << " candles from "
                          << line_count << " rows in " << csv_file
                          << " (" << duration << "ms)" << utils::Logger::endl;

    if (candles.empty()) {
        utils::Logger::error() << "No usable candles in " << csv_file << utils::Logger::endl;
        return false;
    }
    return true;
}

} // namespace strata::core
