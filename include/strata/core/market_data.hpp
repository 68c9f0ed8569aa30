#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace strata::core {

// One OHLCV observation for a fixed time bucket.
struct Candle {
    int64_t timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Candle();

    Candle(int64_t ts, double o, double h, double l, double c, double vol);

    // Bar with open = high = low = close, for close-only data.
    static Candle from_close(int64_t ts, double close);
};

// Reads "timestamp,open,high,low,close,volume" rows after a header line.
// Rows that do not parse are skipped. The result is sorted by timestamp with
// duplicate timestamps dropped (first one kept). Returns false if the file
// cannot be opened or contains no usable rows.
bool load_csv_candles(const std::string& csv_file, std::vector<Candle>& candles);

} // namespace strata::core
