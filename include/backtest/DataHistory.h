#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace rebalsim {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array of objects (long or short keys)
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Second-resolution timestamps are promoted to milliseconds
    static long long normalizeTimestamp(long long timestamp);
};

} // namespace backtest
} // namespace rebalsim
