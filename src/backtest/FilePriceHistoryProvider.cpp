#include "backtest/FilePriceHistoryProvider.h"
#include "backtest/DataHistory.h"

#include <algorithm>
#include <set>
#include <system_error>

namespace rebalsim {
namespace backtest {

FilePriceHistoryProvider::FilePriceHistoryProvider(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

const std::vector<Candle>& FilePriceHistoryProvider::candlesFor(const std::string& symbol) {
    auto it = cache_.find(symbol);
    if (it != cache_.end()) {
        return it->second;
    }

    std::vector<Candle> candles;
    const auto csv_path = directory_ / (symbol + ".csv");
    const auto json_path = directory_ / (symbol + ".json");
    std::error_code ec;
    if (std::filesystem::exists(csv_path, ec)) {
        candles = DataHistory::loadCSV(csv_path.string());
    } else if (std::filesystem::exists(json_path, ec)) {
        candles = DataHistory::loadJSON(json_path.string());
    }

    return cache_.emplace(symbol, std::move(candles)).first->second;
}

std::vector<Candle> FilePriceHistoryProvider::getHistory(const std::string& symbol,
                                                         const std::string& interval,
                                                         int lookback,
                                                         long long end_timestamp_ms) {
    if (interval != "1d" || lookback <= 0) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto& candles = candlesFor(symbol);

    auto end = std::upper_bound(candles.begin(), candles.end(), end_timestamp_ms,
                                [](long long ts, const Candle& c) { return ts < c.timestamp; });
    const auto available = static_cast<long long>(std::distance(candles.begin(), end));
    auto begin = end - static_cast<std::ptrdiff_t>(std::min<long long>(available, lookback));
    return std::vector<Candle>(begin, end);
}

std::vector<std::string> FilePriceHistoryProvider::availableSymbols() const {
    std::set<std::string> symbols;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return {};
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        const auto ext = entry.path().extension();
        if (entry.is_regular_file() && (ext == ".csv" || ext == ".json")) {
            symbols.insert(entry.path().stem().string());
        }
    }
    return std::vector<std::string>(symbols.begin(), symbols.end());
}

} // namespace backtest
} // namespace rebalsim
