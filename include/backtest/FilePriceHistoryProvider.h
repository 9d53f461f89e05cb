#pragma once

#include "core/contracts/IPriceHistoryProvider.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rebalsim {
namespace backtest {

// Reads <directory>/<SYMBOL>.csv or <SYMBOL>.json once and serves windows of it.
// Only the "1d" interval is stored on disk; other intervals return nothing.
class FilePriceHistoryProvider : public core::IPriceHistoryProvider {
public:
    explicit FilePriceHistoryProvider(std::filesystem::path directory);

    std::vector<Candle> getHistory(const std::string& symbol,
                                   const std::string& interval,
                                   int lookback,
                                   long long end_timestamp_ms) override;

    // Symbols with a data file present
    std::vector<std::string> availableSymbols() const;

private:
    const std::vector<Candle>& candlesFor(const std::string& symbol);

    std::filesystem::path directory_;
    std::mutex mutex_;
    std::map<std::string, std::vector<Candle>> cache_;
};

} // namespace backtest
} // namespace rebalsim
