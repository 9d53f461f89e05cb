#include "backtest/DataHistory.h"
#include "backtest/FilePriceHistoryProvider.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using rebalsim::backtest::DataHistory;
using rebalsim::backtest::FilePriceHistoryProvider;
namespace utils = rebalsim::utils;

namespace {
const long long kDay0 = 1704067200000LL;  // 2024-01-01
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "rebalsim_test_prices";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);

    {
        // header, duplicate row, second timestamps, out of order
        std::ofstream out(dir / "BTC.csv");
        out << "timestamp,open,high,low,close,volume\n";
        out << (kDay0 / 1000 + 2 * 86400) << ",102,103,101,102.5,10\n";
        out << kDay0 << ",100,101,99,100.5,10\n";
        out << (kDay0 + utils::kMillisPerDay) << ",101,102,100,101.5,10\n";
        out << kDay0 << ",100,101,99,100.5,10\n";
        out << "garbage,line\n";
    }
    {
        std::ofstream out(dir / "ETH.json");
        out << "[{\"t\": " << kDay0 << ", \"o\": 10, \"h\": 11, \"l\": 9, \"c\": 10.5, \"v\": 1},"
            << " {\"timestamp\": " << (kDay0 + utils::kMillisPerDay) << ", \"close\": 11.0},"
            << " {\"close\": 99.0}]";
    }

    {
        const auto candles = DataHistory::loadCSV((dir / "BTC.csv").string());
        assert(candles.size() == 3);
        assert(candles[0].timestamp == kDay0);
        assert(candles[2].timestamp == kDay0 + 2 * utils::kMillisPerDay);
        assert(candles[2].close == 102.5);

        assert(DataHistory::loadCSV((dir / "missing.csv").string()).empty());

        const auto json = DataHistory::loadJSON((dir / "ETH.json").string());
        assert(json.size() == 2);
        assert(json[0].close == 10.5);
        assert(json[1].close == 11.0);

        assert(DataHistory::normalizeTimestamp(1704067200LL) == kDay0);
        assert(DataHistory::normalizeTimestamp(kDay0) == kDay0);
    }

    {
        FilePriceHistoryProvider provider(dir);
        const auto symbols = provider.availableSymbols();
        assert(symbols.size() == 2);
        assert(symbols[0] == "BTC");

        // window ends at the requested timestamp, oldest first
        auto rows = provider.getHistory("BTC", "1d", 2, kDay0 + utils::kMillisPerDay);
        assert(rows.size() == 2);
        assert(rows[0].timestamp == kDay0);
        assert(rows[1].close == 101.5);

        rows = provider.getHistory("BTC", "1d", 10, kDay0 + 2 * utils::kMillisPerDay);
        assert(rows.size() == 3);
        assert(provider.getHistory("BTC", "1d", 5, kDay0 - 1).empty());
        assert(provider.getHistory("BTC", "1h", 5, kDay0 + 10 * utils::kMillisPerDay).empty());
        assert(provider.getHistory("DOGE", "1d", 5, kDay0).empty());
        assert(provider.getHistory("ETH", "1d", 1, kDay0 + utils::kMillisPerDay).front().close == 11.0);
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
