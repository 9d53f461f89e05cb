#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace rebalsim {
namespace backtest {

namespace {
constexpr long long kSecondsThreshold = 100000000000LL;   // ~1973 in ms, ~5138 in s

void sortAndDeduplicate(std::vector<Candle>& candles) {
    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    candles.erase(std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp == b.timestamp;
    }), candles.end());
}

double numberField(const nlohmann::json& item, const char* key, const char* short_key) {
    if (item.contains(key) && item[key].is_number()) return item[key].get<double>();
    if (item.contains(short_key) && item[short_key].is_number()) return item[short_key].get<double>();
    return 0.0;
}
}

long long DataHistory::normalizeTimestamp(long long timestamp) {
    return (timestamp > 0 && timestamp < kSecondsThreshold) ? timestamp * 1000LL : timestamp;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // UTF-8 BOM on the first cell
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // header or malformed row
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = normalizeTimestamp(std::stoll(row[0]));
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortAndDeduplicate(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON price file is not an array: {}", file_path);
            return candles;
        }
        for (const auto& item : j) {
            if (!item.is_object()) {
                continue;
            }
            Candle candle;
            if (item.contains("timestamp") && item["timestamp"].is_number()) {
                candle.timestamp = item["timestamp"].get<long long>();
            } else if (item.contains("t") && item["t"].is_number()) {
                candle.timestamp = item["t"].get<long long>();
            } else {
                continue;
            }
            candle.timestamp = normalizeTimestamp(candle.timestamp);
            candle.open = numberField(item, "open", "o");
            candle.high = numberField(item, "high", "h");
            candle.low = numberField(item, "low", "l");
            candle.close = numberField(item, "close", "c");
            candle.volume = numberField(item, "volume", "v");
            candles.push_back(candle);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    sortAndDeduplicate(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

} // namespace backtest
} // namespace rebalsim
