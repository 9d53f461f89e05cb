#include "analytics/CoinSelector.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using rebalsim::analytics::CoinSelector;
using rebalsim::analytics::CoinSelectorConfig;

namespace {
std::vector<double> series(double start, double daily, size_t n, double wobble = 0.0) {
    std::vector<double> out;
    double price = start;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(price);
        const double noise = (i % 2 == 0) ? wobble : -wobble;
        price *= 1.0 + daily + noise;
    }
    return out;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}
}

int main() {
    {
        CoinSelector selector;
        assert(selector.calculateMomentumScore(series(100.0, 0.02, 6)) == 0.0);
        assert(selector.calculateMomentumScore(series(100.0, 0.02, 14, 0.005)) > 0.0);
        assert(selector.calculateMomentumScore(series(100.0, -0.02, 14, 0.005)) < 0.0);
    }

    {
        // the same path at a thousandth of the price scores the same
        CoinSelector selector;
        const auto expensive = series(40000.0, 0.01, 14, 0.01);
        auto cheap = expensive;
        for (auto& p : cheap) {
            p /= 1000.0;
        }
        const double a = selector.calculateMomentumScore(expensive);
        const double b = selector.calculateMomentumScore(cheap);
        assert(a != 0.0);
        assert(std::abs(a - b) <= 1e-9 * std::abs(a));
    }

    {
        // perfect linear fit
        assert(std::abs(CoinSelector::calculateTrendStrength({1, 2, 3, 4, 5}) - 1.5) < 1e-9);
        assert(CoinSelector::calculateTrendStrength({1, 2}) == 1.0);
        assert(CoinSelector::calculateTrendStrength({3, 3, 3}) == 1.0);
    }

    {
        CoinSelectorConfig config;
        config.universe = {"AAA", "BBB", "CCC", "DDD", "BTC", "ETH"};
        config.anchors = {"BTC", "ETH"};
        CoinSelector selector(config);

        std::map<std::string, std::vector<double>> data;
        data["AAA"] = series(10.0, 0.03, 14, 0.004);
        data["BBB"] = series(10.0, 0.02, 14, 0.004);
        data["CCC"] = series(10.0, -0.01, 14, 0.004);
        data["BTC"] = series(100.0, -0.02, 14, 0.004);
        data["ETH"] = series(50.0, -0.02, 14, 0.004);

        const auto selection = selector.selectTopCoins(data, 3);
        assert(selection.symbols.size() == 3);
        assert(contains(selection.symbols, "AAA"));
        assert(contains(selection.symbols, "BTC"));
        assert(contains(selection.symbols, "ETH"));
        assert(!contains(selection.symbols, "DDD"));
        assert(selection.scores.count("DDD") == 0);
        assert(selection.scores.at("AAA") > selection.scores.at("BBB"));
    }

    {
        // symbols without enough history fill in universe order
        CoinSelectorConfig config;
        config.universe = {"AAA", "BBB", "CCC", "DDD"};
        config.anchors.clear();
        CoinSelector selector(config);

        std::map<std::string, std::vector<double>> data;
        data["CCC"] = series(10.0, 0.01, 10, 0.002);
        data["BBB"] = series(10.0, 0.01, 3);

        const auto selection = selector.selectTopCoins(data, 3);
        assert((selection.symbols == std::vector<std::string>{"CCC", "AAA", "BBB"}));
        assert(selector.selectTopCoins(data, 0).symbols.empty());
    }

    std::cout << "[TEST] CoinSelector PASSED\n";
    return 0;
}
