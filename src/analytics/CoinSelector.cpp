#include "analytics/CoinSelector.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace rebalsim {
namespace analytics {

namespace {
constexpr double W_ONE_DAY = 0.25;
constexpr double W_THREE_DAY = 0.35;   // most predictive horizon
constexpr double W_SEVEN_DAY = 0.25;
constexpr double W_ACCELERATION = 0.15;
constexpr double MIN_VOLATILITY = 0.01;
constexpr double MAX_VOLUME_WEIGHT = 1.5;
constexpr double MAX_DEVIATION_PENALTY = 0.3;
constexpr size_t ACCELERATION_MIN_HISTORY = 10;

double safeReturn(double latest, double past) {
    return (past > 0.0) ? (latest / past - 1.0) : 0.0;
}
}

CoinSelector::CoinSelector(CoinSelectorConfig config)
    : config_(std::move(config)) {}

double CoinSelector::calculateMomentumScore(const std::vector<double>& prices) const {
    const size_t n = prices.size();
    if (n < config_.min_history || n < 7) {
        return 0.0;
    }

    const double latest = prices[n - 1];
    const double short_momentum = safeReturn(latest, prices[n - 2]) * W_ONE_DAY;
    const double medium_momentum = safeReturn(latest, prices[n - 4]) * W_THREE_DAY;
    const double long_momentum = safeReturn(latest, prices[n - 7]) * W_SEVEN_DAY;

    // Slope change between the last three days and the three before, as returns
    double acceleration = 0.0;
    if (n >= ACCELERATION_MIN_HISTORY) {
        const double recent_slope = safeReturn(latest, prices[n - 4]) / 3.0;
        const double older_slope = safeReturn(prices[n - 4], prices[n - 7]) / 3.0;
        acceleration = (recent_slope - older_slope) * W_ACCELERATION;
    }

    const auto window = TechnicalIndicators::tail(prices, 7);
    const double volatility = TechnicalIndicators::calculateVolatility(window);
    const double volume_weight = std::min(MAX_VOLUME_WEIGHT, 1.0 + volatility * 2.0);

    const double mean_price = TechnicalIndicators::calculateMean(window);
    const double deviation = (mean_price > 0.0) ? (latest - mean_price) / mean_price : 0.0;
    const double mean_reversion_factor = 1.0 - std::min(MAX_DEVIATION_PENALTY, std::abs(deviation));

    const double trend_strength = calculateTrendStrength(window);

    const double base_momentum =
        (short_momentum + medium_momentum + long_momentum + acceleration) * volume_weight;
    const double risk_adjusted = base_momentum / std::max(volatility, MIN_VOLATILITY);

    return risk_adjusted * trend_strength * mean_reversion_factor;
}

double CoinSelector::calculateTrendStrength(const std::vector<double>& prices) {
    if (prices.size() < 3) {
        return 1.0;
    }
    const auto fit = TechnicalIndicators::linearRegression(prices);
    if (!fit.valid) {
        return 1.0;
    }
    return 0.5 + fit.r_squared;
}

bool CoinSelector::isAnchor(const std::string& symbol) const {
    return std::find(config_.anchors.begin(), config_.anchors.end(), symbol) != config_.anchors.end();
}

CoinSelection CoinSelector::selectTopCoins(const std::map<std::string, std::vector<double>>& market_data,
                                           size_t num_coins) const {
    CoinSelection selection;
    if (num_coins == 0) {
        return selection;
    }

    std::vector<std::string> candidates = config_.universe;
    if (candidates.empty()) {
        for (const auto& [symbol, prices] : market_data) {
            candidates.push_back(symbol);
        }
    }

    std::vector<std::pair<std::string, double>> ranked;
    std::vector<std::string> unranked;
    for (const auto& symbol : candidates) {
        auto it = market_data.find(symbol);
        if (it != market_data.end() && it->second.size() >= config_.min_history) {
            const double score = calculateMomentumScore(it->second);
            ranked.emplace_back(symbol, score);
            selection.scores[symbol] = score;
        } else {
            unranked.push_back(symbol);
        }
    }

    // Ties keep universe order
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    for (const auto& [symbol, score] : ranked) {
        if (selection.symbols.size() >= num_coins) break;
        selection.symbols.push_back(symbol);
    }
    for (const auto& symbol : unranked) {
        if (selection.symbols.size() >= num_coins) break;
        selection.symbols.push_back(symbol);
    }

    const std::set<std::string> candidate_set(candidates.begin(), candidates.end());
    for (const auto& anchor : config_.anchors) {
        if (candidate_set.count(anchor) == 0) {
            continue;
        }
        if (std::find(selection.symbols.begin(), selection.symbols.end(), anchor) != selection.symbols.end()) {
            continue;
        }
        if (selection.symbols.size() < num_coins) {
            selection.symbols.push_back(anchor);
            continue;
        }
        // Swap out the lowest-ranked non-anchor
        for (auto it = selection.symbols.rbegin(); it != selection.symbols.rend(); ++it) {
            if (!isAnchor(*it)) {
                *it = anchor;
                break;
            }
        }
    }

    return selection;
}

} // namespace analytics
} // namespace rebalsim
