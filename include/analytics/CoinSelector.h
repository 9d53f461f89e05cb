#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace rebalsim {
namespace analytics {

struct CoinSelectorConfig {
    // Candidate universe in priority order (also the fill order for unranked assets)
    std::vector<std::string> universe{
        "BTC", "ETH", "BNB", "SOL", "ADA", "DOT", "AVAX", "LINK", "UNI",
        "ATOM", "NEAR", "FTM", "ALGO", "XLM", "VET", "THETA",
        "AAVE", "COMP", "MKR", "SNX", "CRV", "YFI", "SUSHI", "BAL"
    };
    // Always part of the final selection when present in the universe
    std::vector<std::string> anchors{"BTC", "ETH"};
    size_t min_history = 7;
};

struct CoinSelection {
    std::vector<std::string> symbols;          // rank order, anchors included
    std::map<std::string, double> scores;      // every ranked asset
};

// Multi-factor momentum ranking used to pick the top-N trading universe.
class CoinSelector {
public:
    CoinSelector() = default;
    explicit CoinSelector(CoinSelectorConfig config);

    // Composite score; 0 when fewer than 7 prices.
    //   base  = 0.25*r1 + 0.35*r3 + 0.25*r7 + 0.15*acceleration
    //   score = base * volume_weight / max(vol, 0.01) * trend_strength * mean_reversion_factor
    double calculateMomentumScore(const std::vector<double>& prices) const;

    CoinSelection selectTopCoins(const std::map<std::string, std::vector<double>>& market_data,
                                 size_t num_coins) const;

    // 0.5 + R^2 of a linear fit, 1.0 when the fit is degenerate
    static double calculateTrendStrength(const std::vector<double>& prices);

    const CoinSelectorConfig& config() const { return config_; }

private:
    bool isAnchor(const std::string& symbol) const;

    CoinSelectorConfig config_;
};

} // namespace analytics
} // namespace rebalsim
