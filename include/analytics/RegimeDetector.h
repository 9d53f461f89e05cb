#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rebalsim {
namespace analytics {

enum class MarketRegime {
    BULL,
    BEAR,
    VOLATILE,
    SIDEWAYS
};

const char* toString(MarketRegime regime);
std::optional<MarketRegime> regimeFromString(const std::string& value);

struct RegimeThresholds {
    double volatile_volatility = 0.06;
    double bull_short_trend = 0.012;
    double bull_medium_trend = 0.006;
    double bull_min_correlation = 0.7;
    double bull_max_volatility = 0.08;
    double bear_short_trend = -0.012;
    double bear_medium_trend = -0.006;
    double bear_max_volatility = 0.10;
};

struct RegimeAnalysis {
    MarketRegime regime = MarketRegime::SIDEWAYS;
    double short_trend = 0.0;    // 3 points
    double medium_trend = 0.0;   // 7 points
    double long_trend = 0.0;     // 14 points
    double volatility = 0.0;     // stdev of daily returns over 7 points
    double correlation = 0.0;    // primary vs secondary returns over 7 points
    bool sufficient_data = false;
    std::string description;
};

// Classifies the market from the two reference assets (BTC/ETH by default).
// Priority: volatile > bull > bear > sideways. Pure: identical input gives
// identical output.
class RegimeDetector {
public:
    static constexpr size_t kMinHistory = 14;

    RegimeDetector() = default;
    explicit RegimeDetector(RegimeThresholds thresholds) : thresholds_(thresholds) {}

    RegimeAnalysis analyzeRegime(const std::vector<double>& primary_prices,
                                 const std::vector<double>& secondary_prices) const;

    const RegimeThresholds& thresholds() const { return thresholds_; }

private:
    RegimeThresholds thresholds_;
};

} // namespace analytics
} // namespace rebalsim
