#include "analytics/RegimeDetector.h"
#include "analytics/TechnicalIndicators.h"

namespace rebalsim {
namespace analytics {

const char* toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULL: return "bull";
        case MarketRegime::BEAR: return "bear";
        case MarketRegime::VOLATILE: return "volatile";
        case MarketRegime::SIDEWAYS: return "sideways";
    }
    return "sideways";
}

std::optional<MarketRegime> regimeFromString(const std::string& value) {
    if (value == "bull") return MarketRegime::BULL;
    if (value == "bear") return MarketRegime::BEAR;
    if (value == "volatile") return MarketRegime::VOLATILE;
    if (value == "sideways" || value == "neutral") return MarketRegime::SIDEWAYS;
    return std::nullopt;
}

RegimeAnalysis RegimeDetector::analyzeRegime(const std::vector<double>& primary_prices,
                                             const std::vector<double>& secondary_prices) const {
    RegimeAnalysis result;

    if (primary_prices.size() < kMinHistory || secondary_prices.size() < kMinHistory) {
        result.description = "Insufficient Data";
        return result;
    }
    result.sufficient_data = true;

    const auto primary_14 = TechnicalIndicators::tail(primary_prices, 14);
    const auto primary_7 = TechnicalIndicators::tail(primary_prices, 7);
    const auto secondary_7 = TechnicalIndicators::tail(secondary_prices, 7);

    result.short_trend = TechnicalIndicators::calculateTrend(TechnicalIndicators::tail(primary_prices, 3));
    result.medium_trend = TechnicalIndicators::calculateTrend(primary_7);
    result.long_trend = TechnicalIndicators::calculateTrend(primary_14);
    result.volatility = TechnicalIndicators::calculateVolatility(primary_7);
    result.correlation = TechnicalIndicators::calculateCorrelation(primary_7, secondary_7);

    const auto& t = thresholds_;

    if (result.volatility > t.volatile_volatility) {
        result.regime = MarketRegime::VOLATILE;
        result.description = "High volatility";
        return result;
    }

    if (result.short_trend > t.bull_short_trend &&
        result.medium_trend > t.bull_medium_trend &&
        result.correlation > t.bull_min_correlation &&
        result.volatility < t.bull_max_volatility) {
        result.regime = MarketRegime::BULL;
        result.description = "Consistent uptrend with correlated majors";
        return result;
    }

    if (result.short_trend < t.bear_short_trend &&
        result.medium_trend < t.bear_medium_trend &&
        result.volatility < t.bear_max_volatility) {
        result.regime = MarketRegime::BEAR;
        result.description = "Controlled downtrend";
        return result;
    }

    result.regime = MarketRegime::SIDEWAYS;
    result.description = "Range / weak trend";
    return result;
}

} // namespace analytics
} // namespace rebalsim
