#include "strategy/HybridStrategyEngine.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace rebalsim {
namespace strategy {

using analytics::MarketRegime;
using analytics::TechnicalIndicators;

RegimeParameters regimeParameters(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULL:
            return {0.8, 0.2, 1.08, 1.4, "Trend-following"};
        case MarketRegime::BEAR:
            return {0.3, 0.7, 0.92, 0.6, "Capital preservation"};
        case MarketRegime::VOLATILE:
            return {0.4, 0.6, 0.95, 1.1, "Volatility management"};
        case MarketRegime::SIDEWAYS:
            return {0.6, 0.4, 1.0, 1.0, "Balanced range trading"};
    }
    return {0.6, 0.4, 1.0, 1.0, "Balanced range trading"};
}

HybridStrategyEngine::HybridStrategyEngine(size_t momentum_lookback, size_t mean_reversion_lookback)
    : momentum_lookback_(std::max<size_t>(2, momentum_lookback))
    , mean_reversion_lookback_(std::max<size_t>(2, mean_reversion_lookback)) {}

double HybridStrategyEngine::calculateMomentumSignal(const std::vector<double>& prices) const {
    if (prices.size() < momentum_lookback_) {
        return 0.0;
    }
    const double past = prices[prices.size() - momentum_lookback_];
    if (past <= 0.0) {
        return 0.0;
    }
    const double price_momentum = prices.back() / past - 1.0;
    const double consistency =
        TechnicalIndicators::directionalConsistency(TechnicalIndicators::tail(prices, momentum_lookback_));

    return std::clamp(price_momentum * consistency * 5.0, -1.0, 1.0);
}

double HybridStrategyEngine::calculateMeanReversionSignal(const std::vector<double>& prices) const {
    if (prices.size() < mean_reversion_lookback_) {
        return 0.0;
    }
    const auto window = TechnicalIndicators::tail(prices, mean_reversion_lookback_);
    const double ma = TechnicalIndicators::calculateMean(window);
    const double std_dev = TechnicalIndicators::calculateStandardDeviation(window, ma);
    const double z_score = (prices.back() - ma) / (std_dev + 1e-8);

    return std::clamp(-z_score * 0.5, -1.0, 1.0);
}

HybridSignal HybridStrategyEngine::getHybridSignal(const std::vector<double>& prices, MarketRegime regime) const {
    HybridSignal signal;
    const auto params = regimeParameters(regime);

    signal.momentum_component = calculateMomentumSignal(prices);
    signal.mean_reversion_component = calculateMeanReversionSignal(prices);
    signal.momentum_weight = params.momentum_weight;
    signal.mean_reversion_weight = params.mean_reversion_weight;
    signal.hybrid_signal = signal.momentum_component * signal.momentum_weight +
                           signal.mean_reversion_component * signal.mean_reversion_weight;
    return signal;
}

double HybridStrategyEngine::calculatePositionAdjustment(double hybrid_signal, double base_allocation) const {
    const double strength = std::abs(hybrid_signal);
    const double direction = (hybrid_signal > 0.0) ? 1.0 : -1.0;

    const double confidence = std::min(strength * 2.0, 1.0);
    const double max_adjustment = 0.20 * confidence;
    const double adjustment = direction * strength * max_adjustment;
    const double adjusted = base_allocation * (1.0 + adjustment);

    // 15% band for weak signals, 25% for full confidence
    const double tolerance = 0.15 + confidence * 0.10;
    const double lower = base_allocation * (1.0 - tolerance);
    const double upper = base_allocation * (1.0 + tolerance);

    return std::clamp(adjusted, lower, upper);
}

Allocation HybridStrategyEngine::applyToAllocations(const Allocation& base,
                                                    const analytics::PriceHistoryStore& history,
                                                    MarketRegime regime,
                                                    const std::string& reserve_asset,
                                                    double min_allocation,
                                                    double max_allocation) const {
    const auto params = regimeParameters(regime);
    Allocation enhanced;

    for (const auto& [symbol, base_weight] : base) {
        const auto& prices = history.prices(symbol);
        if (symbol == reserve_asset || prices.size() < mean_reversion_lookback_) {
            enhanced[symbol] = base_weight;
            continue;
        }
        const auto signal = getHybridSignal(prices, regime);
        double weight = calculatePositionAdjustment(signal.hybrid_signal, base_weight);
        weight *= params.risk_multiplier;
        enhanced[symbol] = std::clamp(weight, min_allocation, max_allocation);
    }

    const double total = allocationTotal(enhanced);
    if (total <= 0.0 || !std::isfinite(total)) {
        return base;
    }
    for (auto& [symbol, weight] : enhanced) {
        weight /= total;
    }
    return enhanced;
}

} // namespace strategy
} // namespace rebalsim
