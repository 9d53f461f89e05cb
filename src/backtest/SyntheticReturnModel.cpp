#include "backtest/SyntheticReturnModel.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rebalsim {
namespace backtest {

namespace {
constexpr size_t kMomentumMinHistory = 10;
}

SyntheticReturnModel::SyntheticReturnModel(engine::SyntheticReturnConfig config,
                                           std::shared_ptr<IRandomSource> random)
    : config_(std::move(config))
    , random_(std::move(random)) {
    if (!random_) {
        throw std::invalid_argument("SyntheticReturnModel requires a random source");
    }
}

double SyntheticReturnModel::drawMultiplier(engine::VolatilityMode mode) {
    switch (mode) {
        case engine::VolatilityMode::LOW: return 1.0;
        case engine::VolatilityMode::AVERAGE: return 1.3;
        case engine::VolatilityMode::HIGH: return 1.6;
    }
    return 1.0;
}

double SyntheticReturnModel::trendMultiplier(engine::VolatilityMode mode) {
    switch (mode) {
        case engine::VolatilityMode::LOW: return 1.0;
        case engine::VolatilityMode::AVERAGE: return 1.2;
        case engine::VolatilityMode::HIGH: return 1.5;
    }
    return 1.0;
}

const engine::ReturnPattern& SyntheticReturnModel::patternFor(const std::string& symbol) const {
    auto it = config_.patterns.find(symbol);
    return (it != config_.patterns.end()) ? it->second : config_.fallback;
}

double SyntheticReturnModel::baseReturn(const std::string& symbol) {
    const auto& pattern = patternFor(symbol);
    const double draw = random_->normal(pattern.mean, pattern.stddev);
    return draw * drawMultiplier(config_.mode) + pattern.trend * trendMultiplier(config_.mode);
}

double SyntheticReturnModel::momentumAdjustment(const std::vector<double>& prices,
                                                analytics::MarketRegime regime) const {
    if (prices.size() < kMomentumMinHistory) {
        return 1.0;
    }

    const double hybrid_signal = hybrid_engine_.getHybridSignal(prices, regime).hybrid_signal;
    const double momentum_score = selector_.calculateMomentumScore(prices);

    const double signal_confidence = std::abs(hybrid_signal);
    const double momentum_confidence = std::min(1.0, std::abs(momentum_score) / 0.1);
    if (signal_confidence <= 0.3 || momentum_confidence <= 0.5) {
        return 1.0;
    }

    const double combined = std::clamp(hybrid_signal * 0.6 + momentum_score * 0.4, -1.0, 1.0);
    const double magnitude = std::min(0.12, signal_confidence * momentum_confidence * 0.15);
    return 1.0 + combined * magnitude;
}

double SyntheticReturnModel::assetReturn(const std::string& symbol,
                                         analytics::MarketRegime regime,
                                         const std::vector<double>& prices) {
    const double base = baseReturn(symbol);
    const double regime_multiplier = strategy::regimeParameters(regime).return_multiplier;
    const double value = base * regime_multiplier * momentumAdjustment(prices, regime);
    // a close can not go below zero
    return std::max(-0.99, value);
}

} // namespace backtest
} // namespace rebalsim
