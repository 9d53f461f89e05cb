#pragma once

#include "analytics/CoinSelector.h"
#include "analytics/RegimeDetector.h"
#include "common/RandomSource.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "strategy/HybridStrategyEngine.h"

#include <memory>
#include <string>
#include <vector>

namespace rebalsim {
namespace backtest {

// Fallback daily return generator used when no usable real price is available.
//   base      = normal(mean, stddev) * draw_mult + trend * trend_mult
//   return    = base * regime_multiplier * momentum_adjustment
class SyntheticReturnModel {
public:
    SyntheticReturnModel(engine::SyntheticReturnConfig config, std::shared_ptr<IRandomSource> random);

    double baseReturn(const std::string& symbol);

    double assetReturn(const std::string& symbol,
                       analytics::MarketRegime regime,
                       const std::vector<double>& prices);

    // 1 + combined * magnitude (magnitude <= 12%) when both the hybrid signal
    // and the momentum score are strong; 1 otherwise or with < 10 prices
    double momentumAdjustment(const std::vector<double>& prices, analytics::MarketRegime regime) const;

    const engine::ReturnPattern& patternFor(const std::string& symbol) const;

    static double drawMultiplier(engine::VolatilityMode mode);
    static double trendMultiplier(engine::VolatilityMode mode);

private:
    engine::SyntheticReturnConfig config_;
    std::shared_ptr<IRandomSource> random_;
    analytics::CoinSelector selector_;
    strategy::HybridStrategyEngine hybrid_engine_;
};

} // namespace backtest
} // namespace rebalsim
