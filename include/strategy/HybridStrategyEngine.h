#pragma once

#include "analytics/PriceHistoryStore.h"
#include "analytics/RegimeDetector.h"
#include "common/Types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace rebalsim {
namespace strategy {

struct RegimeParameters {
    double momentum_weight;
    double mean_reversion_weight;
    double risk_multiplier;      // applied to hybrid-adjusted weights
    double return_multiplier;    // applied to synthetic returns
    const char* description;
};

RegimeParameters regimeParameters(analytics::MarketRegime regime);

struct HybridSignal {
    double hybrid_signal = 0.0;              // [-1, 1]
    double momentum_component = 0.0;
    double mean_reversion_component = 0.0;
    double momentum_weight = 0.0;
    double mean_reversion_weight = 0.0;
};

// Blends a momentum signal with a mean-reversion signal, weighted by regime,
// and turns the blend into a bounded position-size adjustment.
class HybridStrategyEngine {
public:
    explicit HybridStrategyEngine(size_t momentum_lookback = 7, size_t mean_reversion_lookback = 14);

    // (p[-1]/p[-lookback]-1) * directional consistency, x5, clamped to [-1,1]
    double calculateMomentumSignal(const std::vector<double>& prices) const;

    // -0.5 * z-score of the latest price vs the 14-point mean, clamped to [-1,1]
    double calculateMeanReversionSignal(const std::vector<double>& prices) const;

    HybridSignal getHybridSignal(const std::vector<double>& prices, analytics::MarketRegime regime) const;

    // Scales base by up to +/-20% (times confidence), bounded to base*(1 +/- (15%..25%))
    double calculatePositionAdjustment(double hybrid_signal, double base_allocation) const;

    // Hybrid-adjusted weights for every asset with enough history, renormalized to 1
    Allocation applyToAllocations(const Allocation& base,
                                  const analytics::PriceHistoryStore& history,
                                  analytics::MarketRegime regime,
                                  const std::string& reserve_asset,
                                  double min_allocation,
                                  double max_allocation) const;

    size_t momentumLookback() const { return momentum_lookback_; }
    size_t meanReversionLookback() const { return mean_reversion_lookback_; }

private:
    size_t momentum_lookback_;
    size_t mean_reversion_lookback_;
};

} // namespace strategy
} // namespace rebalsim
