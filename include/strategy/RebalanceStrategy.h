#pragma once

#include "analytics/CoinSelector.h"
#include "analytics/PriceHistoryStore.h"
#include "analytics/RegimeDetector.h"
#include "common/RandomSource.h"
#include "common/Types.h"
#include "strategy/CapitalProtection.h"
#include "strategy/HybridStrategyEngine.h"
#include "strategy/StrategyConfig.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rebalsim {
namespace strategy {

struct RebalanceResult {
    bool success = false;
    std::string reason;                  // set when success == false

    Allocation allocations;              // sums to 1, or {reserve: 1.0}
    double trading_costs = 0.0;
    analytics::MarketRegime market_regime = analytics::MarketRegime::SIDEWAYS;
    analytics::RegimeAnalysis regime_analysis;

    bool protection_active = false;
    ProtectionTransition protection_transition = ProtectionTransition::NONE;
    std::vector<std::string> protection_signals;

    double execution_delay = 0.0;        // seconds, metadata only
    int failed_orders = 0;

    std::vector<std::string> selected_coins;
    std::vector<std::string> actions_taken;
};

struct StrategySummary {
    int executions = 0;
    int successful_executions = 0;
    int failed_executions = 0;
    int protected_cycles = 0;
    int protection_entries = 0;
    int protection_exits = 0;
    int selection_changes = 0;
    bool protection_active = false;
    double sentiment = 0.0;
    std::vector<std::string> current_selection;
};

// Once-per-cycle allocation decision: protection check, periodic coin
// selection, regime detection, momentum base weights and hybrid sizing.
// Holds the protection state and the current selection for one run.
class RebalanceStrategy {
public:
    RebalanceStrategy(RebalanceStrategyConfig config, std::shared_ptr<IRandomSource> random);

    // `history` must only contain closes up to the previous cycle.
    RebalanceResult execute(int cycle_index, Timestamp date, double capital,
                            const analytics::PriceHistoryStore& history);

    // Momentum-weighted base allocation over `symbols`, clamped and renormalized
    Allocation calculateBaseAllocation(const std::vector<std::string>& symbols,
                                       const analytics::PriceHistoryStore& history) const;

    StrategySummary summary() const;
    const std::vector<std::string>& selectedCoins() const { return selected_coins_; }
    const CapitalProtection& protection() const { return protection_; }
    const RebalanceStrategyConfig& config() const { return config_; }

private:
    bool updateSelection(int cycle_index, const analytics::PriceHistoryStore& history);
    ProtectionObservation observe(double capital, const analytics::PriceHistoryStore& history) const;
    void applyExecutionModel(RebalanceResult& result);

    static void normalize(Allocation& allocation);

    RebalanceStrategyConfig config_;
    std::shared_ptr<IRandomSource> random_;

    analytics::CoinSelector selector_;
    analytics::RegimeDetector regime_detector_;
    HybridStrategyEngine hybrid_engine_;
    CapitalProtection protection_;

    std::vector<std::string> selected_coins_;

    int executions_ = 0;
    int successful_executions_ = 0;
    int failed_executions_ = 0;
    int selection_changes_ = 0;
};

} // namespace strategy
} // namespace rebalsim
