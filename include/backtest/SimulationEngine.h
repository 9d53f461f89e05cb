#pragma once

#include "analytics/PriceHistoryStore.h"
#include "backtest/SimulationTypes.h"
#include "backtest/SyntheticReturnModel.h"
#include "common/RandomSource.h"
#include "core/contracts/IPriceHistoryProvider.h"
#include "core/contracts/ISimulationRecorder.h"
#include "engine/CalibrationManager.h"
#include "engine/EngineConfig.h"
#include "strategy/RebalanceStrategy.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace rebalsim {
namespace backtest {

// Steps one simulation run cycle by cycle:
//   decide (history up to the previous close) -> realize returns -> costs
//   -> record -> append the cycle's closes
// then optionally passes the cycle sequence through the calibration manager.
// Every run() builds its own price history, strategy and protection state.
class SimulationEngine {
public:
    SimulationEngine(engine::SimulationConfig config,
                     strategy::RebalanceStrategyConfig strategy_config,
                     std::shared_ptr<core::IPriceHistoryProvider> provider,
                     std::shared_ptr<engine::CalibrationManager> calibration,
                     std::shared_ptr<IRandomSource> random = nullptr,
                     std::shared_ptr<core::ISimulationRecorder> recorder = nullptr);

    SimulationResult run();

    // Number of cycles run() will attempt for a valid configuration
    static int plannedCycles(const engine::SimulationConfig& config);

    const engine::SimulationConfig& config() const { return config_; }

private:
    struct CycleMarket {
        std::map<std::string, double> returns;   // realized return per symbol
        std::map<std::string, double> closes;    // close to append after the cycle
        std::set<std::string> real_symbols;
    };

    void loadWarmupHistory(long long start_ms);
    CycleMarket realizeMarket(long long cycle_ms, analytics::MarketRegime regime,
                              const std::vector<std::string>& symbols);
    bool fetchRealReturn(const std::string& symbol, long long cycle_ms, double& ret, double& close);
    void appendCloses(const CycleMarket& market);

    SimulationSummary summarize(const SimulationResult& result) const;
    void applyCalibration(SimulationResult& result) const;

    engine::SimulationConfig config_;
    strategy::RebalanceStrategyConfig strategy_config_;
    std::shared_ptr<core::IPriceHistoryProvider> provider_;
    std::shared_ptr<engine::CalibrationManager> calibration_;
    std::shared_ptr<IRandomSource> random_;
    std::shared_ptr<core::ISimulationRecorder> recorder_;

    // per-run state, reset by run()
    std::unique_ptr<analytics::PriceHistoryStore> history_;
    std::unique_ptr<SyntheticReturnModel> synthetic_;
    std::unique_ptr<strategy::RebalanceStrategy> strategy_;
    std::map<std::string, long long> last_seen_ts_;
    std::set<std::string> warned_symbols_;
};

} // namespace backtest
} // namespace rebalsim
