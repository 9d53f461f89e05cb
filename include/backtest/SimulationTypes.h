#pragma once

#include "analytics/RegimeDetector.h"
#include "common/Types.h"
#include "core/contracts/ICalibrationProfileStore.h"

#include <string>
#include <vector>

namespace rebalsim {
namespace backtest {

// Where a cycle's realized return came from
enum class DataSource {
    REAL,
    SYNTHETIC,
    MIXED,      // some assets real, some synthetic
    RESERVE     // fully protected, no market exposure
};

struct SimulationCycleRecord {
    int cycle_number = 0;                 // 1-based
    Timestamp cycle_date{};

    double starting_capital = 0.0;
    double ending_capital = 0.0;
    double portfolio_value = 0.0;
    double reserve_value = 0.0;
    double total_value = 0.0;             // portfolio_value + reserve_value
    double cycle_return = 0.0;            // ending/starting - 1
    double total_return_pct = 0.0;        // vs run starting capital, in %

    Allocation allocation_breakdown;
    double trading_costs = 0.0;
    double execution_delay = 0.0;
    int failed_orders = 0;
    std::vector<std::string> actions_taken;

    analytics::MarketRegime market_regime = analytics::MarketRegime::SIDEWAYS;
    bool protection_active = false;
    std::vector<std::string> selected_coins;
    DataSource data_source = DataSource::SYNTHETIC;

    bool calibration_applied = false;
    std::string calibration_profile;
    double raw_return = 0.0;              // cycle_return before calibration
    double capped_return = 0.0;           // after timing + bounds, before costs
};

struct CalibrationInfo {
    bool profile_applied = false;
    std::string profile_name;
    std::string error;
    double original_return = 0.0;         // %
    double calibrated_return = 0.0;       // %
    double adjustment = 0.0;              // calibrated - original, percentage points
    double total_trading_costs = 0.0;
    core::CalibrationParameters parameters_used;
    std::vector<std::string> warnings;
};

struct SimulationSummary {
    double starting_capital = 0.0;
    double final_capital = 0.0;
    double total_return = 0.0;            // %
    double total_trading_costs = 0.0;
    int protection_cycles = 0;
    int protection_entries = 0;
    int protection_exits = 0;
    int failed_orders = 0;
    double average_execution_delay = 0.0;
    int real_data_cycles = 0;
    int synthetic_data_cycles = 0;
    bool calibration_applied = false;
    std::string calibration_profile;
};

struct SimulationResult {
    bool success = false;
    std::string failure_reason;
    std::string run_name;

    std::vector<SimulationCycleRecord> cycles;
    int total_cycles = 0;
    SimulationSummary final_summary;
    CalibrationInfo calibration_info;

    std::vector<analytics::MarketRegime> regime_history;
    std::vector<std::string> final_coin_selection;
};

} // namespace backtest
} // namespace rebalsim
