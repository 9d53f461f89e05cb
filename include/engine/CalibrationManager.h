#pragma once

#include "backtest/SimulationTypes.h"
#include "core/contracts/ICalibrationProfileStore.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rebalsim {
namespace engine {

struct ProfileSummary {
    std::string name;
    std::string description;
    std::string expected_return;     // expected_performance.monthly_return_range
    std::string risk_level;
    std::string market_regime;
    std::string created_date;
    std::string profile_type;
};

struct CalibrationOutcome {
    std::vector<backtest::SimulationCycleRecord> cycles;
    backtest::CalibrationInfo info;
};

struct CompatibilityReport {
    bool compatible = true;
    std::vector<std::string> warnings;
    std::string profile_market = "unknown";
    std::string expected_return = "Unknown";
};

// Rewrites a raw cycle sequence through a named profile:
//   timed  = raw * timing_efficiency   (gains only)
//   capped = clamp(timed, min_daily_return, max_daily_return)
//   net    = capped - slippage - volatility_drag - 2 * trading_fee
// Always produces a new sequence; the input is never modified. Constructed
// per run with an injected profile store.
class CalibrationManager {
public:
    explicit CalibrationManager(std::shared_ptr<core::ICalibrationProfileStore> store);

    // "none" or empty disables calibration
    static bool isDisabledName(const std::string& name);

    std::vector<ProfileSummary> availableProfiles() const;
    std::optional<core::CalibrationProfile> loadProfile(const std::string& name) const;

    CalibrationOutcome applyProfile(const std::vector<backtest::SimulationCycleRecord>& cycles,
                                    const std::string& profile_name,
                                    double starting_capital) const;

    CalibrationOutcome applyParameters(const std::vector<backtest::SimulationCycleRecord>& cycles,
                                       const core::CalibrationParameters& params,
                                       const std::string& profile_name,
                                       double starting_capital) const;

    CompatibilityReport validateCompatibility(const std::string& profile_name,
                                              int duration_days,
                                              double starting_capital) const;

    // Empty when the parameters can be applied
    static std::vector<std::string> validateParameters(const core::CalibrationParameters& params);

    // capped return for one raw return (before costs)
    static double cappedReturn(double raw_return, const core::CalibrationParameters& params);

private:
    std::shared_ptr<core::ICalibrationProfileStore> store_;
};

} // namespace engine
} // namespace rebalsim
