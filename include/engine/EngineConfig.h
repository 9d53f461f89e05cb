#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rebalsim {
namespace engine {

// Which slice of the market the synthetic fallback imitates
enum class VolatilityMode {
    LOW,
    AVERAGE,
    HIGH
};

const char* toString(VolatilityMode mode);
std::optional<VolatilityMode> volatilityModeFromString(const std::string& value);

// Daily return distribution of one asset for the synthetic fallback
struct ReturnPattern {
    double mean = 0.0;
    double stddev = 0.04;
    double trend = 0.0;     // added to every draw
};

struct SyntheticReturnConfig {
    VolatilityMode mode = VolatilityMode::AVERAGE;
    std::map<std::string, ReturnPattern> patterns{
        {"BTC", {0.0005, 0.030, 0.0}},
        {"ETH", {0.0005, 0.040, 0.0}},
        {"BNB", {0.0005, 0.035, 0.0}},
    };
    ReturnPattern fallback{0.0, 0.050, 0.0};
};

// One simulation run
struct SimulationConfig {
    std::string run_name = "daily_rebalance";
    std::string start_date = "2024-01-01";   // YYYY-MM-DD, UTC
    int duration_days = 30;
    int cycle_length_minutes = 1440;
    double starting_capital = 100.0;
    int max_cycles = 50000;                 // safety bound

    std::string price_interval = "1d";
    size_t history_length = 30;
    bool use_warmup_history = true;

    double reserve_ratio = 0.05;            // reserve share of a normal cycle's total value
    double reserve_daily_yield = 0.0001;    // earned by capital parked in the reserve asset

    std::uint64_t random_seed = 42;
    SyntheticReturnConfig synthetic;

    bool enable_calibration = false;
    std::string calibration_profile;        // empty or "none" disables

    // Empty when the configuration can run
    std::vector<std::string> validate() const;
};

} // namespace engine
} // namespace rebalsim
