#include "engine/EngineConfig.h"
#include "common/TimeUtils.h"

#include <cmath>

namespace rebalsim {
namespace engine {

const char* toString(VolatilityMode mode) {
    switch (mode) {
        case VolatilityMode::LOW: return "low_volatility";
        case VolatilityMode::AVERAGE: return "average_volatility";
        case VolatilityMode::HIGH: return "high_volatility";
    }
    return "average_volatility";
}

std::optional<VolatilityMode> volatilityModeFromString(const std::string& value) {
    if (value == "low_volatility" || value == "low") return VolatilityMode::LOW;
    if (value == "average_volatility" || value == "average") return VolatilityMode::AVERAGE;
    if (value == "high_volatility" || value == "high") return VolatilityMode::HIGH;
    return std::nullopt;
}

std::vector<std::string> SimulationConfig::validate() const {
    std::vector<std::string> errors;

    if (!utils::parseDate(start_date)) {
        errors.push_back("start_date must be YYYY-MM-DD, got '" + start_date + "'");
    }
    if (duration_days <= 0) {
        errors.push_back("duration_days must be positive");
    }
    if (cycle_length_minutes <= 0) {
        errors.push_back("cycle_length_minutes must be positive");
    }
    if (!std::isfinite(starting_capital) || starting_capital <= 0.0) {
        errors.push_back("starting_capital must be positive");
    }
    if (max_cycles <= 0) {
        errors.push_back("max_cycles must be positive");
    }
    if (history_length < 2) {
        errors.push_back("history_length must be at least 2");
    }
    if (reserve_ratio < 0.0 || reserve_ratio > 1.0) {
        errors.push_back("reserve_ratio must be within [0, 1]");
    }
    if (!std::isfinite(reserve_daily_yield)) {
        errors.push_back("reserve_daily_yield must be finite");
    }
    if (synthetic.fallback.stddev < 0.0) {
        errors.push_back("synthetic fallback stddev must not be negative");
    }
    for (const auto& [symbol, pattern] : synthetic.patterns) {
        if (pattern.stddev < 0.0) {
            errors.push_back("synthetic stddev for " + symbol + " must not be negative");
        }
    }

    return errors;
}

} // namespace engine
} // namespace rebalsim
