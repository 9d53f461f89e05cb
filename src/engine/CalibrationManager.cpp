#include "engine/CalibrationManager.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rebalsim {
namespace engine {

namespace {
std::string jsonString(const nlohmann::json& object, const char* key, const std::string& fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::ostringstream oss;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            oss << "; ";
        }
        oss << errors[i];
    }
    return oss.str();
}
}

CalibrationManager::CalibrationManager(std::shared_ptr<core::ICalibrationProfileStore> store)
    : store_(std::move(store)) {}

bool CalibrationManager::isDisabledName(const std::string& name) {
    return name.empty() || name == "none";
}

std::vector<ProfileSummary> CalibrationManager::availableProfiles() const {
    std::vector<ProfileSummary> out;
    if (!store_) {
        return out;
    }

    for (const auto& name : store_->listProfiles()) {
        const auto profile = store_->loadProfile(name);
        if (!profile) {
            LOG_WARN("Could not load calibration profile {}", name);
            continue;
        }
        if (profile->status == "insufficient_data") {
            continue;
        }

        ProfileSummary summary;
        summary.name = profile->profile_name;
        summary.description = profile->description.empty() ? "Custom calibration profile" : profile->description;
        summary.expected_return = jsonString(profile->expected_performance, "monthly_return_range", "Unknown");
        summary.risk_level = jsonString(profile->expected_performance, "risk_level", "medium");
        summary.market_regime = jsonString(profile->market_conditions, "market_regime", "unknown");
        summary.created_date = profile->created_date;
        summary.profile_type = profile->profile_type;
        out.push_back(std::move(summary));
    }

    std::sort(out.begin(), out.end(), [](const ProfileSummary& a, const ProfileSummary& b) {
        return a.name < b.name;
    });
    return out;
}

std::optional<core::CalibrationProfile> CalibrationManager::loadProfile(const std::string& name) const {
    if (isDisabledName(name) || !store_) {
        return std::nullopt;
    }
    auto profile = store_->loadProfile(name);
    if (!profile) {
        LOG_WARN("Calibration profile not found: {}", name);
    }
    return profile;
}

std::vector<std::string> CalibrationManager::validateParameters(const core::CalibrationParameters& params) {
    std::vector<std::string> errors;
    const double values[] = {params.market_timing_efficiency, params.daily_slippage, params.trading_fee,
                             params.volatility_drag, params.max_daily_return, params.min_daily_return};
    for (double value : values) {
        if (!std::isfinite(value)) {
            errors.push_back("calibration parameters must be finite");
            return errors;
        }
    }
    if (params.min_daily_return > params.max_daily_return) {
        errors.push_back("min_daily_return exceeds max_daily_return");
    }
    if (params.market_timing_efficiency < 0.0) {
        errors.push_back("market_timing_efficiency must not be negative");
    }
    if (params.min_daily_return < -1.0) {
        errors.push_back("min_daily_return must not be below -100%");
    }
    return errors;
}

double CalibrationManager::cappedReturn(double raw_return, const core::CalibrationParameters& params) {
    const double timed = (raw_return > 0.0) ? raw_return * params.market_timing_efficiency : raw_return;
    return std::clamp(timed, params.min_daily_return, params.max_daily_return);
}

CalibrationOutcome CalibrationManager::applyProfile(const std::vector<backtest::SimulationCycleRecord>& cycles,
                                                    const std::string& profile_name,
                                                    double starting_capital) const {
    CalibrationOutcome outcome;
    outcome.info.profile_name = profile_name;

    if (isDisabledName(profile_name)) {
        outcome.cycles = cycles;
        return outcome;
    }

    const auto profile = loadProfile(profile_name);
    if (!profile) {
        outcome.cycles = cycles;
        outcome.info.error = "Profile not found";
        return outcome;
    }

    return applyParameters(cycles, profile->parameters, profile_name, starting_capital);
}

CalibrationOutcome CalibrationManager::applyParameters(const std::vector<backtest::SimulationCycleRecord>& cycles,
                                                       const core::CalibrationParameters& params,
                                                       const std::string& profile_name,
                                                       double starting_capital) const {
    CalibrationOutcome outcome;
    outcome.info.profile_name = profile_name;
    outcome.info.parameters_used = params;

    const auto errors = validateParameters(params);
    if (!errors.empty() || starting_capital <= 0.0) {
        outcome.cycles = cycles;
        outcome.info.error = errors.empty() ? "starting capital must be positive" : joinErrors(errors);
        LOG_WARN("Calibration profile {} not applied: {}", profile_name, outcome.info.error);
        return outcome;
    }

    outcome.cycles.reserve(cycles.size());
    double capital = starting_capital;
    double previous_raw_value = starting_capital;
    double total_costs = 0.0;

    for (const auto& raw : cycles) {
        const double raw_return = (previous_raw_value > 0.0) ? raw.total_value / previous_raw_value - 1.0 : 0.0;
        previous_raw_value = raw.total_value;

        const double capped = cappedReturn(raw_return, params);
        const double after_costs = capped - params.daily_slippage - params.volatility_drag - params.trading_fee * 2.0;
        const double cost = capital * params.trading_fee * 2.0;
        const double new_capital = std::max(0.0, capital * (1.0 + after_costs));
        total_costs += cost;

        const double reserve_share = (raw.total_value > 0.0) ? raw.reserve_value / raw.total_value
                                                             : (raw.protection_active ? 1.0 : 0.0);

        backtest::SimulationCycleRecord record = raw;
        record.starting_capital = capital;
        record.ending_capital = new_capital;
        record.total_value = new_capital;
        record.reserve_value = new_capital * reserve_share;
        record.portfolio_value = new_capital - record.reserve_value;
        record.cycle_return = (capital > 0.0) ? new_capital / capital - 1.0 : 0.0;
        record.total_return_pct = (new_capital / starting_capital - 1.0) * 100.0;
        record.trading_costs = cost;
        record.calibration_applied = true;
        record.calibration_profile = profile_name;
        record.raw_return = raw_return;
        record.capped_return = capped;
        outcome.cycles.push_back(std::move(record));

        capital = new_capital;
    }

    const double original_final = cycles.empty() ? starting_capital : cycles.back().total_value;
    outcome.info.profile_applied = true;
    outcome.info.original_return = (original_final / starting_capital - 1.0) * 100.0;
    outcome.info.calibrated_return = (capital / starting_capital - 1.0) * 100.0;
    outcome.info.adjustment = outcome.info.calibrated_return - outcome.info.original_return;
    outcome.info.total_trading_costs = total_costs;

    LOG_INFO("Calibration {} applied: {:.2f}% -> {:.2f}% ({} cycles)",
             profile_name, outcome.info.original_return, outcome.info.calibrated_return, outcome.cycles.size());
    return outcome;
}

CompatibilityReport CalibrationManager::validateCompatibility(const std::string& profile_name,
                                                              int duration_days,
                                                              double starting_capital) const {
    CompatibilityReport report;
    if (isDisabledName(profile_name)) {
        return report;
    }

    const auto profile = loadProfile(profile_name);
    if (!profile) {
        report.compatible = false;
        report.warnings.push_back("Profile not found");
        return report;
    }

    if (duration_days > 60) {
        report.warnings.push_back("Profile optimized for shorter durations (30 days)");
    }

    double min_capital = 50.0;
    if (profile->metadata.is_object()) {
        auto it = profile->metadata.find("minimum_capital");
        if (it != profile->metadata.end() && it->is_number()) {
            min_capital = it->get<double>();
        }
    }
    if (starting_capital < min_capital) {
        std::ostringstream oss;
        oss << "Recommended minimum capital: $" << min_capital;
        report.warnings.push_back(oss.str());
    }

    report.profile_market = jsonString(profile->market_conditions, "market_regime", "unknown");
    if (report.profile_market == "bear_market") {
        report.warnings.push_back("Profile optimized for bear market conditions");
    } else if (report.profile_market == "bull_market") {
        report.warnings.push_back("Profile optimized for bull market conditions");
    }
    report.expected_return = jsonString(profile->expected_performance, "monthly_return_range", "Unknown");
    return report;
}

} // namespace engine
} // namespace rebalsim
