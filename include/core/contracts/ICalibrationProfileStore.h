#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rebalsim {
namespace core {

struct CalibrationParameters {
    double market_timing_efficiency = 1.0;
    double daily_slippage = 0.0;
    double trading_fee = 0.0;
    double volatility_drag = 0.0;
    double max_daily_return = 1.0;
    double min_daily_return = -1.0;
};

struct CalibrationProfile {
    std::string profile_name;
    std::string version = "1.0";
    std::string description;
    std::string profile_type = "manual";
    std::string status = "active";
    std::string created_date;
    CalibrationParameters parameters;
    nlohmann::json expected_performance = nlohmann::json::object();
    nlohmann::json market_conditions = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
};

class ICalibrationProfileStore {
public:
    virtual ~ICalibrationProfileStore() = default;

    virtual std::optional<CalibrationProfile> loadProfile(const std::string& name) = 0;
    virtual std::vector<std::string> listProfiles() = 0;
    virtual bool saveProfile(const CalibrationProfile& profile) = 0;
};

} // namespace core
} // namespace rebalsim
