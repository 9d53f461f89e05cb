#include "core/state/CalibrationProfileStoreJson.h"
#include "backtest/SimulationSchema.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace rebalsim {
namespace core {

CalibrationProfileStoreJson::CalibrationProfileStoreJson(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path CalibrationProfileStoreJson::pathFor(const std::string& name) const {
    return directory_ / (name + ".json");
}

nlohmann::json CalibrationProfileStoreJson::toJson(const CalibrationProfile& profile) {
    nlohmann::json raw;
    raw["profile_name"] = profile.profile_name;
    raw["version"] = profile.version;
    raw["description"] = profile.description;
    raw["profile_type"] = profile.profile_type;
    raw["status"] = profile.status;
    raw["created_date"] = profile.created_date;
    raw["calibration_parameters"] = backtest::toJson(profile.parameters);
    raw["expected_performance"] = profile.expected_performance;
    raw["market_conditions"] = profile.market_conditions;
    raw["metadata"] = profile.metadata;
    return raw;
}

CalibrationProfile CalibrationProfileStoreJson::fromJson(const nlohmann::json& raw, const std::string& fallback_name) {
    CalibrationProfile profile;
    profile.profile_name = raw.value("profile_name", fallback_name);
    profile.version = raw.value("version", profile.version);
    profile.description = raw.value("description", std::string());
    profile.profile_type = raw.value("profile_type", profile.profile_type);
    profile.status = raw.value("status", profile.status);
    profile.created_date = raw.value("created_date", std::string());
    profile.parameters = backtest::calibrationParametersFromJson(
        raw.value("calibration_parameters", nlohmann::json::object()));
    profile.expected_performance = raw.value("expected_performance", nlohmann::json::object());
    profile.market_conditions = raw.value("market_conditions", nlohmann::json::object());
    profile.metadata = raw.value("metadata", nlohmann::json::object());
    return profile;
}

std::optional<CalibrationProfile> CalibrationProfileStoreJson::loadProfile(const std::string& name) {
    const auto path = pathFor(name);
    if (name.empty() || !std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        if (!raw.is_object()) {
            LOG_WARN("Calibration profile {} is not a JSON object", path.string());
            return std::nullopt;
        }
        return fromJson(raw, name);
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Failed to parse calibration profile {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::vector<std::string> CalibrationProfileStoreJson::listProfiles() {
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return names;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool CalibrationProfileStoreJson::saveProfile(const CalibrationProfile& profile) {
    if (profile.profile_name.empty()) {
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return false;
    }

    const auto file_path = pathFor(profile.profile_name);
    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << toJson(profile).dump(2);
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (!ec) {
        return true;
    }

    // rename over an existing file can fail on some filesystems
    ec.clear();
    std::filesystem::copy_file(tmp_path, file_path, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace rebalsim
