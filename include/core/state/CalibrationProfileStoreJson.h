#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/ICalibrationProfileStore.h"

namespace rebalsim {
namespace core {

// One JSON file per profile: <directory>/<profile_name>.json
class CalibrationProfileStoreJson : public ICalibrationProfileStore {
public:
    explicit CalibrationProfileStoreJson(std::filesystem::path directory);

    std::optional<CalibrationProfile> loadProfile(const std::string& name) override;
    std::vector<std::string> listProfiles() override;
    bool saveProfile(const CalibrationProfile& profile) override;

    static nlohmann::json toJson(const CalibrationProfile& profile);
    static CalibrationProfile fromJson(const nlohmann::json& raw, const std::string& fallback_name);

private:
    std::filesystem::path pathFor(const std::string& name) const;

    std::filesystem::path directory_;
};

} // namespace core
} // namespace rebalsim
