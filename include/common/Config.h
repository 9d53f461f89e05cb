#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace rebalsim {

struct CalibrationSettings {
    bool enabled = false;
    std::string profiles_dir = "config/calibration_profiles";
    std::string profile = "none";
};

struct PathSettings {
    std::string price_data_dir = "data/prices";
    std::string result_path = "output/simulation_result.json";
    std::string journal_path = "output/cycles.jsonl";
    std::string log_dir = "logs";
};

// Typed view of config.json plus environment overrides. Constructed by the
// caller and handed to each run by value.
class Config {
public:
    Config() = default;

    // Missing or malformed file: reported on stderr, defaults kept, returns false.
    // Environment overrides are applied either way.
    bool load(const std::string& config_path);

    // Same as load() without a file
    bool loadFromJson(const nlohmann::json& j);

    void applyEnvironmentOverrides();

    const engine::SimulationConfig& getSimulationConfig() const { return simulation_; }
    const strategy::RebalanceStrategyConfig& getStrategyConfig() const { return strategy_; }
    const CalibrationSettings& getCalibrationSettings() const { return calibration_; }
    const PathSettings& getPaths() const { return paths_; }
    std::string getLogLevel() const { return log_level_; }

    engine::SimulationConfig& mutableSimulationConfig() { return simulation_; }
    void setCalibrationProfile(const std::string& name);
    void setCalibrationEnabled(bool enabled);

private:
    void parseSimulation(const nlohmann::json& s);
    void parseStrategy(const nlohmann::json& s);
    void parseProtection(const nlohmann::json& p);
    void parseRegime(const nlohmann::json& r);

    engine::SimulationConfig simulation_;
    strategy::RebalanceStrategyConfig strategy_;
    CalibrationSettings calibration_;
    PathSettings paths_;
    std::string log_level_ = "info";
};

} // namespace rebalsim
