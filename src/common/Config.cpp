#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace rebalsim {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

std::vector<std::string> readStringList(const nlohmann::json& j, const char* key,
                                        const std::vector<std::string>& fallback) {
    if (!j.contains(key) || !j[key].is_array()) {
        return fallback;
    }
    std::vector<std::string> out;
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            const auto value = trimCopy(item.get<std::string>());
            if (!value.empty()) {
                out.push_back(value);
            }
        }
    }
    return out;
}
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    bool ok = false;
    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Config file not found: " << config_path << ", using defaults" << std::endl;
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Config file could not be opened: " << config_path << std::endl;
        } else {
            try {
                nlohmann::json j;
                file >> j;
                ok = loadFromJson(j);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "Config parse error in " << config_path << ": " << e.what() << std::endl;
            }
        }
    }

    applyEnvironmentOverrides();
    return ok;
}

bool Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        std::cerr << "Config root must be a JSON object" << std::endl;
        return false;
    }

    // parse into a copy so a type error half-way leaves the defaults intact
    Config parsed(*this);
    try {
        if (j.contains("simulation")) {
            parsed.parseSimulation(j["simulation"]);
        }
        if (j.contains("strategy")) {
            parsed.parseStrategy(j["strategy"]);
        }
        if (j.contains("protection")) {
            parsed.parseProtection(j["protection"]);
        }
        if (j.contains("regime")) {
            parsed.parseRegime(j["regime"]);
        }
        if (j.contains("calibration")) {
            const auto& c = j["calibration"];
            parsed.calibration_.enabled = c.value("enabled", parsed.calibration_.enabled);
            parsed.calibration_.profiles_dir = c.value("profiles_dir", parsed.calibration_.profiles_dir);
            parsed.calibration_.profile = c.value("profile", parsed.calibration_.profile);
        }
        if (j.contains("data")) {
            parsed.paths_.price_data_dir = j["data"].value("price_data_dir", parsed.paths_.price_data_dir);
        }
        if (j.contains("output")) {
            const auto& o = j["output"];
            parsed.paths_.result_path = o.value("result_path", parsed.paths_.result_path);
            parsed.paths_.journal_path = o.value("journal_path", parsed.paths_.journal_path);
        }
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            parsed.log_level_ = l.value("level", parsed.log_level_);
            parsed.paths_.log_dir = l.value("dir", parsed.paths_.log_dir);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config value error: " << e.what() << std::endl;
        return false;
    }

    parsed.setCalibrationProfile(parsed.calibration_.profile);
    *this = std::move(parsed);
    return true;
}

void Config::parseSimulation(const nlohmann::json& s) {
    auto& sim = simulation_;
    sim.run_name = s.value("run_name", sim.run_name);
    sim.start_date = s.value("start_date", sim.start_date);
    sim.duration_days = s.value("duration_days", sim.duration_days);
    sim.cycle_length_minutes = s.value("cycle_length_minutes", sim.cycle_length_minutes);
    sim.starting_capital = s.value("starting_capital", sim.starting_capital);
    sim.max_cycles = s.value("max_cycles", sim.max_cycles);
    sim.price_interval = s.value("price_interval", sim.price_interval);
    sim.history_length = s.value("history_length", sim.history_length);
    sim.use_warmup_history = s.value("use_warmup_history", sim.use_warmup_history);
    sim.reserve_ratio = s.value("reserve_ratio", sim.reserve_ratio);
    sim.reserve_daily_yield = s.value("reserve_daily_yield", sim.reserve_daily_yield);
    sim.random_seed = s.value("random_seed", sim.random_seed);

    if (s.contains("volatility_mode")) {
        const auto mode = engine::volatilityModeFromString(s["volatility_mode"].get<std::string>());
        if (mode) {
            sim.synthetic.mode = *mode;
        } else {
            std::cerr << "Unknown volatility_mode, keeping " << engine::toString(sim.synthetic.mode) << std::endl;
        }
    }

    if (s.contains("synthetic_patterns") && s["synthetic_patterns"].is_object()) {
        for (const auto& [symbol, raw] : s["synthetic_patterns"].items()) {
            engine::ReturnPattern pattern;
            pattern.mean = raw.value("mean", pattern.mean);
            pattern.stddev = raw.value("std", pattern.stddev);
            pattern.trend = raw.value("trend", pattern.trend);
            if (symbol == "default") {
                sim.synthetic.fallback = pattern;
            } else {
                sim.synthetic.patterns[symbol] = pattern;
            }
        }
    }
}

void Config::parseStrategy(const nlohmann::json& s) {
    auto& st = strategy_;
    st.selector.universe = readStringList(s, "universe", st.selector.universe);
    st.selector.anchors = readStringList(s, "anchors", st.selector.anchors);
    st.target_coins = s.value("target_coins", st.target_coins);
    st.selection_interval = s.value("selection_interval", st.selection_interval);
    st.min_selection_change = s.value("min_selection_change", st.min_selection_change);
    st.min_allocation = s.value("min_allocation", st.min_allocation);
    st.max_allocation = s.value("max_allocation", st.max_allocation);
    st.min_enhanced_allocation = s.value("min_enhanced_allocation", st.min_enhanced_allocation);
    st.max_enhanced_allocation = s.value("max_enhanced_allocation", st.max_enhanced_allocation);
    st.rebalance_fee_rate = s.value("rebalance_fee_rate", st.rebalance_fee_rate);
    st.conversion_fee_rate = s.value("conversion_fee_rate", st.conversion_fee_rate);
    st.reserve_asset = s.value("reserve_asset", st.reserve_asset);
    st.realistic_execution = s.value("realistic_execution", st.realistic_execution);
    st.min_execution_delay = s.value("min_execution_delay", st.min_execution_delay);
    st.max_execution_delay = s.value("max_execution_delay", st.max_execution_delay);
    st.order_failure_probability = s.value("order_failure_probability", st.order_failure_probability);
}

void Config::parseProtection(const nlohmann::json& p) {
    auto& pc = strategy_.protection;
    pc.enabled = p.value("enabled", pc.enabled);
    pc.min_signals = p.value("min_signals", pc.min_signals);
    pc.bear_market_threshold = p.value("bear_market_threshold", pc.bear_market_threshold);
    pc.consecutive_loss_threshold = p.value("consecutive_loss_threshold", pc.consecutive_loss_threshold);
    pc.volatility_threshold = p.value("volatility_threshold", pc.volatility_threshold);
    pc.cumulative_loss_threshold = p.value("cumulative_loss_threshold", pc.cumulative_loss_threshold);
    pc.fear_sentiment_threshold = p.value("fear_sentiment_threshold", pc.fear_sentiment_threshold);
    pc.accelerating_decline_threshold = p.value("accelerating_decline_threshold", pc.accelerating_decline_threshold);
    pc.strong_decline_threshold = p.value("strong_decline_threshold", pc.strong_decline_threshold);
    pc.exit_recovery_threshold = p.value("exit_recovery_threshold", pc.exit_recovery_threshold);
    pc.exit_volatility_threshold = p.value("exit_volatility_threshold", pc.exit_volatility_threshold);
    pc.greed_sentiment_threshold = p.value("greed_sentiment_threshold", pc.greed_sentiment_threshold);
    pc.exit_momentum_threshold = p.value("exit_momentum_threshold", pc.exit_momentum_threshold);
    pc.strong_recovery_threshold = p.value("strong_recovery_threshold", pc.strong_recovery_threshold);
    pc.cooldown_cycles = p.value("cooldown_cycles", pc.cooldown_cycles);
    pc.strong_exit_cooldown_cycles = p.value("strong_exit_cooldown_cycles", pc.strong_exit_cooldown_cycles);
    pc.initial_sentiment = p.value("initial_sentiment", pc.initial_sentiment);
}

void Config::parseRegime(const nlohmann::json& r) {
    auto& rt = strategy_.regime;
    rt.volatile_volatility = r.value("volatile_volatility", rt.volatile_volatility);
    rt.bull_short_trend = r.value("bull_short_trend", rt.bull_short_trend);
    rt.bull_medium_trend = r.value("bull_medium_trend", rt.bull_medium_trend);
    rt.bull_min_correlation = r.value("bull_min_correlation", rt.bull_min_correlation);
    rt.bull_max_volatility = r.value("bull_max_volatility", rt.bull_max_volatility);
    rt.bear_short_trend = r.value("bear_short_trend", rt.bear_short_trend);
    rt.bear_medium_trend = r.value("bear_medium_trend", rt.bear_medium_trend);
    rt.bear_max_volatility = r.value("bear_max_volatility", rt.bear_max_volatility);
}

void Config::setCalibrationProfile(const std::string& name) {
    calibration_.profile = name;
    simulation_.calibration_profile = name;
    const bool disabled = name.empty() || name == "none";
    if (disabled) {
        calibration_.enabled = false;
    }
    simulation_.enable_calibration = calibration_.enabled;
}

void Config::setCalibrationEnabled(bool enabled) {
    calibration_.enabled = enabled;
    setCalibrationProfile(calibration_.profile);
}

void Config::applyEnvironmentOverrides() {
    const std::string profiles_dir = readEnvVar("CALIBRATION_PROFILES_DIR");
    if (!profiles_dir.empty()) {
        calibration_.profiles_dir = profiles_dir;
    }

    const std::string enable = toLowerCopy(readEnvVar("ENABLE_CALIBRATION"));
    if (enable == "true" || enable == "1" || enable == "yes") {
        calibration_.enabled = true;
    } else if (enable == "false" || enable == "0" || enable == "no") {
        calibration_.enabled = false;
    }

    const std::string profile = readEnvVar("DEFAULT_CALIBRATION_PROFILE");
    setCalibrationProfile(profile.empty() ? calibration_.profile : profile);

    const std::string mode = readEnvVar("VOLATILITY_SELECTION_MODE");
    if (!mode.empty()) {
        const auto parsed = engine::volatilityModeFromString(mode);
        if (parsed) {
            simulation_.synthetic.mode = *parsed;
        } else {
            std::cerr << "Ignoring unknown VOLATILITY_SELECTION_MODE: " << mode << std::endl;
        }
    }
}

} // namespace rebalsim
