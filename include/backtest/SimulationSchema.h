#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "backtest/SimulationTypes.h"
#include "common/TimeUtils.h"

namespace rebalsim {
namespace backtest {

inline const char* dataSourceToString(DataSource source) {
    switch (source) {
        case DataSource::REAL: return "real";
        case DataSource::SYNTHETIC: return "synthetic";
        case DataSource::MIXED: return "mixed";
        case DataSource::RESERVE: return "reserve";
    }
    return "synthetic";
}

inline DataSource dataSourceFromString(const std::string& value) {
    if (value == "real") return DataSource::REAL;
    if (value == "mixed") return DataSource::MIXED;
    if (value == "reserve") return DataSource::RESERVE;
    return DataSource::SYNTHETIC;
}

inline nlohmann::json toJson(const core::CalibrationParameters& params) {
    nlohmann::json out;
    out["market_timing_efficiency"] = params.market_timing_efficiency;
    out["daily_slippage"] = params.daily_slippage;
    out["trading_fee"] = params.trading_fee;
    out["volatility_drag"] = params.volatility_drag;
    out["max_daily_return"] = params.max_daily_return;
    out["min_daily_return"] = params.min_daily_return;
    return out;
}

inline core::CalibrationParameters calibrationParametersFromJson(const nlohmann::json& raw) {
    core::CalibrationParameters params;
    params.market_timing_efficiency = raw.value("market_timing_efficiency", params.market_timing_efficiency);
    params.daily_slippage = raw.value("daily_slippage", params.daily_slippage);
    params.trading_fee = raw.value("trading_fee", params.trading_fee);
    params.volatility_drag = raw.value("volatility_drag", params.volatility_drag);
    params.max_daily_return = raw.value("max_daily_return", params.max_daily_return);
    params.min_daily_return = raw.value("min_daily_return", params.min_daily_return);
    return params;
}

inline nlohmann::json toJson(const SimulationCycleRecord& record) {
    nlohmann::json line;
    line["cycle_number"] = record.cycle_number;
    line["cycle_date"] = utils::formatIsoDate(record.cycle_date);
    line["cycle_date_ms"] = utils::toEpochMs(record.cycle_date);
    line["starting_capital"] = record.starting_capital;
    line["ending_capital"] = record.ending_capital;
    line["portfolio_value"] = record.portfolio_value;
    line["reserve_value"] = record.reserve_value;
    line["total_value"] = record.total_value;
    line["cycle_return"] = record.cycle_return;
    line["total_return_pct"] = record.total_return_pct;
    line["allocation_breakdown"] = record.allocation_breakdown;
    line["trading_costs"] = record.trading_costs;
    line["execution_delay"] = record.execution_delay;
    line["failed_orders"] = record.failed_orders;
    line["actions_taken"] = record.actions_taken;
    line["market_regime"] = analytics::toString(record.market_regime);
    line["protection_active"] = record.protection_active;
    line["selected_coins"] = record.selected_coins;
    line["data_source"] = dataSourceToString(record.data_source);
    line["calibration_applied"] = record.calibration_applied;
    line["calibration_profile"] = record.calibration_profile;
    line["raw_return"] = record.raw_return;
    line["capped_return"] = record.capped_return;
    return line;
}

inline SimulationCycleRecord cycleRecordFromJson(const nlohmann::json& line) {
    SimulationCycleRecord record;
    record.cycle_number = line.value("cycle_number", 0);
    record.cycle_date = utils::fromEpochMs(line.value("cycle_date_ms", 0LL));
    record.starting_capital = line.value("starting_capital", 0.0);
    record.ending_capital = line.value("ending_capital", 0.0);
    record.portfolio_value = line.value("portfolio_value", 0.0);
    record.reserve_value = line.value("reserve_value", 0.0);
    record.total_value = line.value("total_value", 0.0);
    record.cycle_return = line.value("cycle_return", 0.0);
    record.total_return_pct = line.value("total_return_pct", 0.0);
    record.allocation_breakdown = line.value("allocation_breakdown", Allocation{});
    record.trading_costs = line.value("trading_costs", 0.0);
    record.execution_delay = line.value("execution_delay", 0.0);
    record.failed_orders = line.value("failed_orders", 0);
    record.actions_taken = line.value("actions_taken", std::vector<std::string>{});
    record.market_regime = analytics::regimeFromString(line.value("market_regime", std::string("sideways")))
                               .value_or(analytics::MarketRegime::SIDEWAYS);
    record.protection_active = line.value("protection_active", false);
    record.selected_coins = line.value("selected_coins", std::vector<std::string>{});
    record.data_source = dataSourceFromString(line.value("data_source", std::string("synthetic")));
    record.calibration_applied = line.value("calibration_applied", false);
    record.calibration_profile = line.value("calibration_profile", std::string());
    record.raw_return = line.value("raw_return", 0.0);
    record.capped_return = line.value("capped_return", 0.0);
    return record;
}

inline nlohmann::json toJson(const CalibrationInfo& info) {
    nlohmann::json out;
    out["profile_applied"] = info.profile_applied;
    out["profile_name"] = info.profile_name;
    if (!info.error.empty()) {
        out["error"] = info.error;
    }
    out["original_return"] = info.original_return;
    out["calibrated_return"] = info.calibrated_return;
    out["adjustment"] = info.adjustment;
    out["total_trading_costs"] = info.total_trading_costs;
    out["parameters_used"] = toJson(info.parameters_used);
    out["warnings"] = info.warnings;
    return out;
}

inline nlohmann::json toJson(const SimulationSummary& summary) {
    nlohmann::json out;
    out["starting_capital"] = summary.starting_capital;
    out["final_capital"] = summary.final_capital;
    out["total_return"] = summary.total_return;
    out["total_trading_costs"] = summary.total_trading_costs;
    out["protection_cycles"] = summary.protection_cycles;
    out["protection_entries"] = summary.protection_entries;
    out["protection_exits"] = summary.protection_exits;
    out["failed_orders"] = summary.failed_orders;
    out["average_execution_delay"] = summary.average_execution_delay;
    out["real_data_cycles"] = summary.real_data_cycles;
    out["synthetic_data_cycles"] = summary.synthetic_data_cycles;
    out["calibration_applied"] = summary.calibration_applied;
    out["calibration_profile"] = summary.calibration_profile;
    return out;
}

inline nlohmann::json toJson(const SimulationResult& result) {
    nlohmann::json out;
    out["run_name"] = result.run_name;
    out["success"] = result.success;
    if (!result.failure_reason.empty()) {
        out["failure_reason"] = result.failure_reason;
    }
    out["total_cycles"] = result.total_cycles;
    out["final_summary"] = toJson(result.final_summary);
    out["calibration_info"] = toJson(result.calibration_info);

    nlohmann::json cycles = nlohmann::json::array();
    for (const auto& record : result.cycles) {
        cycles.push_back(toJson(record));
    }
    out["cycles"] = std::move(cycles);

    nlohmann::json regimes = nlohmann::json::array();
    for (const auto regime : result.regime_history) {
        regimes.push_back(analytics::toString(regime));
    }
    out["regime_history"] = std::move(regimes);
    out["final_coin_selection"] = result.final_coin_selection;
    return out;
}

} // namespace backtest
} // namespace rebalsim
