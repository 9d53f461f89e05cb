#include "backtest/SimulationEngine.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace rebalsim {
namespace backtest {

namespace {
constexpr double kSyntheticBasePrice = 100.0;

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

SimulationEngine::SimulationEngine(engine::SimulationConfig config,
                                   strategy::RebalanceStrategyConfig strategy_config,
                                   std::shared_ptr<core::IPriceHistoryProvider> provider,
                                   std::shared_ptr<engine::CalibrationManager> calibration,
                                   std::shared_ptr<IRandomSource> random,
                                   std::shared_ptr<core::ISimulationRecorder> recorder)
    : config_(std::move(config))
    , strategy_config_(std::move(strategy_config))
    , provider_(std::move(provider))
    , calibration_(std::move(calibration))
    , random_(std::move(random))
    , recorder_(std::move(recorder)) {
    if (!random_) {
        random_ = std::make_shared<MersenneRandomSource>(config_.random_seed);
    }
}

int SimulationEngine::plannedCycles(const engine::SimulationConfig& config) {
    if (config.duration_days <= 0 || config.cycle_length_minutes <= 0 || config.max_cycles <= 0) {
        return 0;
    }
    const long long horizon_ms = static_cast<long long>(config.duration_days) * utils::kMillisPerDay;
    const long long cycle_ms = static_cast<long long>(config.cycle_length_minutes) * utils::kMillisPerMinute;
    const long long cycles = (horizon_ms + cycle_ms - 1) / cycle_ms;
    return static_cast<int>(std::min<long long>(cycles, config.max_cycles));
}

void SimulationEngine::loadWarmupHistory(long long start_ms) {
    if (!provider_ || !config_.use_warmup_history) {
        return;
    }

    for (const auto& symbol : strategy_config_.selector.universe) {
        std::vector<Candle> rows;
        try {
            rows = provider_->getHistory(symbol, config_.price_interval,
                                         static_cast<int>(config_.history_length), start_ms - 1);
        } catch (const std::exception& e) {
            LOG_WARN("Warm-up history unavailable for {}: {}", symbol, e.what());
            warned_symbols_.insert(symbol);
            continue;
        }

        for (const auto& row : rows) {
            if (row.timestamp >= start_ms) {
                continue;
            }
            if (history_->append(symbol, row.close)) {
                last_seen_ts_[symbol] = row.timestamp;
            }
        }
    }

    LOG_INFO("Warm-up history loaded for {} symbols", history_->symbolCount());
}

bool SimulationEngine::fetchRealReturn(const std::string& symbol, long long cycle_ms, double& ret, double& close) {
    if (!provider_) {
        return false;
    }

    auto fallback = [&](const std::string& why) {
        if (warned_symbols_.insert(symbol).second) {
            LOG_WARN("Price history unavailable for {} ({}), using synthetic returns", symbol, why);
        }
        return false;
    };

    std::vector<Candle> rows;
    try {
        rows = provider_->getHistory(symbol, config_.price_interval, 2, cycle_ms);
    } catch (const std::exception& e) {
        return fallback(e.what());
    }

    if (rows.size() < 2) {
        return fallback("fewer than 2 rows");
    }

    const auto& previous = rows[rows.size() - 2];
    const auto& current = rows.back();
    const long long cycle_length_ms = static_cast<long long>(config_.cycle_length_minutes) * utils::kMillisPerMinute;
    auto seen = last_seen_ts_.find(symbol);
    const bool stale = (seen != last_seen_ts_.end() && current.timestamp <= seen->second) ||
                       current.timestamp <= cycle_ms - cycle_length_ms;
    if (stale) {
        return fallback("stale rows");
    }
    if (previous.close <= 0.0 || current.close <= 0.0 ||
        !std::isfinite(previous.close) || !std::isfinite(current.close)) {
        return fallback("invalid close");
    }

    ret = current.close / previous.close - 1.0;
    close = current.close;
    last_seen_ts_[symbol] = current.timestamp;
    return true;
}

SimulationEngine::CycleMarket SimulationEngine::realizeMarket(long long cycle_ms,
                                                               analytics::MarketRegime regime,
                                                               const std::vector<std::string>& symbols) {
    CycleMarket market;
    for (const auto& symbol : symbols) {
        if (symbol == strategy_config_.reserve_asset || market.returns.count(symbol) > 0) {
            continue;
        }

        double ret = 0.0;
        double close = 0.0;
        if (fetchRealReturn(symbol, cycle_ms, ret, close)) {
            market.real_symbols.insert(symbol);
        } else {
            const auto& prices = history_->prices(symbol);
            ret = synthetic_->assetReturn(symbol, regime, prices);
            const double last = prices.empty() ? kSyntheticBasePrice : prices.back();
            close = last * (1.0 + ret);
        }
        market.returns[symbol] = ret;
        market.closes[symbol] = close;
    }
    return market;
}

void SimulationEngine::appendCloses(const CycleMarket& market) {
    for (const auto& [symbol, close] : market.closes) {
        history_->append(symbol, close);
    }
}

SimulationResult SimulationEngine::run() {
    SimulationResult result;
    result.run_name = config_.run_name;
    result.final_summary.starting_capital = config_.starting_capital;
    result.final_summary.final_capital = config_.starting_capital;

    auto errors = config_.validate();
    if (strategy_config_.selector.universe.empty()) {
        errors.push_back("strategy universe must not be empty");
    }
    if (strategy_config_.target_coins == 0) {
        errors.push_back("target_coins must be positive");
    }
    if (!errors.empty()) {
        result.failure_reason = "invalid configuration: " + joinErrors(errors);
        LOG_ERROR("Simulation {} rejected: {}", config_.run_name, result.failure_reason);
        return result;
    }

    const long long start_ms = utils::toEpochMs(*utils::parseDate(config_.start_date));
    const long long end_ms = start_ms + static_cast<long long>(config_.duration_days) * utils::kMillisPerDay;
    const long long cycle_length_ms = static_cast<long long>(config_.cycle_length_minutes) * utils::kMillisPerMinute;

    history_ = std::make_unique<analytics::PriceHistoryStore>(config_.history_length);
    synthetic_ = std::make_unique<SyntheticReturnModel>(config_.synthetic, random_);
    strategy_ = std::make_unique<strategy::RebalanceStrategy>(strategy_config_, random_);
    last_seen_ts_.clear();
    warned_symbols_.clear();

    LOG_INFO("Simulation {} starting: {} for {} days, capital {:.2f}, {} cycles planned",
             config_.run_name, config_.start_date, config_.duration_days,
             config_.starting_capital, plannedCycles(config_));

    loadWarmupHistory(start_ms);

    double capital = config_.starting_capital;
    bool failed = false;
    int cycle_index = 0;

    for (long long cycle_ms = start_ms; cycle_ms < end_ms; cycle_ms += cycle_length_ms, ++cycle_index) {
        if (cycle_index >= config_.max_cycles) {
            LOG_WARN("Cycle cap {} reached before the end of the horizon", config_.max_cycles);
            break;
        }

        const Timestamp cycle_date = utils::fromEpochMs(cycle_ms);
        try {
            const auto decision = strategy_->execute(cycle_index, cycle_date, capital, *history_);
            if (!decision.success) {
                result.failure_reason = "cycle " + std::to_string(cycle_index + 1) + ": " + decision.reason;
                failed = true;
                break;
            }
            result.regime_history.push_back(decision.market_regime);

            // whole universe keeps moving so later selections see fresh prices
            std::vector<std::string> symbols = strategy_config_.selector.universe;
            for (const auto& [symbol, weight] : decision.allocations) {
                symbols.push_back(symbol);
            }
            const auto market = realizeMarket(cycle_ms, decision.market_regime, symbols);

            double cycle_return = 0.0;
            int real_assets = 0;
            int synthetic_assets = 0;
            for (const auto& [symbol, weight] : decision.allocations) {
                if (symbol == strategy_config_.reserve_asset) {
                    cycle_return += weight * config_.reserve_daily_yield;
                    continue;
                }
                cycle_return += weight * market.returns.at(symbol);
                if (market.real_symbols.count(symbol) > 0) {
                    ++real_assets;
                } else {
                    ++synthetic_assets;
                }
            }

            const double starting_capital = capital;
            capital = std::max(0.0, capital * (1.0 + cycle_return) - decision.trading_costs);
            if (!std::isfinite(capital)) {
                throw std::runtime_error("capital became non-finite");
            }

            SimulationCycleRecord record;
            record.cycle_number = cycle_index + 1;
            record.cycle_date = cycle_date;
            record.starting_capital = starting_capital;
            record.ending_capital = capital;
            record.total_value = capital;
            record.reserve_value = decision.protection_active ? capital : capital * config_.reserve_ratio;
            record.portfolio_value = capital - record.reserve_value;
            record.cycle_return = (starting_capital > 0.0) ? capital / starting_capital - 1.0 : 0.0;
            record.total_return_pct = (capital / config_.starting_capital - 1.0) * 100.0;
            record.allocation_breakdown = decision.allocations;
            record.trading_costs = decision.trading_costs;
            record.execution_delay = decision.execution_delay;
            record.failed_orders = decision.failed_orders;
            record.actions_taken = decision.actions_taken;
            record.market_regime = decision.market_regime;
            record.protection_active = decision.protection_active;
            record.selected_coins = decision.selected_coins;
            record.raw_return = record.cycle_return;
            record.capped_return = record.cycle_return;

            if (decision.protection_active) {
                record.data_source = DataSource::RESERVE;
            } else if (synthetic_assets == 0 && real_assets > 0) {
                record.data_source = DataSource::REAL;
            } else if (real_assets > 0) {
                record.data_source = DataSource::MIXED;
            } else {
                record.data_source = DataSource::SYNTHETIC;
            }

            appendCloses(market);

            Logger::getInstance().logCycle(config_.run_name, record.cycle_number, utils::formatDay(cycle_date),
                                           record.starting_capital, record.ending_capital,
                                           analytics::toString(record.market_regime),
                                           record.protection_active, record.trading_costs);
            if (recorder_ && !recorder_->append(config_.run_name, record)) {
                LOG_WARN("Failed to journal cycle {}", record.cycle_number);
            }

            result.cycles.push_back(std::move(record));
        } catch (const std::exception& e) {
            result.failure_reason = "cycle " + std::to_string(cycle_index + 1) + ": " + e.what();
            failed = true;
            break;
        }
    }

    result.success = !failed;
    result.total_cycles = static_cast<int>(result.cycles.size());
    result.final_coin_selection = strategy_->selectedCoins();
    result.final_summary = summarize(result);

    if (failed) {
        LOG_ERROR("Simulation {} stopped after {} cycles: {}",
                  config_.run_name, result.total_cycles, result.failure_reason);
        return result;
    }

    applyCalibration(result);

    LOG_INFO("Simulation {} completed: {} cycles, final capital {:.2f} ({:+.2f}%)",
             config_.run_name, result.total_cycles,
             result.final_summary.final_capital, result.final_summary.total_return);
    return result;
}

SimulationSummary SimulationEngine::summarize(const SimulationResult& result) const {
    SimulationSummary summary;
    summary.starting_capital = config_.starting_capital;
    summary.final_capital = result.cycles.empty() ? config_.starting_capital : result.cycles.back().total_value;
    summary.total_return = (summary.final_capital / config_.starting_capital - 1.0) * 100.0;

    double delay_sum = 0.0;
    for (const auto& cycle : result.cycles) {
        summary.total_trading_costs += cycle.trading_costs;
        summary.failed_orders += cycle.failed_orders;
        delay_sum += cycle.execution_delay;
        if (cycle.protection_active) {
            ++summary.protection_cycles;
        }
        if (cycle.data_source == DataSource::REAL) {
            ++summary.real_data_cycles;
        } else if (cycle.data_source == DataSource::SYNTHETIC || cycle.data_source == DataSource::MIXED) {
            ++summary.synthetic_data_cycles;
        }
    }
    if (!result.cycles.empty()) {
        summary.average_execution_delay = delay_sum / static_cast<double>(result.cycles.size());
    }

    if (strategy_) {
        const auto strategy_summary = strategy_->summary();
        summary.protection_entries = strategy_summary.protection_entries;
        summary.protection_exits = strategy_summary.protection_exits;
    }
    return summary;
}

void SimulationEngine::applyCalibration(SimulationResult& result) const {
    result.calibration_info.profile_name = config_.calibration_profile;
    if (!config_.enable_calibration || engine::CalibrationManager::isDisabledName(config_.calibration_profile)) {
        return;
    }
    if (!calibration_) {
        result.calibration_info.error = "no calibration manager";
        LOG_WARN("Calibration requested but no calibration manager is configured");
        return;
    }

    const auto report = calibration_->validateCompatibility(
        config_.calibration_profile, config_.duration_days, config_.starting_capital);
    for (const auto& warning : report.warnings) {
        LOG_WARN("Calibration {}: {}", config_.calibration_profile, warning);
    }

    auto outcome = calibration_->applyProfile(result.cycles, config_.calibration_profile, config_.starting_capital);
    outcome.info.warnings = report.warnings;
    result.calibration_info = outcome.info;
    if (!outcome.info.profile_applied) {
        return;
    }

    result.cycles = std::move(outcome.cycles);
    double total_costs = 0.0;
    for (const auto& cycle : result.cycles) {
        total_costs += cycle.trading_costs;
    }

    result.final_summary.final_capital = result.cycles.empty() ? config_.starting_capital
                                                               : result.cycles.back().total_value;
    result.final_summary.total_return = (result.final_summary.final_capital / config_.starting_capital - 1.0) * 100.0;
    result.final_summary.total_trading_costs = total_costs;
    result.final_summary.calibration_applied = true;
    result.final_summary.calibration_profile = config_.calibration_profile;
}

} // namespace backtest
} // namespace rebalsim
