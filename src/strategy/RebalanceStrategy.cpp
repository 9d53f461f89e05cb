#include "strategy/RebalanceStrategy.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rebalsim {
namespace strategy {

using analytics::MarketRegime;

RebalanceStrategy::RebalanceStrategy(RebalanceStrategyConfig config, std::shared_ptr<IRandomSource> random)
    : config_(std::move(config))
    , random_(std::move(random))
    , selector_(config_.selector)
    , regime_detector_(config_.regime)
    , hybrid_engine_()
    , protection_(config_.protection) {
    if (!random_) {
        throw std::invalid_argument("RebalanceStrategy requires a random source");
    }
}

void RebalanceStrategy::normalize(Allocation& allocation) {
    const double total = allocationTotal(allocation);
    if (total <= 0.0 || !std::isfinite(total)) {
        throw std::runtime_error("allocation total is not positive");
    }
    for (auto& [symbol, weight] : allocation) {
        weight /= total;
    }
}

bool RebalanceStrategy::updateSelection(int cycle_index, const analytics::PriceHistoryStore& history) {
    const int interval = std::max(1, config_.selection_interval);
    if (!selected_coins_.empty() && cycle_index % interval != 0) {
        return false;
    }

    std::map<std::string, std::vector<double>> market_data;
    for (const auto& symbol : config_.selector.universe) {
        market_data[symbol] = history.prices(symbol);
    }

    const auto selection = selector_.selectTopCoins(market_data, config_.target_coins);
    if (selection.symbols.empty()) {
        return false;
    }

    if (selected_coins_.empty()) {
        selected_coins_ = selection.symbols;
        LOG_INFO("Initial coin selection: {} assets", selected_coins_.size());
        return true;
    }

    size_t new_symbols = 0;
    for (const auto& symbol : selection.symbols) {
        if (std::find(selected_coins_.begin(), selected_coins_.end(), symbol) == selected_coins_.end()) {
            ++new_symbols;
        }
    }

    if (new_symbols < config_.min_selection_change) {
        return false;
    }

    LOG_INFO("Coin selection updated: {} new assets", new_symbols);
    selected_coins_ = selection.symbols;
    ++selection_changes_;
    return true;
}

ProtectionObservation RebalanceStrategy::observe(double capital, const analytics::PriceHistoryStore& history) const {
    ProtectionObservation observation;
    observation.capital = capital;

    const auto& basket = selected_coins_.empty() ? config_.selector.anchors : selected_coins_;
    double sum = 0.0;
    int count = 0;
    for (const auto& symbol : basket) {
        if (history.length(symbol) >= 2) {
            sum += history.lastReturn(symbol);
            ++count;
        }
    }
    observation.market_return = (count > 0) ? sum / count : 0.0;

    if (!config_.selector.anchors.empty()) {
        observation.market_volatility = std::abs(history.lastReturn(config_.selector.anchors.front()));
    }
    return observation;
}

Allocation RebalanceStrategy::calculateBaseAllocation(const std::vector<std::string>& symbols,
                                                      const analytics::PriceHistoryStore& history) const {
    Allocation allocation;
    for (const auto& symbol : symbols) {
        const auto& prices = history.prices(symbol);
        double weight = 1.0;
        if (prices.size() >= config_.selector.min_history) {
            const double score = selector_.calculateMomentumScore(prices);
            weight = std::max(config_.min_momentum_weight, 1.0 + score);
        }
        allocation[symbol] = weight;
    }
    if (allocation.empty()) {
        return allocation;
    }

    normalize(allocation);
    for (auto& [symbol, weight] : allocation) {
        weight = std::clamp(weight, config_.min_allocation, config_.max_allocation);
    }
    normalize(allocation);
    return allocation;
}

void RebalanceStrategy::applyExecutionModel(RebalanceResult& result) {
    if (!config_.realistic_execution) {
        return;
    }
    result.execution_delay = random_->uniform(config_.min_execution_delay, config_.max_execution_delay);
    if (random_->uniform(0.0, 1.0) < config_.order_failure_probability) {
        result.failed_orders = 1;
    }
}

RebalanceResult RebalanceStrategy::execute(int cycle_index, Timestamp date, double capital,
                                           const analytics::PriceHistoryStore& history) {
    ++executions_;
    RebalanceResult result;

    try {
        if (!std::isfinite(capital) || capital < 0.0) {
            throw std::runtime_error("invalid capital");
        }

        const auto& anchors = config_.selector.anchors;
        const std::string primary = anchors.size() > 0 ? anchors[0] : std::string();
        const std::string secondary = anchors.size() > 1 ? anchors[1] : std::string();
        result.regime_analysis = regime_detector_.analyzeRegime(history.prices(primary), history.prices(secondary));
        result.market_regime = result.regime_analysis.regime;

        const auto decision = protection_.evaluate(observe(capital, history));
        result.protection_active = decision.active;
        result.protection_transition = decision.transition;
        result.protection_signals = decision.signals;

        if (decision.active) {
            result.allocations[config_.reserve_asset] = 1.0;
            result.trading_costs = capital * config_.conversion_fee_rate;
            if (decision.transition == ProtectionTransition::ENTERED) {
                result.actions_taken.push_back("PROTECTION_ENTERED");
            }
            result.actions_taken.push_back("RESERVE_PROTECTION");
            result.selected_coins = selected_coins_;
        } else {
            if (decision.transition == ProtectionTransition::EXITED) {
                result.actions_taken.push_back("PROTECTION_EXITED");
            }
            if (updateSelection(cycle_index, history)) {
                result.actions_taken.push_back("COIN_SELECTION_UPDATED");
            }
            if (selected_coins_.empty()) {
                throw std::runtime_error("no tradable assets selected");
            }

            const auto base = calculateBaseAllocation(selected_coins_, history);
            result.allocations = hybrid_engine_.applyToAllocations(
                base, history, result.market_regime, config_.reserve_asset,
                config_.min_enhanced_allocation, config_.max_enhanced_allocation);

            const double total = allocationTotal(result.allocations);
            if (!std::isfinite(total) || std::abs(total - 1.0) > 1e-6) {
                throw std::runtime_error("allocation does not sum to 1");
            }

            result.trading_costs = capital * config_.rebalance_fee_rate;
            result.actions_taken.push_back("CRYPTO_REBALANCE");
            result.selected_coins = selected_coins_;
        }

        applyExecutionModel(result);
        result.success = true;
        ++successful_executions_;

        LOG_DEBUG("[{}] cycle {} regime={} protected={} assets={} costs={:.4f}",
                  utils::formatDay(date), cycle_index, analytics::toString(result.market_regime),
                  result.protection_active, result.allocations.size(), result.trading_costs);
    } catch (const std::exception& e) {
        result.success = false;
        result.reason = e.what();
        result.allocations.clear();
        ++failed_executions_;
        LOG_ERROR("Rebalance failed at cycle {}: {}", cycle_index, e.what());
    }

    return result;
}

StrategySummary RebalanceStrategy::summary() const {
    StrategySummary out;
    out.executions = executions_;
    out.successful_executions = successful_executions_;
    out.failed_executions = failed_executions_;
    out.protected_cycles = protection_.protectedCycles();
    out.protection_entries = protection_.entries();
    out.protection_exits = protection_.exits();
    out.selection_changes = selection_changes_;
    out.protection_active = protection_.isActive();
    out.sentiment = protection_.sentimentScore();
    out.current_selection = selected_coins_;
    return out;
}

} // namespace strategy
} // namespace rebalsim
