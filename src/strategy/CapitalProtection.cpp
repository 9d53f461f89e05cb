#include "strategy/CapitalProtection.h"
#include "common/Logger.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace rebalsim {
namespace strategy {

namespace {
std::string pct(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value * 100.0 << "%";
    return oss.str();
}
}

const char* toString(ProtectionTransition transition) {
    switch (transition) {
        case ProtectionTransition::NONE: return "NONE";
        case ProtectionTransition::ENTERED: return "ENTERED";
        case ProtectionTransition::EXITED: return "EXITED";
    }
    return "NONE";
}

CapitalProtection::CapitalProtection(ProtectionConfig config)
    : config_(config)
    , sentiment_(config.initial_sentiment) {}

void CapitalProtection::reset() {
    active_ = false;
    cooldown_ = 0;
    sentiment_ = config_.initial_sentiment;
    consecutive_losses_ = 0;
    capital_history_.clear();
    daily_changes_.clear();
    market_returns_.clear();
    volatility_history_.clear();
    protected_cycles_ = 0;
    entries_ = 0;
    exits_ = 0;
}

void CapitalProtection::pushBounded(std::deque<double>& series, double value, size_t limit) {
    series.push_back(value);
    while (series.size() > std::max<size_t>(1, limit)) {
        series.pop_front();
    }
}

double CapitalProtection::trailingSum(const std::deque<double>& series, size_t n) {
    double sum = 0.0;
    const size_t count = std::min(n, series.size());
    for (size_t i = series.size() - count; i < series.size(); ++i) {
        sum += series[i];
    }
    return sum;
}

double CapitalProtection::trailingAverage(const std::deque<double>& series, size_t n) {
    const size_t count = std::min(n, series.size());
    return (count > 0) ? trailingSum(series, n) / static_cast<double>(count) : 0.0;
}

void CapitalProtection::recordObservation(const ProtectionObservation& observation, ProtectionDecision& decision) {
    const double previous_capital = capital_history_.empty() ? 0.0 : capital_history_.back();
    pushBounded(capital_history_, observation.capital, config_.capital_window);

    decision.daily_change = (previous_capital > 0.0) ? observation.capital / previous_capital - 1.0 : 0.0;
    const double base_capital = capital_history_.front();
    decision.overall_performance = (base_capital > 0.0) ? observation.capital / base_capital - 1.0 : 0.0;

    if (decision.daily_change < 0.0) {
        ++consecutive_losses_;
    } else {
        consecutive_losses_ = 0;
    }

    pushBounded(daily_changes_, decision.daily_change, config_.signal_window);
    pushBounded(market_returns_, observation.market_return, config_.signal_window);
    pushBounded(volatility_history_, observation.market_volatility, config_.signal_window);

    updateSentiment(observation.market_return);
}

void CapitalProtection::updateSentiment(double market_return) {
    double change = 0.0;
    if (market_return > 0.05) {
        change = 0.1;
    } else if (market_return > 0.02) {
        change = 0.05;
    } else if (market_return > -0.02) {
        change = 0.0;
    } else if (market_return > -0.05) {
        change = -0.05;
    } else {
        change = -0.1;
    }

    if (market_returns_.size() >= 3) {
        const double trend = trailingSum(market_returns_, 3);
        if (trend > 0.06) {
            change += 0.05;
        } else if (trend < -0.06) {
            change -= 0.05;
        }
    }

    sentiment_ = std::clamp(sentiment_ + change, 0.0, 1.0);
}

std::vector<std::string> CapitalProtection::collectEntrySignals(double overall_performance) const {
    std::vector<std::string> signals;

    if (overall_performance <= config_.bear_market_threshold) {
        signals.push_back("Portfolio decline: " + pct(overall_performance));
    }

    if (consecutive_losses_ >= config_.consecutive_loss_threshold) {
        signals.push_back("Consecutive losses: " + std::to_string(consecutive_losses_));
    }

    if (volatility_history_.size() >= 3) {
        const double recent_volatility = trailingAverage(volatility_history_, 3);
        if (recent_volatility > config_.volatility_threshold) {
            signals.push_back("High volatility: " + pct(recent_volatility));
        }
    }

    if (daily_changes_.size() >= 5) {
        double compounded = 1.0;
        for (size_t i = daily_changes_.size() - 5; i < daily_changes_.size(); ++i) {
            compounded *= (1.0 + daily_changes_[i]);
        }
        const double cumulative_loss = compounded - 1.0;
        if (cumulative_loss <= config_.cumulative_loss_threshold) {
            signals.push_back("Cumulative 5-cycle loss: " + pct(cumulative_loss));
        }
    }

    if (sentiment_ < config_.fear_sentiment_threshold) {
        signals.push_back("Market fear: " + std::to_string(sentiment_));
    }

    if (daily_changes_.size() >= 3) {
        const double recent_trend = trailingSum(daily_changes_, 3);
        if (recent_trend < config_.accelerating_decline_threshold) {
            signals.push_back("Accelerating decline: " + pct(recent_trend));
        }
    }

    return signals;
}

std::vector<std::string> CapitalProtection::collectExitSignals(double market_return) const {
    std::vector<std::string> signals;

    if (market_return >= config_.exit_recovery_threshold) {
        signals.push_back("Market recovery: " + pct(market_return));
    }

    if (market_returns_.size() >= 2) {
        const bool two_positive = market_returns_[market_returns_.size() - 1] > 0.0 &&
                                  market_returns_[market_returns_.size() - 2] > 0.0;
        if (two_positive) {
            signals.push_back("2 consecutive positive cycles");
        }
    }

    if (volatility_history_.size() >= 3) {
        const double recent_volatility = trailingAverage(volatility_history_, 3);
        if (recent_volatility < config_.exit_volatility_threshold) {
            signals.push_back("Volatility normalized: " + pct(recent_volatility));
        }
    }

    if (sentiment_ > config_.greed_sentiment_threshold) {
        signals.push_back("Sentiment improved: " + std::to_string(sentiment_));
    }

    if (market_returns_.size() >= 3) {
        const double momentum = trailingSum(market_returns_, 3);
        if (momentum > config_.exit_momentum_threshold) {
            signals.push_back("Positive momentum: " + pct(momentum));
        }
    }

    return signals;
}

ProtectionDecision CapitalProtection::evaluate(const ProtectionObservation& observation) {
    ProtectionDecision decision;
    recordObservation(observation, decision);

    if (!config_.enabled) {
        active_ = false;
    } else if (!active_) {
        if (cooldown_ > 0) {
            --cooldown_;
            decision.cooldown_blocked = true;
        } else {
            decision.signals = collectEntrySignals(decision.overall_performance);
            const bool multi_signal = static_cast<int>(decision.signals.size()) >= config_.min_signals;
            const bool strong_decline = decision.overall_performance <= config_.strong_decline_threshold;
            if (multi_signal || strong_decline) {
                active_ = true;
                ++entries_;
                decision.transition = ProtectionTransition::ENTERED;
                LOG_INFO("Protection ACTIVATED ({} signals, performance {})",
                         decision.signals.size(), pct(decision.overall_performance));
                for (const auto& signal : decision.signals) {
                    LOG_INFO("  - {}", signal);
                }
            }
        }
    } else {
        decision.signals = collectExitSignals(observation.market_return);
        const bool multi_signal = static_cast<int>(decision.signals.size()) >= config_.min_signals;
        const bool strong_recovery = observation.market_return >= config_.strong_recovery_threshold;
        if (multi_signal || strong_recovery) {
            active_ = false;
            ++exits_;
            cooldown_ = multi_signal ? config_.cooldown_cycles : config_.strong_exit_cooldown_cycles;
            decision.transition = ProtectionTransition::EXITED;
            LOG_INFO("Protection RELEASED ({} signals, market {}), cooldown {}",
                     decision.signals.size(), pct(observation.market_return), cooldown_);
        }
    }

    if (active_) {
        ++protected_cycles_;
    }

    decision.active = active_;
    decision.sentiment = sentiment_;
    decision.consecutive_losses = consecutive_losses_;
    decision.cooldown_remaining = cooldown_;
    return decision;
}

} // namespace strategy
} // namespace rebalsim
