#pragma once

#include "strategy/StrategyConfig.h"

#include <deque>
#include <string>
#include <vector>

namespace rebalsim {
namespace strategy {

enum class ProtectionTransition {
    NONE,
    ENTERED,
    EXITED
};

const char* toString(ProtectionTransition transition);

// What the controller sees at the start of each cycle
struct ProtectionObservation {
    double capital = 0.0;
    double market_return = 0.0;       // mean last daily return of the traded assets
    double market_volatility = 0.0;   // absolute last daily return of the lead anchor
};

struct ProtectionDecision {
    bool active = false;
    ProtectionTransition transition = ProtectionTransition::NONE;
    std::vector<std::string> signals;  // signals that fired this cycle
    double daily_change = 0.0;
    double overall_performance = 0.0;
    double sentiment = 0.0;
    int consecutive_losses = 0;
    int cooldown_remaining = 0;
    bool cooldown_blocked = false;
};

// Two-state controller (unprotected / protected). Entry and exit are driven by
// the number of independent risk signals, not a single threshold. After an
// exit, re-entry is suppressed for `cooldown` cycles.
class CapitalProtection {
public:
    explicit CapitalProtection(ProtectionConfig config = {});

    ProtectionDecision evaluate(const ProtectionObservation& observation);

    bool isActive() const { return active_; }
    int cooldownRemaining() const { return cooldown_; }
    double sentimentScore() const { return sentiment_; }
    int consecutiveLosses() const { return consecutive_losses_; }
    int protectedCycles() const { return protected_cycles_; }
    int entries() const { return entries_; }
    int exits() const { return exits_; }
    const ProtectionConfig& config() const { return config_; }

    void reset();

private:
    void recordObservation(const ProtectionObservation& observation, ProtectionDecision& decision);
    void updateSentiment(double market_return);
    std::vector<std::string> collectEntrySignals(double overall_performance) const;
    std::vector<std::string> collectExitSignals(double market_return) const;

    static void pushBounded(std::deque<double>& series, double value, size_t limit);
    static double trailingSum(const std::deque<double>& series, size_t n);
    static double trailingAverage(const std::deque<double>& series, size_t n);

    ProtectionConfig config_;

    bool active_ = false;
    int cooldown_ = 0;
    double sentiment_ = 0.5;
    int consecutive_losses_ = 0;

    std::deque<double> capital_history_;
    std::deque<double> daily_changes_;
    std::deque<double> market_returns_;
    std::deque<double> volatility_history_;

    int protected_cycles_ = 0;
    int entries_ = 0;
    int exits_ = 0;
};

} // namespace strategy
} // namespace rebalsim
