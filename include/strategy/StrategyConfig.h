#pragma once

#include "analytics/CoinSelector.h"
#include "analytics/RegimeDetector.h"

#include <cstddef>
#include <string>
#include <vector>

namespace rebalsim {
namespace strategy {

// Capital protection triggers. Entry needs `min_signals` of the six entry
// signals (or a strong decline alone); exit needs `min_signals` of the five
// exit signals (or a strong recovery alone).
struct ProtectionConfig {
    bool enabled = true;
    int min_signals = 2;

    // entry
    double bear_market_threshold = -0.08;        // cumulative decline
    int consecutive_loss_threshold = 2;
    double volatility_threshold = 0.06;          // trailing 3-cycle average
    double cumulative_loss_threshold = -0.12;    // trailing 5-cycle compounded loss
    double fear_sentiment_threshold = 0.3;
    double accelerating_decline_threshold = -0.05; // trailing 3-cycle sum
    double strong_decline_threshold = -0.12;     // forces entry alone

    // exit
    double exit_recovery_threshold = 0.03;
    double exit_volatility_threshold = 0.03;
    double greed_sentiment_threshold = 0.6;
    double exit_momentum_threshold = 0.02;       // trailing 3-cycle sum
    double strong_recovery_threshold = 0.06;     // forces exit alone

    int cooldown_cycles = 3;
    int strong_exit_cooldown_cycles = 2;

    double initial_sentiment = 0.5;
    size_t signal_window = 10;
    size_t capital_window = 30;
};

struct RebalanceStrategyConfig {
    analytics::CoinSelectorConfig selector;
    analytics::RegimeThresholds regime;
    ProtectionConfig protection;

    size_t target_coins = 9;
    int selection_interval = 5;          // cycles between re-selections
    size_t min_selection_change = 2;     // new symbols required to switch

    double min_allocation = 0.05;
    double max_allocation = 0.25;
    double min_enhanced_allocation = 0.02;
    double max_enhanced_allocation = 0.25;
    double min_momentum_weight = 0.1;

    double rebalance_fee_rate = 0.001;
    double conversion_fee_rate = 0.001;  // charged on the cycle that enters protection
    std::string reserve_asset = "USDC";

    bool realistic_execution = true;
    double min_execution_delay = 10.0;   // seconds
    double max_execution_delay = 60.0;
    double order_failure_probability = 0.02;
};

} // namespace strategy
} // namespace rebalsim
