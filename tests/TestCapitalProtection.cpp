#include "strategy/CapitalProtection.h"

#include <cassert>
#include <cmath>
#include <iostream>

using rebalsim::strategy::CapitalProtection;
using rebalsim::strategy::ProtectionConfig;
using rebalsim::strategy::ProtectionDecision;
using rebalsim::strategy::ProtectionObservation;
using rebalsim::strategy::ProtectionTransition;

namespace {
ProtectionObservation obs(double capital, double market_return, double volatility = 0.03) {
    ProtectionObservation o;
    o.capital = capital;
    o.market_return = market_return;
    o.market_volatility = volatility;
    return o;
}

// Three -3% cycles: consecutive losses and accelerating decline both fire on the third
void driveIntoProtection(CapitalProtection& protection) {
    auto d = protection.evaluate(obs(100.0, -0.03));
    assert(!d.active);
    d = protection.evaluate(obs(97.0, -0.03));
    assert(!d.active);
    assert(d.consecutive_losses == 1);
    d = protection.evaluate(obs(94.09, -0.03));
    assert(d.active);
    assert(d.transition == ProtectionTransition::ENTERED);
    assert(d.signals.size() >= 2);
}
}

int main() {
    {
        CapitalProtection protection;
        driveIntoProtection(protection);
        assert(protection.entries() == 1);
        assert(protection.protectedCycles() == 1);

        // still falling: stays protected
        auto d = protection.evaluate(obs(94.09, -0.04));
        assert(d.active);
        assert(d.transition == ProtectionTransition::NONE);
        assert(protection.protectedCycles() == 2);
    }

    {
        // a single strong recovery exits and arms the short cooldown
        CapitalProtection protection;
        driveIntoProtection(protection);
        auto d = protection.evaluate(obs(94.09, 0.07));
        assert(!d.active);
        assert(d.transition == ProtectionTransition::EXITED);
        assert(d.cooldown_remaining == 2);
        assert(protection.exits() == 1);

        // no re-entry while cooling down, even on a crash
        d = protection.evaluate(obs(80.0, -0.10, 0.10));
        assert(!d.active);
        assert(d.cooldown_blocked);
        assert(d.cooldown_remaining == 1);
        d = protection.evaluate(obs(70.0, -0.10, 0.10));
        assert(!d.active);
        assert(d.cooldown_blocked);
        assert(d.cooldown_remaining == 0);

        d = protection.evaluate(obs(60.0, -0.10, 0.10));
        assert(!d.cooldown_blocked);
        assert(d.active);
        assert(protection.entries() == 2);
    }

    {
        // recovery plus calm volatility is a multi-signal exit
        CapitalProtection protection;
        driveIntoProtection(protection);
        auto d = protection.evaluate(obs(94.09, 0.035, 0.01));
        assert(d.transition == ProtectionTransition::EXITED);
        assert(d.signals.size() >= 2);
        assert(d.cooldown_remaining == 3);
    }

    {
        // a deep drawdown enters on its own
        ProtectionConfig config;
        config.min_signals = 10;
        CapitalProtection protection(config);
        auto d = protection.evaluate(obs(100.0, 0.0));
        assert(!d.active);
        d = protection.evaluate(obs(87.0, 0.0, 0.0));
        assert(d.overall_performance <= -0.12);
        assert(d.active);
    }

    {
        ProtectionConfig config;
        config.enabled = false;
        CapitalProtection protection(config);
        double capital = 100.0;
        for (int i = 0; i < 10; ++i) {
            const auto d = protection.evaluate(obs(capital, -0.08, 0.12));
            assert(!d.active);
            capital *= 0.92;
        }
        assert(protection.entries() == 0);
        assert(protection.protectedCycles() == 0);
    }

    {
        CapitalProtection protection;
        assert(std::abs(protection.sentimentScore() - 0.5) < 1e-12);
        for (int i = 0; i < 20; ++i) {
            protection.evaluate(obs(100.0 + i, 0.10, 0.01));
        }
        assert(protection.sentimentScore() <= 1.0);
        assert(std::abs(protection.sentimentScore() - 1.0) < 1e-12);
        for (int i = 0; i < 40; ++i) {
            protection.evaluate(obs(100.0, -0.10, 0.01));
        }
        assert(protection.sentimentScore() >= 0.0);

        protection.reset();
        assert(!protection.isActive());
        assert(protection.entries() == 0);
        assert(std::abs(protection.sentimentScore() - 0.5) < 1e-12);
    }

    std::cout << "[TEST] CapitalProtection PASSED\n";
    return 0;
}
