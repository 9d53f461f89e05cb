#include "engine/CalibrationManager.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace rebalsim;
using rebalsim::backtest::SimulationCycleRecord;
using rebalsim::core::CalibrationParameters;
using rebalsim::core::CalibrationProfile;
using rebalsim::engine::CalibrationManager;

namespace {

class InMemoryProfileStore : public core::ICalibrationProfileStore {
public:
    std::optional<CalibrationProfile> loadProfile(const std::string& name) override {
        auto it = profiles_.find(name);
        if (it == profiles_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> listProfiles() override {
        std::vector<std::string> names;
        for (const auto& [name, profile] : profiles_) {
            names.push_back(name);
        }
        return names;
    }

    bool saveProfile(const CalibrationProfile& profile) override {
        profiles_[profile.profile_name] = profile;
        return true;
    }

private:
    std::map<std::string, CalibrationProfile> profiles_;
};

CalibrationProfile makeProfile(const std::string& name, CalibrationParameters params) {
    CalibrationProfile profile;
    profile.profile_name = name;
    profile.parameters = params;
    profile.description = name + " profile";
    return profile;
}

CalibrationParameters tightParameters() {
    CalibrationParameters p;
    p.market_timing_efficiency = 0.8;
    p.daily_slippage = 0.0005;
    p.trading_fee = 0.001;
    p.volatility_drag = 0.0002;
    p.max_daily_return = 0.01;
    p.min_daily_return = -0.01;
    return p;
}

std::vector<SimulationCycleRecord> cyclesFrom(const std::vector<double>& values) {
    std::vector<SimulationCycleRecord> cycles;
    double previous = 100.0;
    for (size_t i = 0; i < values.size(); ++i) {
        SimulationCycleRecord r;
        r.cycle_number = static_cast<int>(i) + 1;
        r.starting_capital = previous;
        r.ending_capital = values[i];
        r.total_value = values[i];
        r.portfolio_value = values[i] * 0.95;
        r.reserve_value = values[i] * 0.05;
        r.cycle_return = values[i] / previous - 1.0;
        cycles.push_back(r);
        previous = values[i];
    }
    return cycles;
}

std::vector<SimulationCycleRecord> rawCycles() {
    auto cycles = cyclesFrom({110.0, 99.0, 100.98, 100.98});
    // last cycle fully protected
    cycles.back().portfolio_value = 0.0;
    cycles.back().reserve_value = cycles.back().total_value;
    cycles.back().protection_active = true;
    return cycles;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

} // namespace

int main() {
    auto store = std::make_shared<InMemoryProfileStore>();
    store->saveProfile(makeProfile("identity", CalibrationParameters{}));
    store->saveProfile(makeProfile("tight", tightParameters()));

    auto pending = makeProfile("pending", CalibrationParameters{});
    pending.status = "insufficient_data";
    store->saveProfile(pending);

    auto bear = makeProfile("bear", tightParameters());
    bear.market_conditions["market_regime"] = "bear_market";
    bear.metadata["minimum_capital"] = 200.0;
    bear.expected_performance["monthly_return_range"] = "not validated";
    store->saveProfile(bear);

    CalibrationManager manager(store);

    {
        const auto profiles = manager.availableProfiles();
        assert(profiles.size() == 3);
        assert(profiles[0].name == "bear");
        assert(profiles[1].name == "identity");
        assert(profiles[2].name == "tight");
        assert(profiles[0].expected_return == "not validated");
        assert(profiles[1].expected_return == "Unknown");
    }

    {
        // identity parameters reproduce the raw run
        const auto raw = rawCycles();
        const auto out = manager.applyProfile(raw, "identity", 100.0);
        assert(out.info.profile_applied);
        assert(out.cycles.size() == raw.size());
        for (size_t i = 0; i < raw.size(); ++i) {
            assert(near(out.cycles[i].total_value, raw[i].total_value));
            assert(out.cycles[i].calibration_applied);
        }
        assert(near(out.info.adjustment, 0.0));
        assert(near(out.info.total_trading_costs, 0.0));
    }

    {
        const auto raw = rawCycles();
        const auto params = tightParameters();
        const auto out = manager.applyProfile(raw, "tight", 100.0);
        assert(out.info.profile_applied);
        assert(out.info.error.empty());

        // bounds hold on the capped return of every cycle
        for (const auto& c : out.cycles) {
            assert(c.capped_return <= params.max_daily_return + 1e-12);
            assert(c.capped_return >= params.min_daily_return - 1e-12);
            assert(c.calibration_profile == "tight");
        }
        assert(near(out.cycles[0].raw_return, 0.10));
        assert(near(out.cycles[0].capped_return, 0.01));
        assert(near(out.cycles[1].capped_return, -0.01));
        assert(near(out.cycles[3].raw_return, 0.0));

        const double net = 0.01 - 0.0005 - 0.0002 - 0.002;
        assert(near(out.cycles[0].total_value, 100.0 * (1.0 + net)));
        assert(near(out.cycles[0].trading_costs, 100.0 * 0.002));

        // reserve share carried over, including the protected cycle
        assert(near(out.cycles[0].reserve_value, out.cycles[0].total_value * 0.05));
        assert(near(out.cycles[3].reserve_value, out.cycles[3].total_value));
        assert(near(out.cycles[3].portfolio_value, 0.0));

        // input untouched
        assert(!raw[0].calibration_applied);
        assert(near(raw[0].total_value, 110.0));

        // same raw input, same answer; calibrated input drifts further
        const auto again = manager.applyProfile(raw, "tight", 100.0);
        assert(near(again.info.adjustment, out.info.adjustment));
        const auto twice = manager.applyProfile(out.cycles, "tight", 100.0);
        assert(!near(twice.info.calibrated_return, out.info.calibrated_return));
    }

    {
        // timing efficiency trims gains only; a loss inside the bounds passes through
        const auto params = tightParameters();
        assert(near(CalibrationManager::cappedReturn(-0.005, params), -0.005));
        assert(near(CalibrationManager::cappedReturn(0.005, params), 0.004));
        assert(near(CalibrationManager::cappedReturn(-0.05, params), -0.01));

        const auto raw = cyclesFrom({99.5, 99.9975});
        const auto out = manager.applyProfile(raw, "tight", 100.0);
        assert(out.info.profile_applied);
        assert(near(out.cycles[0].raw_return, -0.005));
        assert(near(out.cycles[0].capped_return, out.cycles[0].raw_return));
        assert(!near(out.cycles[0].capped_return, -0.005 * params.market_timing_efficiency));
        assert(near(out.cycles[1].raw_return, 0.005));
        assert(near(out.cycles[1].capped_return, 0.004));

        const double net = -0.005 - 0.0005 - 0.0002 - 0.002;
        assert(near(out.cycles[0].total_value, 100.0 * (1.0 + net)));
    }

    {
        const auto raw = rawCycles();
        const auto missing = manager.applyProfile(raw, "ghost", 100.0);
        assert(!missing.info.profile_applied);
        assert(missing.info.error == "Profile not found");
        assert(missing.cycles.size() == raw.size());
        assert(!missing.cycles[0].calibration_applied);

        const auto none = manager.applyProfile(raw, "none", 100.0);
        assert(!none.info.profile_applied);
        assert(none.info.error.empty());
        assert(CalibrationManager::isDisabledName(""));
        assert(!manager.loadProfile("none").has_value());
    }

    {
        auto bad = tightParameters();
        bad.min_daily_return = 0.05;
        assert(!CalibrationManager::validateParameters(bad).empty());
        assert(CalibrationManager::validateParameters(CalibrationParameters{}).empty());

        const auto out = manager.applyParameters(rawCycles(), bad, "bad", 100.0);
        assert(!out.info.profile_applied);
        assert(!out.info.error.empty());

        bad = tightParameters();
        bad.daily_slippage = std::nan("");
        assert(!CalibrationManager::validateParameters(bad).empty());
    }

    {
        const auto report = manager.validateCompatibility("bear", 90, 100.0);
        assert(report.compatible);
        assert(report.warnings.size() == 3);
        assert(report.profile_market == "bear_market");

        const auto fine = manager.validateCompatibility("tight", 30, 100.0);
        assert(fine.warnings.empty());

        assert(!manager.validateCompatibility("ghost", 30, 100.0).compatible);
    }

    std::cout << "[TEST] CalibrationManager PASSED\n";
    return 0;
}
