#include "backtest/SimulationEngine.h"
#include "backtest/SyntheticReturnModel.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rebalsim;
using rebalsim::backtest::DataSource;
using rebalsim::backtest::SimulationEngine;
using rebalsim::backtest::SimulationResult;

namespace {

const long long kStartMs = 1704067200000LL;  // 2024-01-01

// Daily candles per symbol; throws on every request when `failing` is set
class TableProvider : public core::IPriceHistoryProvider {
public:
    explicit TableProvider(bool failing = false) : failing_(failing) {}

    void addPath(const std::string& symbol, const std::vector<double>& cycle_returns, int warmup_days = 30) {
        auto& rows = table_[symbol];
        double close = 100.0;
        for (int d = -warmup_days; d < 0; ++d) {
            if (d > -warmup_days) {
                close *= 1.005;
            }
            rows.emplace_back(close, close, close, close, 1.0, kStartMs + d * utils::kMillisPerDay);
        }
        for (size_t d = 0; d < cycle_returns.size(); ++d) {
            close *= 1.0 + cycle_returns[d];
            rows.emplace_back(close, close, close, close, 1.0,
                              kStartMs + static_cast<long long>(d) * utils::kMillisPerDay);
        }
    }

    std::vector<Candle> getHistory(const std::string& symbol, const std::string&,
                                   int lookback, long long end_timestamp_ms) override {
        ++calls_;
        if (failing_) {
            throw std::runtime_error("provider offline");
        }
        std::vector<Candle> out;
        auto it = table_.find(symbol);
        if (it == table_.end()) {
            return out;
        }
        for (const auto& row : it->second) {
            if (row.timestamp <= end_timestamp_ms) {
                out.push_back(row);
            }
        }
        if (lookback >= 0 && out.size() > static_cast<size_t>(lookback)) {
            out.erase(out.begin(), out.end() - lookback);
        }
        return out;
    }

    int calls() const { return calls_; }

private:
    bool failing_;
    int calls_ = 0;
    std::map<std::string, std::vector<Candle>> table_;
};

class InMemoryProfileStore : public core::ICalibrationProfileStore {
public:
    std::optional<core::CalibrationProfile> loadProfile(const std::string& name) override {
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
    bool saveProfile(const core::CalibrationProfile& profile) override {
        profiles_[profile.profile_name] = profile;
        return true;
    }

private:
    std::map<std::string, core::CalibrationProfile> profiles_;
};

class MemoryRecorder : public core::ISimulationRecorder {
public:
    bool append(const std::string&, const backtest::SimulationCycleRecord& record) override {
        records_.push_back(record);
        return true;
    }
    std::vector<backtest::SimulationCycleRecord> readFrom(std::uint64_t seq_inclusive) override {
        if (seq_inclusive == 0) {
            seq_inclusive = 1;
        }
        if (seq_inclusive > records_.size()) {
            return {};
        }
        return std::vector<backtest::SimulationCycleRecord>(records_.begin() + (seq_inclusive - 1), records_.end());
    }
    std::uint64_t lastSeq() const override { return records_.size(); }

private:
    std::vector<backtest::SimulationCycleRecord> records_;
};

class FixedRandomSource : public IRandomSource {
public:
    double normal(double mean, double) override { return mean; }
    double uniform(double low, double) override { return low; }
};

engine::SimulationConfig baseConfig(int days) {
    engine::SimulationConfig config;
    config.run_name = "test_run";
    config.start_date = "2024-01-01";
    config.duration_days = days;
    config.history_length = 30;
    config.reserve_daily_yield = 0.0001;
    return config;
}

strategy::RebalanceStrategyConfig frictionless() {
    strategy::RebalanceStrategyConfig config;
    config.selector.universe = {"BTC", "ETH", "SOL"};
    config.selector.anchors = {"BTC", "ETH"};
    config.target_coins = 3;
    config.rebalance_fee_rate = 0.0;
    config.conversion_fee_rate = 0.0;
    config.realistic_execution = false;
    return config;
}

std::shared_ptr<TableProvider> uniformMarket(const std::vector<double>& returns) {
    auto provider = std::make_shared<TableProvider>();
    for (const auto& symbol : frictionless().selector.universe) {
        provider->addPath(symbol, returns);
    }
    return provider;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

} // namespace

int main() {
    {
        assert(SimulationEngine::plannedCycles(baseConfig(30)) == 30);
        auto hourly = baseConfig(2);
        hourly.cycle_length_minutes = 60;
        assert(SimulationEngine::plannedCycles(hourly) == 48);
        hourly.max_cycles = 10;
        assert(SimulationEngine::plannedCycles(hourly) == 10);
        assert(SimulationEngine::plannedCycles(baseConfig(0)) == 0);
    }

    {
        // quiet market on real data: capital compounds exactly the asset returns
        const std::vector<double> returns{0.01, -0.005, 0.02, 0.003, -0.002, 0.015, 0.007};
        auto provider = uniformMarket(returns);

        auto store = std::make_shared<InMemoryProfileStore>();
        core::CalibrationProfile identity;
        identity.profile_name = "identity";
        store->saveProfile(identity);
        auto calibration = std::make_shared<engine::CalibrationManager>(store);

        auto config = baseConfig(7);
        config.enable_calibration = true;
        config.calibration_profile = "identity";

        auto recorder = std::make_shared<MemoryRecorder>();
        SimulationEngine engine(config, frictionless(), provider, calibration,
                                std::make_shared<FixedRandomSource>(), recorder);
        const auto result = engine.run();

        assert(result.success);
        assert(result.total_cycles == 7);
        assert(result.final_summary.real_data_cycles == 7);
        assert(result.final_summary.synthetic_data_cycles == 0);
        assert(result.final_summary.protection_cycles == 0);

        double expected = 100.0;
        for (double r : returns) {
            expected *= 1.0 + r;
        }
        assert(near(result.final_summary.final_capital, expected, 1e-6));
        assert(result.calibration_info.profile_applied);
        assert(result.final_summary.calibration_applied);
        assert(near(result.calibration_info.adjustment, 0.0, 1e-6));

        for (size_t i = 0; i < result.cycles.size(); ++i) {
            const auto& c = result.cycles[i];
            assert(c.cycle_number == static_cast<int>(i) + 1);
            assert(c.data_source == DataSource::REAL);
            assert(near(allocationTotal(c.allocation_breakdown), 1.0, 1e-6));
            assert(near(c.reserve_value, c.total_value * config.reserve_ratio, 1e-9));
            assert(utils::toEpochMs(c.cycle_date) == kStartMs + static_cast<long long>(i) * utils::kMillisPerDay);
        }

        assert(recorder->lastSeq() == 7);
        assert(recorder->readFrom(1).front().cycle_number == 1);
    }

    {
        // steady -3% days trip capital protection on the third cycle
        auto provider = uniformMarket(std::vector<double>(6, -0.03));
        auto config = baseConfig(6);
        SimulationEngine engine(config, frictionless(), provider, nullptr, std::make_shared<FixedRandomSource>());
        const auto result = engine.run();

        assert(result.success);
        assert(!result.cycles[0].protection_active);
        assert(!result.cycles[1].protection_active);
        const auto& entered = result.cycles[2];
        assert(entered.protection_active);
        assert(entered.data_source == DataSource::RESERVE);
        assert(entered.allocation_breakdown.size() == 1);
        assert(near(entered.allocation_breakdown.at("USDC"), 1.0));
        assert(near(entered.reserve_value, entered.total_value));
        assert(near(entered.ending_capital, entered.starting_capital * (1.0 + config.reserve_daily_yield)));
        assert(result.final_summary.protection_entries >= 1);
        assert(result.final_summary.protection_cycles >= 1);
        assert(result.final_summary.final_capital > 100.0 * std::pow(0.97, 6));
    }

    {
        // same seed, same run; a different seed moves the synthetic path
        auto config = baseConfig(20);
        config.random_seed = 7;
        SimulationEngine first(config, frictionless(), nullptr, nullptr);
        SimulationEngine second(config, frictionless(), nullptr, nullptr);
        const auto a = first.run();
        const auto b = second.run();
        assert(a.success && b.success);
        assert(a.total_cycles == 20);
        assert(a.final_summary.synthetic_data_cycles + a.final_summary.protection_cycles == 20);
        assert(a.final_summary.real_data_cycles == 0);
        assert(a.final_summary.final_capital == b.final_summary.final_capital);
        for (size_t i = 0; i < a.cycles.size(); ++i) {
            assert(a.cycles[i].cycle_return == b.cycles[i].cycle_return);
        }

        config.random_seed = 8;
        SimulationEngine third(config, frictionless(), nullptr, nullptr);
        assert(third.run().final_summary.final_capital != a.final_summary.final_capital);

        // run() starts from scratch each time
        const auto rerun = first.run();
        assert(rerun.total_cycles == a.total_cycles);
    }

    {
        // provider failures degrade to synthetic returns instead of aborting
        auto provider = std::make_shared<TableProvider>(true);
        SimulationEngine engine(baseConfig(5), frictionless(), provider, nullptr,
                                std::make_shared<MersenneRandomSource>(3));
        const auto result = engine.run();
        assert(result.success);
        assert(result.total_cycles == 5);
        assert(result.final_summary.real_data_cycles == 0);
        assert(provider->calls() > 0);
        for (const auto& c : result.cycles) {
            assert(c.data_source != DataSource::REAL);
            assert(c.ending_capital >= 0.0);
        }
    }

    {
        // real rows stop after two days: the rest is synthetic
        auto provider = uniformMarket({0.01, 0.01});
        SimulationEngine engine(baseConfig(4), frictionless(), provider, nullptr,
                                std::make_shared<FixedRandomSource>());
        const auto result = engine.run();
        assert(result.success);
        assert(result.cycles[0].data_source == DataSource::REAL);
        assert(result.cycles[1].data_source == DataSource::REAL);
        assert(result.cycles[2].data_source == DataSource::SYNTHETIC);
        assert(result.final_summary.real_data_cycles == 2);
    }

    {
        auto config = baseConfig(0);
        SimulationEngine engine(config, frictionless(), nullptr, nullptr);
        const auto result = engine.run();
        assert(!result.success);
        assert(result.total_cycles == 0);
        assert(result.cycles.empty());
        assert(!result.failure_reason.empty());
        assert(result.final_summary.final_capital == config.starting_capital);

        auto bad_date = baseConfig(5);
        bad_date.start_date = "01/02/2024";
        assert(!SimulationEngine(bad_date, frictionless(), nullptr, nullptr).run().success);

        auto empty_universe = frictionless();
        empty_universe.selector.universe.clear();
        assert(!SimulationEngine(baseConfig(5), empty_universe, nullptr, nullptr).run().success);
    }

    {
        // a missing profile leaves the raw run in place and says why
        auto calibration = std::make_shared<engine::CalibrationManager>(std::make_shared<InMemoryProfileStore>());
        auto config = baseConfig(3);
        config.enable_calibration = true;
        config.calibration_profile = "ghost";
        SimulationEngine engine(config, frictionless(), nullptr, calibration);
        const auto result = engine.run();
        assert(result.success);
        assert(!result.calibration_info.profile_applied);
        assert(result.calibration_info.error == "Profile not found");
        assert(!result.final_summary.calibration_applied);
    }

    {
        engine::SyntheticReturnConfig synthetic;
        synthetic.mode = engine::VolatilityMode::HIGH;
        backtest::SyntheticReturnModel model(synthetic, std::make_shared<FixedRandomSource>());
        const double btc = model.baseReturn("BTC");
        assert(near(btc, 0.0005 * 1.6));
        assert(near(model.patternFor("DOGE").stddev, synthetic.fallback.stddev));
        // short history: regime multiplier only
        assert(near(model.assetReturn("BTC", analytics::MarketRegime::BULL, {}), btc * 1.4));
        assert(near(model.assetReturn("BTC", analytics::MarketRegime::BEAR, {}), btc * 0.6));

        synthetic.patterns["CRASH"] = engine::ReturnPattern{-2.0, 0.0, 0.0};
        backtest::SyntheticReturnModel crash(synthetic, std::make_shared<FixedRandomSource>());
        assert(crash.assetReturn("CRASH", analytics::MarketRegime::SIDEWAYS, {}) >= -0.99);
    }

    std::cout << "[TEST] SimulationEngine PASSED\n";
    return 0;
}
