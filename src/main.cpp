#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "backtest/FilePriceHistoryProvider.h"
#include "backtest/SimulationEngine.h"
#include "backtest/SimulationSchema.h"
#include "core/state/CalibrationProfileStoreJson.h"
#include "core/state/CycleJournalJsonl.h"
#include "engine/CalibrationManager.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace rebalsim;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::optional<std::string> profile;
    std::optional<int> days;
    std::optional<double> capital;
    std::optional<std::uint64_t> seed;
    bool list_profiles = false;
    bool help = false;
};

void printUsage() {
    std::cout << "Usage: rebalsim [--config path] [--profile name] [--days n] [--capital x]\n"
              << "                [--seed n] [--list-profiles]\n";
}

// false on an unknown flag or a malformed value
bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        try {
            if (arg == "--help" || arg == "-h") {
                options.help = true;
            } else if (arg == "--list-profiles") {
                options.list_profiles = true;
            } else if (arg == "--config") {
                auto v = next();
                if (!v) return false;
                options.config_path = *v;
            } else if (arg == "--profile") {
                auto v = next();
                if (!v) return false;
                options.profile = *v;
            } else if (arg == "--days") {
                auto v = next();
                if (!v) return false;
                options.days = std::stoi(*v);
            } else if (arg == "--capital") {
                auto v = next();
                if (!v) return false;
                options.capital = std::stod(*v);
            } else if (arg == "--seed") {
                auto v = next();
                if (!v) return false;
                options.seed = std::stoull(*v);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::filesystem::path resolve(const std::string& path) {
    return utils::PathUtils::resolveRelativePath(path);
}

void printProfiles(const engine::CalibrationManager& manager) {
    const auto profiles = manager.availableProfiles();
    std::cout << "Available calibration profiles:\n";
    std::cout << "  none  (no calibration)\n";
    for (const auto& profile : profiles) {
        std::cout << "  " << profile.name << "  (" << profile.expected_return << ", "
                  << profile.risk_level << " risk)  " << profile.description << "\n";
    }
}

bool writeResult(const std::filesystem::path& path, const backtest::SimulationResult& result) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << backtest::toJson(result).dump(2);
    return static_cast<bool>(out);
}

void printSummary(const backtest::SimulationResult& result) {
    const auto& s = result.final_summary;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n==== " << result.run_name << " ====\n"
              << "Status:            " << (result.success ? "completed" : "failed") << "\n";
    if (!result.success) {
        std::cout << "Reason:            " << result.failure_reason << "\n";
    }
    std::cout << "Cycles:            " << result.total_cycles << "\n"
              << "Starting capital:  " << s.starting_capital << "\n"
              << "Final capital:     " << s.final_capital << "\n"
              << "Total return:      " << s.total_return << "%\n"
              << "Trading costs:     " << s.total_trading_costs << "\n"
              << "Protected cycles:  " << s.protection_cycles
              << " (entries " << s.protection_entries << ", exits " << s.protection_exits << ")\n"
              << "Data (real/synth): " << s.real_data_cycles << "/" << s.synthetic_data_cycles << "\n";
    if (result.calibration_info.profile_applied) {
        std::cout << "Calibration:       " << result.calibration_info.profile_name
                  << " (" << result.calibration_info.original_return << "% -> "
                  << result.calibration_info.calibrated_return << "%)\n";
    } else if (!result.calibration_info.error.empty()) {
        std::cout << "Calibration:       skipped (" << result.calibration_info.error << ")\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 1;
    }
    if (options.help) {
        printUsage();
        return 0;
    }

    Config config;
    config.load(options.config_path);

    auto& sim = config.mutableSimulationConfig();
    if (options.profile) {
        config.setCalibrationProfile(*options.profile);
        config.setCalibrationEnabled(true);
    }
    if (options.days) sim.duration_days = *options.days;
    if (options.capital) sim.starting_capital = *options.capital;
    if (options.seed) sim.random_seed = *options.seed;

    try {
        Logger::getInstance().initialize(resolve(config.getPaths().log_dir).string(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << "\n";
        return 1;
    }

    auto profile_store = std::make_shared<core::CalibrationProfileStoreJson>(
        resolve(config.getCalibrationSettings().profiles_dir));
    auto calibration = std::make_shared<engine::CalibrationManager>(profile_store);

    if (options.list_profiles) {
        printProfiles(*calibration);
        return 0;
    }

    std::shared_ptr<core::IPriceHistoryProvider> provider;
    const auto price_dir = resolve(config.getPaths().price_data_dir);
    if (std::filesystem::is_directory(price_dir)) {
        provider = std::make_shared<backtest::FilePriceHistoryProvider>(price_dir);
        LOG_INFO("Price data directory: {}", price_dir.string());
    } else {
        LOG_WARN("Price data directory {} not found, all returns will be synthetic", price_dir.string());
    }

    auto journal = std::make_shared<core::CycleJournalJsonl>(resolve(config.getPaths().journal_path));
    auto random = std::make_shared<MersenneRandomSource>(sim.random_seed);

    backtest::SimulationEngine engine(config.getSimulationConfig(), config.getStrategyConfig(),
                                      provider, calibration, random, journal);
    const auto result = engine.run();

    const auto result_path = resolve(config.getPaths().result_path);
    if (writeResult(result_path, result)) {
        LOG_INFO("Result written to {}", result_path.string());
    } else {
        LOG_ERROR("Failed to write result to {}", result_path.string());
    }

    printSummary(result);
    return result.success ? 0 : 2;
}
