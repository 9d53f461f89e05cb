#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace rebalsim {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/rebalsim.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        cycle_logger_ = spdlog::daily_logger_mt("cycles", logs_path.string() + "/cycles.log");
        cycle_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logCycle(const std::string& run_name, int cycle_number, const std::string& date,
                      double starting_capital, double ending_capital,
                      const std::string& regime, bool protection_active, double trading_costs) {
    if (cycle_logger_) {
        std::ostringstream oss;
        oss << run_name << "," << cycle_number << "," << date << ","
            << std::fixed << std::setprecision(4) << starting_capital << ","
            << std::fixed << std::setprecision(4) << ending_capital << ","
            << regime << "," << (protection_active ? 1 : 0) << ","
            << std::fixed << std::setprecision(6) << trading_costs;
        cycle_logger_->info(oss.str());
    }
}

} // namespace rebalsim
