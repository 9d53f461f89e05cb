#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace rebalsim {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV line per completed cycle: run,cycle,date,start,end,regime,protected,costs
    void logCycle(const std::string& run_name, int cycle_number, const std::string& date,
                  double starting_capital, double ending_capital,
                  const std::string& regime, bool protection_active, double trading_costs);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> cycle_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) rebalsim::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) rebalsim::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) rebalsim::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) rebalsim::Logger::getInstance().error(__VA_ARGS__)

} // namespace rebalsim
