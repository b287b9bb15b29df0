#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace sigscan {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);

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

    // one CSV row per new signal
    void logSignal(const std::string& trader_id, const std::string& symbol,
                   const std::string& interval, double price, long long timestamp_ms);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) sigscan::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) sigscan::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) sigscan::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) sigscan::Logger::getInstance().error(__VA_ARGS__)

} // namespace sigscan
