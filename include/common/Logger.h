#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace fibcycle {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // initialize() 전에는 spdlog 기본 로거로 출력 (라이브러리/테스트 코드용)
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    // 산출된 시그널 1건을 signals.log 에 CSV 한 줄로 기록
    void logSignal(const std::string& symbol, const std::string& interval,
                   const std::string& signal, const std::string& confidence,
                   double strength, double price);

private:
    Logger() = default;
    spdlog::logger* logger() {
        return main_logger_ ? main_logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) fibcycle::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) fibcycle::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) fibcycle::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) fibcycle::Logger::getInstance().error(__VA_ARGS__)

} // namespace fibcycle
