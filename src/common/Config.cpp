#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fibcycle {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

void applyEnvironment(AppConfig& config) {
    const std::string data_dir = readEnvVar("FIBCYCLE_DATA_DIR");
    if (!data_dir.empty()) {
        LOG_INFO("FIBCYCLE_DATA_DIR overrides data_dir: {}", data_dir);
        config.data_dir = data_dir;
    }
}
}

AppConfig Config::fromJson(const nlohmann::json& j) {
    AppConfig config;

    if (j.contains("general")) {
        const auto& g = j["general"];
        config.default_exchange = g.value("default_exchange", config.default_exchange);
        config.default_interval = g.value("default_interval", config.default_interval);
        config.analysis.lookback = g.value("default_lookback", config.analysis.lookback);
        config.symbols_file_path = g.value("symbols_file_path", config.symbols_file_path);
        config.report_dir = g.value("report_dir", config.report_dir);
        config.data_dir = g.value("data_dir", config.data_dir);
        config.cache_expiry_seconds = g.value("cache_expiry", config.cache_expiry_seconds);
        config.log_dir = g.value("log_dir", config.log_dir);
        config.log_level = g.value("log_level", config.log_level);
    }

    if (j.contains("analysis")) {
        const auto& a = j["analysis"];
        scanner::ScanParameters params = config.analysis;
        params.min_period = a.value("min_period", params.min_period);
        params.max_period = a.value("max_period", params.max_period);
        params.num_cycles = a.value("num_cycles", params.num_cycles);
        if (a.contains("fib_cycles")) {
            params.fib_cycles = a["fib_cycles"].get<std::vector<int>>();
        }

        try {
            params.validate();
            config.analysis = params;
        } catch (const std::invalid_argument& e) {
            LOG_WARN("Invalid analysis settings ({}), using defaults", e.what());
            const int lookback = config.analysis.lookback;
            config.analysis = scanner::ScanParameters{};
            config.analysis.lookback = lookback;
        }
    }

    if (j.contains("performance")) {
        const auto& p = j["performance"];
        config.analysis.use_gpu = p.value("use_gpu", config.analysis.use_gpu);
        config.max_workers = p.value("max_workers", config.max_workers);
        if (config.max_workers < 1) {
            LOG_WARN("performance.max_workers {} < 1, using 1", config.max_workers);
            config.max_workers = 1;
        }
    }

    if (config.analysis.lookback < 1) {
        LOG_WARN("general.default_lookback {} < 1, using 5000", config.analysis.lookback);
        config.analysis.lookback = 5000;
    }

    applyEnvironment(config);
    return config;
}

AppConfig Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        LOG_INFO("설정 파일 경로: {}", config_path.string());

        if (!std::filesystem::exists(config_path)) {
            LOG_WARN("설정 파일을 찾을 수 없습니다: {} - 기본값을 사용합니다.", config_path.string());
            return fromJson(nlohmann::json::object());
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            LOG_WARN("설정 파일을 열 수 없습니다: {}", config_path.string());
            return fromJson(nlohmann::json::object());
        }

        nlohmann::json j;
        file >> j;

        auto config = fromJson(j);
        LOG_INFO("설정 파일 로드 완료 (exchange={}, interval={}, workers={})",
                 config.default_exchange, config.default_interval, config.max_workers);
        return config;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("설정 로드 오류: {}", e.what());
        return fromJson(nlohmann::json::object());
    }
}

nlohmann::json Config::toJson(const AppConfig& config) {
    return {
        {"general", {
            {"default_exchange", config.default_exchange},
            {"default_interval", config.default_interval},
            {"default_lookback", config.analysis.lookback},
            {"symbols_file_path", config.symbols_file_path},
            {"report_dir", config.report_dir},
            {"data_dir", config.data_dir},
            {"cache_expiry", config.cache_expiry_seconds},
            {"log_dir", config.log_dir},
            {"log_level", config.log_level}
        }},
        {"analysis", {
            {"min_period", config.analysis.min_period},
            {"max_period", config.analysis.max_period},
            {"num_cycles", config.analysis.num_cycles},
            {"fib_cycles", config.analysis.fib_cycles}
        }},
        {"performance", {
            {"use_gpu", config.analysis.use_gpu},
            {"max_workers", config.max_workers}
        }}
    };
}

} // namespace fibcycle
