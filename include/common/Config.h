#pragma once

#include "scanner/ScanResult.h"
#include <string>
#include <nlohmann/json.hpp>

namespace fibcycle {

// 실행 시 한 번 만들어 스캐너에 넘기는 설정 값
struct AppConfig {
    // general
    std::string default_exchange = "NSE";
    std::string default_interval = "daily";
    std::string symbols_file_path = "./data/symbols.csv";
    std::string report_dir = "./data/reports";
    std::string data_dir = "./data";
    int cache_expiry_seconds = 86400;
    std::string log_dir = "logs";
    std::string log_level = "info";

    // analysis (lookback 은 general.default_lookback)
    scanner::ScanParameters analysis;

    // performance
    int max_workers = 5;
};

class Config {
public:
    // 파일이 없거나 키가 빠지면 기본값. FIBCYCLE_DATA_DIR 환경 변수가 data_dir 을 덮어씀
    static AppConfig load(const std::string& config_path);

    // 이미 파싱된 JSON 에서 읽기 (환경 변수 적용 포함)
    static AppConfig fromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const AppConfig& config);
};

} // namespace fibcycle
