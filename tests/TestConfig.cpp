#include "common/Config.h"
#include "common/Logger.h"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

// Simple manual test runner
int main() {
    using namespace fibcycle;

    spdlog::set_level(spdlog::level::debug);
    unsetenv("FIBCYCLE_DATA_DIR");

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. 파일 없음 -> 기본값
    {
        auto config = Config::load("/nonexistent/fibcycle/config.json");
        assert(config.default_exchange == "NSE");
        assert(config.default_interval == "daily");
        assert(config.analysis.lookback == 5000);
        assert(config.cache_expiry_seconds == 86400);
        assert(config.analysis.min_period == 20);
        assert(config.analysis.max_period == 250);
        assert(config.analysis.num_cycles == 3);
        assert((config.analysis.fib_cycles == std::vector<int>{20, 21, 34, 55, 89}));
        assert(!config.analysis.use_gpu);
        assert(config.max_workers == 5);
    }

    // 2. 파일에서 일부 키만 덮어씀
    const auto dir = std::filesystem::temp_directory_path() / "fibcycle_test_config";
    std::filesystem::create_directories(dir);
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({
            "general": {"default_exchange": "BSE", "default_lookback": 1000, "data_dir": "/tmp/fc"},
            "analysis": {"min_period": 10, "num_cycles": 5},
            "performance": {"use_gpu": true, "max_workers": 8}
        })";
    }
    {
        auto config = Config::load(path.string());
        assert(config.default_exchange == "BSE");
        assert(config.default_interval == "daily");
        assert(config.analysis.lookback == 1000);
        assert(config.data_dir == "/tmp/fc");
        assert(config.analysis.min_period == 10);
        assert(config.analysis.max_period == 250);
        assert(config.analysis.num_cycles == 5);
        assert(config.analysis.use_gpu);
        assert(config.max_workers == 8);
    }

    // 3. 환경 변수가 data_dir 을 덮어씀
    {
        setenv("FIBCYCLE_DATA_DIR", "/srv/market", 1);
        auto config = Config::load(path.string());
        assert(config.data_dir == "/srv/market");
        unsetenv("FIBCYCLE_DATA_DIR");
    }

    // 4. 잘못된 분석 파라미터 -> 분석 기본값 (lookback 은 유지)
    {
        nlohmann::json j = {
            {"general", {{"default_lookback", 800}}},
            {"analysis", {{"min_period", 300}, {"max_period", 100}}}
        };
        auto config = Config::fromJson(j);
        assert(config.analysis.min_period == 20);
        assert(config.analysis.max_period == 250);
        assert(config.analysis.lookback == 800);
    }

    // 5. 깨진 JSON -> 기본값
    {
        std::ofstream out(path);
        out << "{ not json";
        out.close();
        auto config = Config::load(path.string());
        assert(config.default_exchange == "NSE");
    }

    // 6. toJson -> fromJson 은 같은 값
    {
        AppConfig original;
        original.default_exchange = "NYSE";
        original.max_workers = 3;
        original.analysis.num_cycles = 4;
        auto restored = Config::fromJson(Config::toJson(original));
        assert(restored.default_exchange == "NYSE");
        assert(restored.max_workers == 3);
        assert(restored.analysis.num_cycles == 4);
    }

    // 7. ScanParameters 검증
    {
        scanner::ScanParameters params;
        params.validate();

        bool threw = false;
        params.num_cycles = 0;
        try { params.validate(); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
