#pragma once

#include "scanner/ScanResult.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fibcycle {
namespace scanner {

// 스캔 결과 -> JSON (리포트/대시보드 소비용)
class ResultSerializer {
public:
    static nlohmann::json toJson(const analytics::CycleState& state);
    static nlohmann::json toJson(const analytics::Guidance& guidance);
    static nlohmann::json toJson(const PlotData& plot);
    static nlohmann::json toJson(const ScanResult& result, bool include_plot = true);
    static nlohmann::json toJson(const std::vector<ScanResult>& results, bool include_plot = false);

    // 실패 시 false (로그 남김)
    static bool writeReport(const std::vector<ScanResult>& results, const std::string& path);

    // scan_<interval>_<count>_results.json
    static std::string reportFileName(const std::string& interval, size_t count);
};

} // namespace scanner
} // namespace fibcycle
