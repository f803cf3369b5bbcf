#pragma once

#include "analytics/CycleDetector.h"
#include "data/IMarketDataSource.h"
#include "scanner/ScanMetrics.h"
#include "scanner/ScanResult.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fibcycle {
namespace scanner {

struct ScannerSettings {
    std::string exchange = "NSE";
    ScanParameters default_params;
    int max_workers = 5;
};

// 배치 간 대기 함수. 테스트에서는 실제로 자지 않는 함수로 대체
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Cycle Scanner - 심볼별 사이클 분석 및 배치 스캔
class CycleScanner {
public:
    static constexpr size_t kBatchSize = 10;
    static constexpr std::chrono::milliseconds kBatchDelay{2000};
    static constexpr size_t kMinBars = 100;
    static constexpr size_t kPlotBars = 250;
    static constexpr int kWaveBars = 100;

    CycleScanner(std::shared_ptr<data::IMarketDataSource> source,
                 ScannerSettings settings = ScannerSettings{},
                 Sleeper sleeper = Sleeper{});

    // 심볼 1개 분석. 데이터 부족/사이클 없음/예외 시 nullopt
    std::optional<ScanResult> analyzeSymbol(const std::string& symbol,
                                            const std::string& interval);
    std::optional<ScanResult> analyzeSymbol(const std::string& symbol,
                                            const std::string& interval,
                                            const ScanParameters& params);

    // 10개씩 끊어서 병렬 분석, 배치 사이 2초 대기
    // 결과는 |combined_strength| 내림차순
    std::vector<ScanResult> scanBatch(const std::vector<std::string>& symbols,
                                      const std::string& interval);
    std::vector<ScanResult> scanBatch(const std::vector<std::string>& symbols,
                                      const std::string& interval,
                                      const ScanParameters& params,
                                      std::optional<int> max_workers = std::nullopt);

    // 최근 250봉 기준 차트 데이터
    static PlotData generatePlotData(const std::string& symbol,
                                     const CandleSeries& candles,
                                     const std::vector<int>& cycles,
                                     const analytics::CycleStateMap& cycle_states,
                                     const std::map<int, std::vector<double>>& reference_lines);

    static std::string cycleColor(int cycle);

    const ScannerSettings& settings() const { return settings_; }
    ScanMetrics& metrics() { return metrics_; }
    const ScanMetrics& metrics() const { return metrics_; }

private:
    std::optional<ScanResult> runAnalysis(const std::string& symbol,
                                          const std::string& interval,
                                          const ScanParameters& params);
    const analytics::CycleDetector& detectorFor(bool use_gpu) const;

    std::shared_ptr<data::IMarketDataSource> source_;
    ScannerSettings settings_;
    Sleeper sleeper_;
    ScanMetrics metrics_;

    analytics::CycleDetector cpu_detector_;
    analytics::CycleDetector accelerated_detector_;
};

} // namespace scanner
} // namespace fibcycle
