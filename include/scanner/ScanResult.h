#pragma once

#include "analytics/SignalEngine.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fibcycle {
namespace scanner {

// 심볼 1개 분석 파라미터
struct ScanParameters {
    int min_period = 20;
    int max_period = 250;
    int num_cycles = 3;
    int lookback = 5000;
    bool use_gpu = false;
    std::vector<int> fib_cycles{20, 21, 34, 55, 89};

    // min_period >= 2, min_period < max_period, num_cycles >= 1, lookback >= 1
    // 위반 시 std::invalid_argument
    void validate() const;
};

// 차트용 사이클 1개 데이터 (표시 구간 기준)
struct CyclePlot {
    std::vector<double> fld;
    bool bullish = false;
    std::string color;
    std::optional<std::vector<double>> wave;  // 마지막 100봉 합성 파형
};

// 차트 마커용 교차 지점
struct PlotCrossing {
    size_t index = 0;       // 표시 구간 기준 인덱스
    std::string date;
    double price = 0.0;
    analytics::CrossingType type = analytics::CrossingType::BULLISH;
    int cycle = 0;
};

// 최근 250봉 차트 데이터
struct PlotData {
    std::string symbol;
    std::vector<std::string> dates;
    std::vector<double> open;
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
    std::vector<double> volume;
    std::map<int, CyclePlot> cycles;
    std::vector<PlotCrossing> crossings;
};

struct ScanResult {
    std::string symbol;
    std::string interval;
    double last_price = 0.0;
    std::string last_date;

    std::vector<int> cycles;
    std::vector<double> powers;
    analytics::CycleStateMap cycle_states;

    double combined_strength = 0.0;
    bool has_key_cycles = false;

    analytics::SignalType signal = analytics::SignalType::NEUTRAL;
    analytics::Confidence confidence = analytics::Confidence::LOW;
    analytics::Guidance guidance;

    PlotData plot_data;
};

} // namespace scanner
} // namespace fibcycle
