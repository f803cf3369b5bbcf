#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace fibcycle {
namespace analytics {

enum class CrossingType { BULLISH, BEARISH };

// 가격이 기준선(FLD)을 넘어가는 지점
struct Crossing {
    size_t index;       // 입력 시계열 기준 인덱스
    CrossingType type;
    double price;
    double reference;
};

// 사이클 하나의 현재 상태
struct CycleState {
    int cycle = 0;
    double fld_value = 0.0;
    bool bullish = false;
    bool recent_crossover = false;
    bool recent_crossunder = false;
    double power = 0.0;  // 편차 기반 [0,1]. 스캐너에서는 스펙트럼 power 로 덮어씀
};

// FLD (Future Line of Demarcation) 계산기
class ReferenceLineEngine {
public:
    // 기준선 EMA 기간 = floor(cycle_length / 2) + 1
    static int referencePeriod(int cycle_length);

    // 종가의 EMA, 첫 값으로 시드. 입력과 같은 길이
    static std::vector<double> calculateReferenceLine(const std::vector<Candle>& candles, int cycle_length);
    static std::vector<double> calculateReferenceLine(const std::vector<double>& prices, int cycle_length);

    // 상향: p[i-1] <= r[i-1] && p[i] > r[i]
    // 하향: p[i-1] >= r[i-1] && p[i] < r[i]
    // lookback 지정 시 마지막 lookback 봉만 검사, 인덱스는 입력 기준 그대로
    static std::vector<Crossing> detectCrossings(const std::vector<double>& price,
                                                 const std::vector<double>& reference,
                                                 std::optional<size_t> lookback = std::nullopt);

    // 최근 recent_bars 봉 안의 상향/하향 교차를 각각 표시 (둘 다 true 가능)
    static CycleState calculateCycleState(const std::vector<Candle>& candles,
                                          int cycle_length,
                                          const std::vector<double>& reference_line,
                                          int recent_bars = 5);

    // 기준선을 내부에서 계산하는 버전
    static CycleState calculateCycleState(const std::vector<Candle>& candles,
                                          int cycle_length,
                                          int recent_bars = 5);
};

std::string toString(CrossingType type);

} // namespace analytics
} // namespace fibcycle
