#pragma once

#include <vector>
#include "common/Types.h"

namespace fibcycle {
namespace analytics {

// 사이클/FLD 계산에 쓰는 기본 지표 모음
class TechnicalIndicators {
public:
    // EMA (Exponential Moving Average)
    // 첫 값으로 시드, 입력과 같은 길이를 반환 (lookahead 없음)
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // 가격 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

    // Typical Price (H+L+C)/3
    static std::vector<double> extractTypicalPrices(const std::vector<Candle>& candles);

    // NaN/inf 제거
    static std::vector<double> dropNonFinite(const std::vector<double>& values);

    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace fibcycle
