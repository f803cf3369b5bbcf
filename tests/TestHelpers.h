#pragma once

#include "common/Types.h"
#include <cmath>

namespace fibcycle {
namespace testing {

// 평균 base, 진폭 amplitude 인 순수 사인 봉 (추세 없음)
inline CandleSeries makeSineCandles(size_t bars, int period, double amplitude = 10.0,
                                    double base = 100.0, double phase = 0.0) {
    const double two_pi = 2.0 * std::acos(-1.0);
    const long long day_ms = 24LL * 60 * 60 * 1000;
    const long long start_ms = 1577836800000LL;  // 2020-01-01

    CandleSeries candles;
    candles.reserve(bars);
    for (size_t i = 0; i < bars; ++i) {
        const double close = base + amplitude * std::sin(two_pi * static_cast<double>(i) / period + phase);
        // high/low 대칭 -> typical price 는 close 와 거의 같음
        candles.emplace_back(close, close + 1.0, close - 1.0, close, 1000.0,
                             start_ms + static_cast<long long>(i) * day_ms);
    }
    return candles;
}

inline bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

} // namespace testing
} // namespace fibcycle
