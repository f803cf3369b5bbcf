#pragma once

#include "common/Types.h"
#include "analytics/SpectrumBackend.h"
#include <memory>
#include <vector>

namespace fibcycle {
namespace analytics {

// 지배 사이클 탐지 결과. periods/powers 는 같은 순서 (power 내림차순)
struct CycleDetectionResult {
    std::vector<int> periods;
    std::vector<double> powers;
    bool fallback = false;  // 예외로 인해 고정 피보나치 세트를 반환한 경우
};

// 특정 사이클 길이 기준 고점/저점 인덱스
struct CycleExtremes {
    std::vector<size_t> peaks;
    std::vector<size_t> troughs;
    std::vector<double> peak_prominences;
    std::vector<double> trough_prominences;
};

// Cycle Detector - 스펙트럼 분석으로 지배 사이클 길이 탐지
class CycleDetector {
public:
    explicit CycleDetector(std::shared_ptr<ISpectrumBackend> backend);

    // use_gpu: 가속 백엔드 요청 (불가능하면 CPU 로 폴백)
    static CycleDetector create(bool use_gpu);

    // 가격 시계열에서 상위 num_cycles 개의 사이클 탐지
    // 어떤 예외가 나도 던지지 않고 {21, 34, 55} 폴백을 반환
    CycleDetectionResult detectCycles(const std::vector<double>& series,
                                      int min_period = 20,
                                      int max_period = 250,
                                      int num_cycles = 3) const;

    // 봉 데이터 입력 - 종가 사용
    CycleDetectionResult detectCycles(const std::vector<Candle>& candles,
                                      int min_period = 20,
                                      int max_period = 250,
                                      int num_cycles = 3) const;

    // 사이클 길이에 맞춘 고점/저점 탐지
    // 최소 간격 int(cycle * 0.6), 최소 prominence 0.5 * 표준편차
    static CycleExtremes detectCycleExtremes(const std::vector<double>& series, int cycle_length);

    // 합성 사이클 파형 sin(linspace(0, 2*pi*num_points/length, num_points) + phase_shift)
    static std::vector<double> generateCycleWave(int length, int num_points, double phase_shift = 0.0);

    // 부족분을 채우는 피보나치 사이클 {21, 34, 55, 89, 144, 233}
    static const std::vector<int>& paddingPeriods();

private:
    CycleDetectionResult runDetection(const std::vector<double>& series,
                                      int min_period, int max_period, int num_cycles) const;
    static CycleDetectionResult fallbackResult();

    std::shared_ptr<ISpectrumBackend> backend_;
};

} // namespace analytics
} // namespace fibcycle
