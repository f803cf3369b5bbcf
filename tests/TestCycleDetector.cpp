#include "analytics/CycleDetector.h"
#include "analytics/SignalEngine.h"
#include "analytics/ReferenceLineEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "TestHelpers.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <set>

using namespace fibcycle;
using namespace fibcycle::analytics;
using fibcycle::testing::makeSineCandles;

namespace {

bool contains(const std::vector<int>& v, int x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

std::vector<double> noisySeries(size_t n, unsigned int seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.5);
    const double two_pi = 2.0 * std::acos(-1.0);
    std::vector<double> series(n);
    for (size_t i = 0; i < n; ++i) {
        series[i] = 200.0 + 0.05 * i
            + 6.0 * std::sin(two_pi * i / 55.0)
            + 3.0 * std::sin(two_pi * i / 21.0 + 1.0)
            + noise(rng);
    }
    return series;
}

void testSineCycleDetected() {
    // 510 = 15 * 34, 34 봉 주기가 정확히 한 bin 에 떨어짐
    const auto candles = makeSineCandles(510, 34);
    CycleDetector detector(std::make_shared<CpuSpectrumBackend>());

    auto result = detector.detectCycles(candles, 20, 250, 3);
    assert(!result.fallback);
    assert(result.periods.size() == 3);
    assert(result.periods.front() == 34);
    assert(result.powers.front() > 0.5);
    std::cout << "  sine 510 bars -> top period " << result.periods.front() << "\n";
}

void testSine500BarsNearestBin() {
    // 500 봉에서는 34 가 bin 사이에 있어 가장 가까운 33 또는 36 으로 나옴
    const auto candles = makeSineCandles(500, 34);
    CycleDetector detector(std::make_shared<CpuSpectrumBackend>());

    auto result = detector.detectCycles(candles, 20, 250, 3);
    assert(!result.fallback);
    const int top = result.periods.front();
    assert(top == 33 || top == 36);
    assert(result.powers.front() > 0.5);
    std::cout << "  sine 500 bars -> top period " << top << "\n";
}

void testResultProperties() {
    CycleDetector detector(std::make_shared<CpuSpectrumBackend>());
    const std::set<int> padding(CycleDetector::paddingPeriods().begin(),
                                CycleDetector::paddingPeriods().end());

    for (unsigned int seed : {1u, 7u, 42u}) {
        const auto series = noisySeries(400, seed);
        for (int num_cycles : {1, 3, 5}) {
            auto result = detector.detectCycles(series, 20, 200, num_cycles);
            assert(!result.periods.empty());
            assert(result.periods.size() <= static_cast<size_t>(num_cycles));
            assert(result.periods.size() == result.powers.size());

            std::set<int> distinct(result.periods.begin(), result.periods.end());
            assert(distinct.size() == result.periods.size());

            for (size_t i = 0; i < result.periods.size(); ++i) {
                const int p = result.periods[i];
                assert((p >= 20 && p <= 200) || padding.count(p) > 0);
                assert(result.powers[i] >= 0.0 && result.powers[i] <= 1.0);
            }
        }
    }
}

void testNarrowRangePadsWithFibonacci() {
    // 후보 bin 이 하나뿐인 구간 -> 나머지는 0.5 power 로 채움
    const auto candles = makeSineCandles(510, 34);
    CycleDetector detector(std::make_shared<CpuSpectrumBackend>());

    auto result = detector.detectCycles(candles, 33, 35, 3);
    assert(result.periods.size() == 3);
    assert(result.periods[0] == 34);
    assert(result.powers[0] == 1.0);
    assert(result.periods[1] == 21 && result.powers[1] == 0.5);
    assert(result.periods[2] == 55 && result.powers[2] == 0.5);
}

void testFallbackOnFailure() {
    CycleDetector detector(std::make_shared<CpuSpectrumBackend>());

    // 평탄한 시계열 -> 스펙트럼 0
    std::vector<double> flat(300, 100.0);
    auto flat_result = detector.detectCycles(flat);
    assert(flat_result.fallback);
    assert((flat_result.periods == std::vector<int>{21, 34, 55}));
    assert(flat_result.powers[0] == 0.8 && flat_result.powers[1] == 0.9 && flat_result.powers[2] == 0.7);

    // 너무 짧음
    auto short_result = detector.detectCycles(std::vector<double>{1.0, 2.0, 3.0});
    assert(short_result.fallback);
    assert((short_result.periods == std::vector<int>{21, 34, 55}));

    // 잘못된 범위
    auto range_result = detector.detectCycles(noisySeries(300, 3), 100, 50, 3);
    assert(range_result.fallback);
}

void testBackendsAgree() {
    CpuSpectrumBackend cpu;
    ParallelSpectrumBackend parallel(4);

    for (size_t n : {257u, 400u, 510u}) {
        const auto series = noisySeries(n, static_cast<unsigned int>(n));
        const auto a = cpu.magnitudes(series);
        const auto b = parallel.magnitudes(series);
        assert(a.size() == n && b.size() == n);
        const double peak = *std::max_element(a.begin(), a.end());
        for (size_t k = 0; k < n; ++k) {
            assert(std::abs(a[k] - b[k]) <= 1e-9 * peak);
        }

        CycleDetector cpu_detector(std::make_shared<CpuSpectrumBackend>());
        CycleDetector parallel_detector(std::make_shared<ParallelSpectrumBackend>(4));
        auto ra = cpu_detector.detectCycles(series, 20, 250, 5);
        auto rb = parallel_detector.detectCycles(series, 20, 250, 5);
        assert(ra.periods == rb.periods);
        for (size_t i = 0; i < ra.powers.size(); ++i) {
            assert(std::abs(ra.powers[i] - rb.powers[i]) <= 1e-9);
        }
    }

    // 가속 요청 시에도 항상 사용 가능한 백엔드가 나옴
    auto backend = createSpectrumBackend(true);
    assert(backend != nullptr);
    assert(backend->magnitudes(noisySeries(64, 9)).size() == 64);
}

void testSignalFollowsCrossings() {
    // 34 사이클 하나만 쓰면 교차 직후 봉은 항상 Strong 시그널
    const auto candles = makeSineCandles(510, 34);
    const auto close = TechnicalIndicators::extractClosePrices(candles);
    const auto fld = ReferenceLineEngine::calculateReferenceLine(candles, 34);
    const auto crossings = ReferenceLineEngine::detectCrossings(close, fld);
    assert(crossings.size() > 10);

    CycleDetector detector(std::make_shared<CpuSpectrumBackend>());
    auto detection = detector.detectCycles(candles, 20, 250, 1);
    assert(detection.periods.size() == 1 && detection.periods.front() == 34);

    size_t checked = 0;
    for (const auto& crossing : crossings) {
        if (crossing.index < 100 || crossing.index + 2 >= candles.size()) continue;

        for (size_t after = 0; after < 2; ++after) {
            const CandleSeries prefix(candles.begin(), candles.begin() + crossing.index + after + 1);
            auto state = ReferenceLineEngine::calculateCycleState(prefix, 34);
            state.power = detection.powers.front();

            assert(state.bullish == (crossing.type == CrossingType::BULLISH));

            CycleStateMap states{{34, state}};
            const double strength = SignalEngine::combinedStrength(states);
            const auto decision = SignalEngine::determineSignal(states, strength);
            assert(decision.signal != SignalType::NEUTRAL);
            if (crossing.type == CrossingType::BULLISH) {
                assert(SignalEngine::isBuy(decision.signal));
            } else {
                assert(SignalEngine::isSell(decision.signal));
            }
        }
        ++checked;
    }
    assert(checked > 5);
}

void testCycleExtremesAndWave() {
    const auto candles = makeSineCandles(250, 34);
    const auto close = TechnicalIndicators::extractClosePrices(candles);

    auto extremes = CycleDetector::detectCycleExtremes(close, 34);
    assert(!extremes.peaks.empty());
    assert(!extremes.troughs.empty());
    assert(extremes.peaks.size() == extremes.peak_prominences.size());
    for (size_t i = 1; i < extremes.peaks.size(); ++i) {
        assert(extremes.peaks[i] - extremes.peaks[i - 1] >= static_cast<size_t>(34 * 0.6));
    }
    // 첫 고점: sin 최대값은 34/4 = 8.5 근처
    assert(extremes.peaks.front() == 8 || extremes.peaks.front() == 9);

    auto wave = CycleDetector::generateCycleWave(34, 100, 0.0);
    assert(wave.size() == 100);
    assert(wave.front() == 0.0);
    for (double v : wave) {
        assert(v >= -1.0 && v <= 1.0);
    }
    assert(CycleDetector::generateCycleWave(0, 100).empty());
}

} // namespace

int main() {
    std::cout << "[TEST] Starting CycleDetector Test..." << std::endl;

    testSineCycleDetected();
    testSine500BarsNearestBin();
    testResultProperties();
    testNarrowRangePadsWithFibonacci();
    testFallbackOnFailure();
    testBackendsAgree();
    testSignalFollowsCrossings();
    testCycleExtremesAndWave();

    std::cout << "[TEST] CycleDetector PASSED" << std::endl;
    return 0;
}
