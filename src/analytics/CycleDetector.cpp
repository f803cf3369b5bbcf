#include "analytics/CycleDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <stdexcept>

namespace fibcycle {
namespace analytics {

namespace {

// 평탄한 고점(plateau)은 가운데 인덱스로 취급
std::vector<size_t> findLocalMaxima(const std::vector<double>& x) {
    std::vector<size_t> maxima;
    if (x.size() < 3) return maxima;

    const size_t i_max = x.size() - 1;
    size_t i = 1;
    while (i < i_max) {
        if (x[i - 1] < x[i]) {
            size_t i_ahead = i + 1;
            while (i_ahead < i_max && x[i_ahead] == x[i]) {
                ++i_ahead;
            }
            if (x[i_ahead] < x[i]) {
                const size_t left = i;
                const size_t right = i_ahead - 1;
                maxima.push_back((left + right) / 2);
                i = i_ahead;
            }
        }
        ++i;
    }
    return maxima;
}

// 높은 고점 우선으로, distance 미만으로 붙어 있는 낮은 고점 제거
std::vector<size_t> selectByPeakDistance(const std::vector<size_t>& peaks,
                                         const std::vector<double>& x,
                                         size_t distance) {
    const size_t count = peaks.size();
    std::vector<bool> keep(count, true);

    std::vector<size_t> priority(count);
    std::iota(priority.begin(), priority.end(), 0);
    std::stable_sort(priority.begin(), priority.end(),
        [&](size_t a, size_t b) { return x[peaks[a]] < x[peaks[b]]; });

    for (size_t p = count; p-- > 0;) {
        const size_t j = priority[p];
        if (!keep[j]) continue;

        size_t k = j;
        while (k > 0 && peaks[j] - peaks[k - 1] < distance) {
            keep[k - 1] = false;
            --k;
        }
        k = j + 1;
        while (k < count && peaks[k] - peaks[j] < distance) {
            keep[k] = false;
            ++k;
        }
    }

    std::vector<size_t> kept;
    for (size_t i = 0; i < count; ++i) {
        if (keep[i]) kept.push_back(peaks[i]);
    }
    return kept;
}

// 고점 양쪽으로 더 높은 값이 나올 때까지의 최저점 중 높은 쪽을 기준선으로 사용
double peakProminence(const std::vector<double>& x, size_t peak) {
    const double height = x[peak];

    double left_min = height;
    for (size_t i = peak + 1; i-- > 0;) {
        if (x[i] > height) break;
        left_min = std::min(left_min, x[i]);
    }

    double right_min = height;
    for (size_t i = peak; i < x.size(); ++i) {
        if (x[i] > height) break;
        right_min = std::min(right_min, x[i]);
    }

    return height - std::max(left_min, right_min);
}

void findPeaks(const std::vector<double>& x, size_t distance, double min_prominence,
               std::vector<size_t>& peaks_out, std::vector<double>& prominences_out) {
    auto peaks = selectByPeakDistance(findLocalMaxima(x), x, distance);
    for (size_t peak : peaks) {
        const double prominence = peakProminence(x, peak);
        if (prominence >= min_prominence) {
            peaks_out.push_back(peak);
            prominences_out.push_back(prominence);
        }
    }
}

} // namespace

CycleDetector::CycleDetector(std::shared_ptr<ISpectrumBackend> backend)
    : backend_(std::move(backend))
{
    if (!backend_) {
        backend_ = std::make_shared<CpuSpectrumBackend>();
    }
}

CycleDetector CycleDetector::create(bool use_gpu) {
    return CycleDetector(createSpectrumBackend(use_gpu));
}

const std::vector<int>& CycleDetector::paddingPeriods() {
    static const std::vector<int> periods{21, 34, 55, 89, 144, 233};
    return periods;
}

CycleDetectionResult CycleDetector::fallbackResult() {
    CycleDetectionResult result;
    result.periods = {21, 34, 55};
    result.powers = {0.8, 0.9, 0.7};
    result.fallback = true;
    return result;
}

CycleDetectionResult CycleDetector::detectCycles(const std::vector<Candle>& candles,
                                                 int min_period,
                                                 int max_period,
                                                 int num_cycles) const {
    return detectCycles(TechnicalIndicators::extractClosePrices(candles),
                        min_period, max_period, num_cycles);
}

CycleDetectionResult CycleDetector::detectCycles(const std::vector<double>& series,
                                                 int min_period,
                                                 int max_period,
                                                 int num_cycles) const {
    try {
        return runDetection(series, min_period, max_period, num_cycles);
    } catch (const std::exception& e) {
        LOG_ERROR("Error detecting cycles: {}", e.what());
        return fallbackResult();
    }
}

CycleDetectionResult CycleDetector::runDetection(const std::vector<double>& series,
                                                 int min_period,
                                                 int max_period,
                                                 int num_cycles) const {
    if (min_period < 2 || max_period <= min_period) {
        throw std::invalid_argument("invalid period range");
    }
    if (num_cycles < 1) {
        throw std::invalid_argument("num_cycles must be >= 1");
    }

    // 1. 결측치 제거
    const auto clean = TechnicalIndicators::dropNonFinite(series);
    const size_t n = clean.size();

    // 2. 장기 EMA(길이/4)로 추세 제거
    const int trend_period = static_cast<int>(n / 4);
    if (trend_period < 1) {
        throw std::invalid_argument("series too short for detrending");
    }
    const auto trend = TechnicalIndicators::calculateEMAVector(clean, trend_period);
    std::vector<double> detrended(n);
    for (size_t i = 0; i < n; ++i) {
        detrended[i] = clean[i] - trend[i];
    }

    // 3. 진폭 스펙트럼
    const auto magnitudes = backend_->magnitudes(detrended);
    if (magnitudes.size() != n) {
        throw std::runtime_error("spectrum backend returned unexpected length");
    }

    // 4. 양의 주파수 중 (1/max_period, 1/min_period) 구간만 후보
    const double bin_width = 1.0 / static_cast<double>(n);
    const double low_freq = 1.0 / static_cast<double>(max_period);
    const double high_freq = 1.0 / static_cast<double>(min_period);

    std::vector<size_t> candidates;
    for (size_t k = 1; k <= (n - 1) / 2; ++k) {
        const double freq = static_cast<double>(k) * bin_width;
        if (freq < high_freq && freq > low_freq) {
            candidates.push_back(k);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [&](size_t a, size_t b) { return magnitudes[a] > magnitudes[b]; });

    // 5. 상위 2*num_cycles 개, 최대값으로 정규화
    const size_t take = std::min(candidates.size(), static_cast<size_t>(num_cycles) * 2);
    candidates.resize(take);

    CycleDetectionResult result;
    if (!candidates.empty()) {
        const double max_magnitude = magnitudes[candidates.front()];
        if (!std::isfinite(max_magnitude) || max_magnitude <= 0.0) {
            throw std::runtime_error("degenerate spectrum (flat series)");
        }

        // 6. 반올림 주기 기준 중복 제거, 범위 확인
        std::set<int> seen;
        for (size_t k : candidates) {
            const double freq = static_cast<double>(k) * bin_width;
            // numpy round 와 같은 round-half-to-even
            const int period = static_cast<int>(std::nearbyint(1.0 / freq));
            if (period < min_period || period > max_period) continue;
            if (!seen.insert(period).second) continue;

            result.periods.push_back(period);
            result.powers.push_back(magnitudes[k] / max_magnitude);
        }
    }

    // 7. 부족하면 피보나치 사이클로 채움 (power 0.5)
    for (int period : paddingPeriods()) {
        if (result.periods.size() >= static_cast<size_t>(num_cycles)) break;
        if (std::find(result.periods.begin(), result.periods.end(), period) != result.periods.end()) {
            continue;
        }
        result.periods.push_back(period);
        result.powers.push_back(0.5);
    }

    if (result.periods.size() > static_cast<size_t>(num_cycles)) {
        result.periods.resize(num_cycles);
        result.powers.resize(num_cycles);
    }

    LOG_DEBUG("Cycles detected via {}: {} (n={})",
              backend_->name(), result.periods.size(), n);
    return result;
}

CycleExtremes CycleDetector::detectCycleExtremes(const std::vector<double>& series, int cycle_length) {
    CycleExtremes extremes;

    const size_t distance = static_cast<size_t>(std::max(0, static_cast<int>(cycle_length * 0.6)));
    if (distance < 1 || series.size() < 3) {
        return extremes;
    }

    const double mean = TechnicalIndicators::calculateMean(series);
    const double prominence = TechnicalIndicators::calculateStandardDeviation(series, mean) * 0.5;

    findPeaks(series, distance, prominence, extremes.peaks, extremes.peak_prominences);

    std::vector<double> inverted(series.size());
    std::transform(series.begin(), series.end(), inverted.begin(), [](double v) { return -v; });
    findPeaks(inverted, distance, prominence, extremes.troughs, extremes.trough_prominences);

    return extremes;
}

std::vector<double> CycleDetector::generateCycleWave(int length, int num_points, double phase_shift) {
    std::vector<double> wave;
    if (length <= 0 || num_points <= 0) return wave;

    const double two_pi = 2.0 * std::acos(-1.0);
    const double end = two_pi * (static_cast<double>(num_points) / static_cast<double>(length));
    const double step = (num_points > 1) ? end / static_cast<double>(num_points - 1) : 0.0;

    wave.reserve(num_points);
    for (int i = 0; i < num_points; ++i) {
        wave.push_back(std::sin(static_cast<double>(i) * step + phase_shift));
    }
    return wave;
}

} // namespace analytics
} // namespace fibcycle
