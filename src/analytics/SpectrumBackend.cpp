#include "analytics/SpectrumBackend.h"
#include "common/Logger.h"

#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cmath>
#include <complex>
#include <mutex>
#include <thread>

namespace fibcycle {
namespace analytics {

std::vector<double> CpuSpectrumBackend::magnitudes(const std::vector<double>& series) const {
    std::vector<double> result;
    if (series.empty()) return result;

    Eigen::FFT<double> fft;
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, series);

    result.reserve(spectrum.size());
    for (const auto& value : spectrum) {
        result.push_back(std::abs(value));
    }
    return result;
}

ParallelSpectrumBackend::ParallelSpectrumBackend(unsigned int thread_count)
    : thread_count_(thread_count)
{
    if (thread_count_ == 0) {
        thread_count_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

bool ParallelSpectrumBackend::isAvailable() {
    return std::thread::hardware_concurrency() > 1;
}

std::vector<double> ParallelSpectrumBackend::magnitudes(const std::vector<double>& series) const {
    const size_t n = series.size();
    std::vector<double> result(n, 0.0);
    if (n == 0) return result;

    // twiddle 테이블: (k*t) mod n 으로 인덱싱해서 각도 오차 누적을 막음
    const double two_pi = 2.0 * std::acos(-1.0);
    std::vector<double> cos_table(n);
    std::vector<double> sin_table(n);
    for (size_t i = 0; i < n; ++i) {
        const double angle = two_pi * static_cast<double>(i) / static_cast<double>(n);
        cos_table[i] = std::cos(angle);
        sin_table[i] = std::sin(angle);
    }

    // 실수 입력이므로 |X[n-k]| == |X[k]|, 절반만 계산 후 반사
    const size_t half = n / 2;

    auto compute_range = [&](size_t k_begin, size_t k_end) {
        for (size_t k = k_begin; k < k_end; ++k) {
            double re = 0.0;
            double im = 0.0;
            unsigned long long idx = 0;
            for (size_t t = 0; t < n; ++t) {
                re += series[t] * cos_table[idx];
                im -= series[t] * sin_table[idx];
                idx += k;
                if (idx >= n) idx -= n;
            }
            result[k] = std::hypot(re, im);
        }
    };

    const size_t bins = half + 1;
    const size_t workers = std::min<size_t>(thread_count_, bins);
    const size_t per_worker = (bins + workers - 1) / workers;

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        const size_t begin = w * per_worker;
        const size_t end = std::min(bins, begin + per_worker);
        if (begin >= end) break;
        threads.emplace_back(compute_range, begin, end);
    }
    for (auto& th : threads) {
        th.join();
    }

    for (size_t k = half + 1; k < n; ++k) {
        result[k] = result[n - k];
    }
    return result;
}

std::shared_ptr<ISpectrumBackend> createSpectrumBackend(bool use_accelerated) {
    if (use_accelerated) {
        if (ParallelSpectrumBackend::isAvailable()) {
            return std::make_shared<ParallelSpectrumBackend>();
        }
        static std::once_flag fallback_notice;
        std::call_once(fallback_notice, [] {
            LOG_INFO("Accelerated spectrum backend not available, using CPU FFT");
        });
    }
    return std::make_shared<CpuSpectrumBackend>();
}

} // namespace analytics
} // namespace fibcycle
