#pragma once

#include <memory>
#include <string>
#include <vector>

namespace fibcycle {
namespace analytics {

// 진폭 스펙트럼(|DFT|) 계산 전략
// 구현체끼리 같은 입력에 대해 수치적으로 동일한 결과를 내야 함
class ISpectrumBackend {
public:
    virtual ~ISpectrumBackend() = default;

    virtual std::string name() const = 0;

    // 길이 n 입력 -> 길이 n 진폭 배열 (bin k 의 주파수 = k/n, numpy fftfreq 규약)
    virtual std::vector<double> magnitudes(const std::vector<double>& series) const = 0;
};

// Eigen FFT (kissfft) 기반 CPU 경로
class CpuSpectrumBackend : public ISpectrumBackend {
public:
    std::string name() const override { return "cpu-fft"; }
    std::vector<double> magnitudes(const std::vector<double>& series) const override;
};

// 가속 경로 - bin 단위로 워커 스레드에 분산한 직접 DFT
// O(n^2) 이라 긴 시계열에서는 Eigen FFT 보다 느림, 백엔드 교체 지점 검증용 참조 변환
class ParallelSpectrumBackend : public ISpectrumBackend {
public:
    explicit ParallelSpectrumBackend(unsigned int thread_count = 0);

    std::string name() const override { return "parallel-dft"; }
    std::vector<double> magnitudes(const std::vector<double>& series) const override;

    // 하드웨어 스레드가 2개 이상일 때만 의미가 있음
    static bool isAvailable();

private:
    unsigned int thread_count_;
};

// use_accelerated 가 true 이고 가속 경로가 가능하면 ParallelSpectrumBackend,
// 아니면 조용히 CpuSpectrumBackend
std::shared_ptr<ISpectrumBackend> createSpectrumBackend(bool use_accelerated);

} // namespace analytics
} // namespace fibcycle
