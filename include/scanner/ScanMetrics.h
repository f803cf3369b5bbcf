#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace fibcycle {
namespace scanner {

struct OperationStats {
    long long calls = 0;
    long long failures = 0;
    double total_ms = 0.0;
    double max_ms = 0.0;

    double averageMs() const {
        return (calls > 0) ? (total_ms / static_cast<double>(calls)) : 0.0;
    }
};

// 연산별 소요 시간 집계 (워커 스레드에서 동시에 기록)
class ScanMetrics {
public:
    void record(const std::string& operation, double elapsed_ms, bool success = true);

    OperationStats get(const std::string& operation) const;
    nlohmann::json summary() const;

    // 스코프 종료 시 경과 시간을 기록. fail() 호출 시 실패로 집계
    class ScopedTimer {
    public:
        ScopedTimer(ScanMetrics& metrics, std::string operation);
        ~ScopedTimer();
        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

        void fail() { success_ = false; }

    private:
        ScanMetrics& metrics_;
        std::string operation_;
        std::chrono::steady_clock::time_point start_;
        bool success_ = true;
    };

private:
    mutable std::mutex mutex_;
    std::map<std::string, OperationStats> stats_;
};

} // namespace scanner
} // namespace fibcycle
