#include "scanner/ScanMetrics.h"
#include <algorithm>

namespace fibcycle {
namespace scanner {

void ScanMetrics::record(const std::string& operation, double elapsed_ms, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = stats_[operation];
    s.calls++;
    if (!success) {
        s.failures++;
    }
    s.total_ms += elapsed_ms;
    s.max_ms = std::max(s.max_ms, elapsed_ms);
}

OperationStats ScanMetrics::get(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(operation);
    return (it != stats_.end()) ? it->second : OperationStats{};
}

nlohmann::json ScanMetrics::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [operation, s] : stats_) {
        j[operation] = {
            {"calls", s.calls},
            {"failures", s.failures},
            {"total_ms", s.total_ms},
            {"avg_ms", s.averageMs()},
            {"max_ms", s.max_ms}
        };
    }
    return j;
}

ScanMetrics::ScopedTimer::ScopedTimer(ScanMetrics& metrics, std::string operation)
    : metrics_(metrics)
    , operation_(std::move(operation))
    , start_(std::chrono::steady_clock::now())
{
}

ScanMetrics::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_).count();
    metrics_.record(operation_, elapsed, success_);
}

} // namespace scanner
} // namespace fibcycle
