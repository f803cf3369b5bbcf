#pragma once

#include "data/IMarketDataSource.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <tuple>

namespace fibcycle {
namespace data {

// TTL 캐시 데코레이터. 여러 워커가 동시에 읽어도 안전
// 하위 소스 호출 중에는 잠금을 잡지 않음
class CachedMarketDataSource : public IMarketDataSource {
public:
    CachedMarketDataSource(std::shared_ptr<IMarketDataSource> inner,
                           std::chrono::seconds ttl);

    std::optional<CandleSeries> getData(
        const std::string& symbol,
        const std::string& exchange,
        const std::string& interval,
        int n_bars
    ) override;

    void clear();

    long long hits() const;
    long long misses() const;

private:
    using CacheKey = std::tuple<std::string, std::string, std::string, int>;

    struct CacheEntry {
        std::optional<CandleSeries> candles;
        std::chrono::steady_clock::time_point fetched_at{};
    };

    std::shared_ptr<IMarketDataSource> inner_;
    std::chrono::seconds ttl_;

    mutable std::mutex mutex_;
    std::map<CacheKey, CacheEntry> cache_;
    long long hits_ = 0;
    long long misses_ = 0;
};

} // namespace data
} // namespace fibcycle
