#include "data/CachedMarketDataSource.h"
#include "common/Logger.h"

namespace fibcycle {
namespace data {

CachedMarketDataSource::CachedMarketDataSource(std::shared_ptr<IMarketDataSource> inner,
                                               std::chrono::seconds ttl)
    : inner_(std::move(inner))
    , ttl_(ttl)
{
}

std::optional<CandleSeries> CachedMarketDataSource::getData(const std::string& symbol,
                                                            const std::string& exchange,
                                                            const std::string& interval,
                                                            int n_bars) {
    const CacheKey key{symbol, exchange, interval, n_bars};
    const auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end() && now - it->second.fetched_at < ttl_) {
            ++hits_;
            return it->second.candles;
        }
        ++misses_;
    }

    auto candles = inner_->getData(symbol, exchange, interval, n_bars);

    // 조회 실패(nullopt)는 캐시하지 않음
    if (candles) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[key] = CacheEntry{candles, std::chrono::steady_clock::now()};
    }
    return candles;
}

void CachedMarketDataSource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    LOG_INFO("Market data cache cleared");
}

long long CachedMarketDataSource::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

long long CachedMarketDataSource::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace data
} // namespace fibcycle
