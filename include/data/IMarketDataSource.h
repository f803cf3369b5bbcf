#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace fibcycle {
namespace data {

// 시세 조회 계약
// 과거 -> 최신 순, 최대 n_bars 개. 데이터가 없으면 nullopt
// 여러 워커 스레드에서 동시에 호출될 수 있음
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    virtual std::optional<CandleSeries> getData(
        const std::string& symbol,
        const std::string& exchange,
        const std::string& interval,
        int n_bars
    ) = 0;
};

} // namespace data
} // namespace fibcycle
