#pragma once

#include "data/IMarketDataSource.h"
#include <filesystem>

namespace fibcycle {
namespace data {

// 디스크의 봉 데이터 파일을 읽는 시세 소스
// <data_dir>/<EXCHANGE>/<SYMBOL>_<interval>.csv|.json, 없으면 <data_dir>/<SYMBOL>_<interval>.*
class CsvMarketDataSource : public IMarketDataSource {
public:
    explicit CsvMarketDataSource(std::filesystem::path data_dir);

    std::optional<CandleSeries> getData(
        const std::string& symbol,
        const std::string& exchange,
        const std::string& interval,
        int n_bars
    ) override;

    std::optional<std::filesystem::path> resolveFile(const std::string& symbol,
                                                     const std::string& exchange,
                                                     const std::string& interval) const;

private:
    std::filesystem::path data_dir_;
};

} // namespace data
} // namespace fibcycle
