#include "data/CsvMarketDataSource.h"
#include "data/DataHistory.h"
#include "common/Logger.h"

namespace fibcycle {
namespace data {

CsvMarketDataSource::CsvMarketDataSource(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir))
{
}

std::optional<std::filesystem::path> CsvMarketDataSource::resolveFile(const std::string& symbol,
                                                                      const std::string& exchange,
                                                                      const std::string& interval) const {
    const std::string stem = symbol + "_" + interval;
    const std::filesystem::path dirs[] = {data_dir_ / exchange, data_dir_};

    for (const auto& dir : dirs) {
        for (const char* ext : {".csv", ".json"}) {
            auto candidate = dir / (stem + ext);
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::optional<CandleSeries> CsvMarketDataSource::getData(const std::string& symbol,
                                                         const std::string& exchange,
                                                         const std::string& interval,
                                                         int n_bars) {
    auto file = resolveFile(symbol, exchange, interval);
    if (!file) {
        LOG_WARN("No data file for {} ({}, {}) under {}", symbol, exchange, interval, data_dir_.string());
        return std::nullopt;
    }

    CandleSeries candles = (file->extension() == ".json")
        ? DataHistory::loadJSON(file->string())
        : DataHistory::loadCSV(file->string());

    if (candles.empty()) {
        return std::nullopt;
    }
    return DataHistory::keepRecent(candles, n_bars);
}

} // namespace data
} // namespace fibcycle
