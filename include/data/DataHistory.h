#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace fibcycle {
namespace data {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close[,volume]
    // timestamp: epoch ms or "YYYY-MM-DD[ HH:MM[:SS]]" (UTC)
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array file
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Parse a timestamp cell into epoch ms
    static std::optional<long long> parseTimestamp(const std::string& cell);

    // Keep the most recent count candles
    static std::vector<Candle> keepRecent(const std::vector<Candle>& candles, int count);
};

} // namespace data
} // namespace fibcycle
