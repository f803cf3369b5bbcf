#pragma once

#include <string>
#include <vector>
#include <optional>

namespace fibcycle {

// OHLCV 한 봉. timestamp 는 epoch milliseconds (UTC)
struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 과거 -> 최신 순으로 정렬된 봉 시퀀스
using CandleSeries = std::vector<Candle>;

// epoch ms -> "YYYY-MM-DD HH:MM" (UTC)
std::string formatTimestamp(long long timestamp_ms);

} // namespace fibcycle
