#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <iterator>

namespace fibcycle {
namespace analytics {

// EMA 벡터 계산 - 첫 값 시드
std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    if (period < 1) {
        throw std::invalid_argument("EMA period must be >= 1");
    }

    std::vector<double> ema_values;
    if (prices.empty()) return ema_values;
    ema_values.reserve(prices.size());

    const double multiplier = 2.0 / (period + 1.0);

    double ema = prices.front();
    ema_values.push_back(ema);

    for (size_t i = 1; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

std::vector<double> TechnicalIndicators::extractTypicalPrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back((candle.high + candle.low + candle.close) / 3.0);
    }

    return prices;
}

std::vector<double> TechnicalIndicators::dropNonFinite(const std::vector<double>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(out),
                 [](double v) { return std::isfinite(v); });
    return out;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

// 모표준편차 (numpy std 기본값과 동일, ddof=0)
double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

} // namespace analytics
} // namespace fibcycle
