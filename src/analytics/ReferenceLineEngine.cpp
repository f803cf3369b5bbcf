#include "analytics/ReferenceLineEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fibcycle {
namespace analytics {

std::string toString(CrossingType type) {
    return type == CrossingType::BULLISH ? "bullish" : "bearish";
}

int ReferenceLineEngine::referencePeriod(int cycle_length) {
    if (cycle_length < 1) {
        throw std::invalid_argument("cycle length must be positive");
    }
    return cycle_length / 2 + 1;
}

std::vector<double> ReferenceLineEngine::calculateReferenceLine(const std::vector<Candle>& candles,
                                                                int cycle_length) {
    return calculateReferenceLine(TechnicalIndicators::extractClosePrices(candles), cycle_length);
}

std::vector<double> ReferenceLineEngine::calculateReferenceLine(const std::vector<double>& prices,
                                                                int cycle_length) {
    return TechnicalIndicators::calculateEMAVector(prices, referencePeriod(cycle_length));
}

std::vector<Crossing> ReferenceLineEngine::detectCrossings(const std::vector<double>& price,
                                                           const std::vector<double>& reference,
                                                           std::optional<size_t> lookback) {
    std::vector<Crossing> crossings;

    const size_t n = std::min(price.size(), reference.size());
    if (n < 2) return crossings;

    // 두 시계열은 끝(최신)을 기준으로 정렬
    const size_t price_offset = price.size() - n;
    const size_t ref_offset = reference.size() - n;

    size_t start = 0;
    if (lookback && *lookback < n) {
        start = n - *lookback;
    }

    for (size_t i = start + 1; i < n; ++i) {
        const double p_prev = price[price_offset + i - 1];
        const double p_cur = price[price_offset + i];
        const double r_prev = reference[ref_offset + i - 1];
        const double r_cur = reference[ref_offset + i];

        if (p_prev <= r_prev && p_cur > r_cur) {
            crossings.push_back({price_offset + i, CrossingType::BULLISH, p_cur, r_cur});
        } else if (p_prev >= r_prev && p_cur < r_cur) {
            crossings.push_back({price_offset + i, CrossingType::BEARISH, p_cur, r_cur});
        }
    }

    return crossings;
}

CycleState ReferenceLineEngine::calculateCycleState(const std::vector<Candle>& candles,
                                                    int cycle_length,
                                                    int recent_bars) {
    return calculateCycleState(candles, cycle_length,
                               calculateReferenceLine(candles, cycle_length), recent_bars);
}

CycleState ReferenceLineEngine::calculateCycleState(const std::vector<Candle>& candles,
                                                    int cycle_length,
                                                    const std::vector<double>& reference_line,
                                                    int recent_bars) {
    CycleState state;
    state.cycle = cycle_length;

    if (candles.empty() || reference_line.size() != candles.size()) {
        LOG_WARN("Cycle state {}: price/reference length mismatch ({} vs {})",
                 cycle_length, candles.size(), reference_line.size());
        return state;
    }

    const auto close = TechnicalIndicators::extractClosePrices(candles);
    const double latest_close = close.back();
    const double latest_fld = reference_line.back();

    state.fld_value = latest_fld;
    state.bullish = latest_close > latest_fld;

    // 최근 봉 구간의 교차 - 상향/하향을 서로 배제하지 않음
    const size_t window = static_cast<size_t>(std::max(recent_bars, 0));
    for (const auto& crossing : detectCrossings(close, reference_line, window)) {
        if (crossing.type == CrossingType::BULLISH) {
            state.recent_crossover = true;
        } else {
            state.recent_crossunder = true;
        }
    }

    // 기준선 대비 괴리율 (100배 스케일 후 1.0 에서 캡)
    if (latest_fld != 0.0 && std::isfinite(latest_fld)) {
        const double deviation = std::abs(latest_close - latest_fld) / latest_fld;
        state.power = std::min(deviation * 100.0, 1.0);
    }

    return state;
}

} // namespace analytics
} // namespace fibcycle
