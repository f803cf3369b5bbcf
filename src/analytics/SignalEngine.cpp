#include "analytics/SignalEngine.h"

#include <algorithm>
#include <cmath>

namespace fibcycle {
namespace analytics {

namespace {
constexpr double kVolatilityFactor = 0.02;  // 2% 고정 변동성 가정

double roundPrice(double value) {
    return std::round(value * 100.0) / 100.0;
}
}

std::string toString(SignalType signal) {
    switch (signal) {
        case SignalType::STRONG_BUY: return "Strong Buy";
        case SignalType::BUY: return "Buy";
        case SignalType::WEAK_BUY: return "Weak Buy";
        case SignalType::NEUTRAL: return "Neutral";
        case SignalType::WEAK_SELL: return "Weak Sell";
        case SignalType::SELL: return "Sell";
        case SignalType::STRONG_SELL: return "Strong Sell";
    }
    return "Neutral";
}

std::string toString(Confidence confidence) {
    switch (confidence) {
        case Confidence::LOW: return "Low";
        case Confidence::MEDIUM: return "Medium";
        case Confidence::HIGH: return "High";
    }
    return "Low";
}

std::string toString(GuidanceAction action) {
    switch (action) {
        case GuidanceAction::BUY: return "Buy";
        case GuidanceAction::SELL: return "Sell";
        case GuidanceAction::HOLD: return "Hold";
    }
    return "Hold";
}

std::string toString(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::SHORT_TERM: return "Short-term";
        case Timeframe::MEDIUM_TERM: return "Medium-term";
        case Timeframe::LONG_TERM: return "Long-term";
    }
    return "Medium-term";
}

bool SignalEngine::isBuy(SignalType signal) {
    return signal == SignalType::STRONG_BUY || signal == SignalType::BUY || signal == SignalType::WEAK_BUY;
}

bool SignalEngine::isSell(SignalType signal) {
    return signal == SignalType::STRONG_SELL || signal == SignalType::SELL || signal == SignalType::WEAK_SELL;
}

double SignalEngine::cycleWeight(int cycle) {
    if (cycle == 34) return 1.5;
    if (cycle > 34) return 2.0;
    return 1.0;
}

double SignalEngine::combinedStrength(const CycleStateMap& cycle_states) {
    if (cycle_states.empty()) {
        return 0.0;
    }

    double combined = 0.0;
    for (const auto& [cycle, state] : cycle_states) {
        const double weight = cycleWeight(cycle);
        const double direction = state.bullish ? 1.0 : -1.0;
        combined += state.power * direction * weight;

        // 최근 교차 보너스
        if (state.recent_crossover) combined += 0.5 * weight;
        if (state.recent_crossunder) combined -= 0.5 * weight;
    }

    return combined / static_cast<double>(cycle_states.size());
}

SignalType SignalEngine::classifyStrength(double combined_strength) {
    if (combined_strength > 1.5) return SignalType::STRONG_BUY;
    if (combined_strength > 0.8) return SignalType::BUY;
    if (combined_strength > 0.3) return SignalType::WEAK_BUY;
    if (combined_strength < -1.5) return SignalType::STRONG_SELL;
    if (combined_strength < -0.8) return SignalType::SELL;
    if (combined_strength < -0.3) return SignalType::WEAK_SELL;
    return SignalType::NEUTRAL;
}

Confidence SignalEngine::confidenceFromStrength(double combined_strength) {
    const double magnitude = std::abs(combined_strength);
    if (magnitude > 1.5) return Confidence::HIGH;
    if (magnitude > 0.8) return Confidence::MEDIUM;
    return Confidence::LOW;
}

SignalDecision SignalEngine::determineSignal(const CycleStateMap& cycle_states, double combined_strength) {
    SignalDecision decision;
    if (cycle_states.empty()) {
        return decision;
    }

    size_t bullish_cycles = 0;
    size_t recent_bullish = 0;
    size_t recent_bearish = 0;
    for (const auto& [cycle, state] : cycle_states) {
        if (state.bullish) ++bullish_cycles;
        if (state.recent_crossover) ++recent_bullish;
        if (state.recent_crossunder) ++recent_bearish;
    }
    const size_t bearish_cycles = cycle_states.size() - bullish_cycles;

    decision.signal = classifyStrength(combined_strength);
    decision.confidence = confidenceFromStrength(combined_strength);

    // 모든 사이클이 같은 방향 + 최근 교차 -> 강제 Strong
    if (bullish_cycles == cycle_states.size() && recent_bullish > 0) {
        decision.signal = SignalType::STRONG_BUY;
        decision.confidence = Confidence::HIGH;
    } else if (bearish_cycles == cycle_states.size() && recent_bearish > 0) {
        decision.signal = SignalType::STRONG_SELL;
        decision.confidence = Confidence::HIGH;
    }

    // 34 사이클(주 추세)이 시그널 방향과 일치하면 최소 Medium
    auto it = cycle_states.find(34);
    if (it != cycle_states.end()) {
        const bool agrees = it->second.bullish ? isBuy(decision.signal) : isSell(decision.signal);
        if (agrees) {
            decision.confidence = std::max(decision.confidence, Confidence::MEDIUM);
        }
    }

    return decision;
}

Guidance SignalEngine::generateGuidance(SignalType signal,
                                        Confidence confidence,
                                        double last_price,
                                        const CycleStateMap& cycle_states) {
    Guidance guidance;

    const bool buy = isBuy(signal);
    const bool sell = isSell(signal);

    if (buy) {
        guidance.action = GuidanceAction::BUY;
    } else if (sell) {
        guidance.action = GuidanceAction::SELL;
    }

    switch (confidence) {
        case Confidence::HIGH: guidance.position_size = 1.0; break;
        case Confidence::MEDIUM: guidance.position_size = 0.5; break;
        case Confidence::LOW: guidance.position_size = 0.25; break;
        default: guidance.position_size = 0.0; break;
    }

    // 진입/청산 문구는 관례상 항상 21 FLD 기준
    auto it34 = cycle_states.find(34);
    if (buy) {
        guidance.entry_strategy = "Enter long on a pullback to the 21-period FLD.";
        if (it34 != cycle_states.end() && it34->second.bullish) {
            guidance.entry_strategy += " Confirmed by 34-period cycle.";
        }
        guidance.exit_strategy =
            "Exit when price crosses below the 21-period FLD or at the projected cycle top.";

        guidance.stop_loss = roundPrice(last_price * (1.0 - kVolatilityFactor));
        guidance.target = roundPrice(last_price * (1.0 + kVolatilityFactor * 2.0));  // 2:1
    } else if (sell) {
        guidance.entry_strategy = "Enter short on a rally to the 21-period FLD.";
        if (it34 != cycle_states.end() && !it34->second.bullish) {
            guidance.entry_strategy += " Confirmed by 34-period cycle.";
        }
        guidance.exit_strategy =
            "Exit when price crosses above the 21-period FLD or at the projected cycle bottom.";

        guidance.stop_loss = roundPrice(last_price * (1.0 + kVolatilityFactor));
        guidance.target = roundPrice(last_price * (1.0 - kVolatilityFactor * 2.0));
    }

    // 가장 긴 사이클 기준 타임프레임
    int longest = 0;
    for (const auto& [cycle, state] : cycle_states) {
        longest = std::max(longest, cycle);
    }
    if (longest > 50) {
        guidance.timeframe = Timeframe::LONG_TERM;
    } else if (longest > 20) {
        guidance.timeframe = Timeframe::MEDIUM_TERM;
    } else {
        guidance.timeframe = Timeframe::SHORT_TERM;
    }

    return guidance;
}

} // namespace analytics
} // namespace fibcycle
