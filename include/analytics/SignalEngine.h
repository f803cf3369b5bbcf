#pragma once

#include "analytics/ReferenceLineEngine.h"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace fibcycle {
namespace analytics {

// 사이클 길이 -> 상태 (길이 오름차순)
using CycleStateMap = std::map<int, CycleState>;

enum class SignalType {
    STRONG_BUY,
    BUY,
    WEAK_BUY,
    NEUTRAL,
    WEAK_SELL,
    SELL,
    STRONG_SELL
};

// 순서가 있는 척도: LOW < MEDIUM < HIGH
enum class Confidence { LOW = 0, MEDIUM = 1, HIGH = 2 };

enum class GuidanceAction { BUY, SELL, HOLD };

enum class Timeframe { SHORT_TERM, MEDIUM_TERM, LONG_TERM };

struct Guidance {
    GuidanceAction action = GuidanceAction::HOLD;
    std::string entry_strategy;
    std::string exit_strategy;
    std::optional<double> stop_loss;
    std::optional<double> target;
    double position_size = 0.0;  // 0 ~ 1
    Timeframe timeframe = Timeframe::MEDIUM_TERM;
};

struct SignalDecision {
    SignalType signal = SignalType::NEUTRAL;
    Confidence confidence = Confidence::LOW;
};

// Signal Engine - 사이클 상태들을 하나의 시그널/신뢰도/포지션 가이드로 변환
class SignalEngine {
public:
    // 가중치: 34 -> 1.5, 34 초과 -> 2.0, 그 외 1.0
    static double cycleWeight(int cycle);

    // 사이클 개수로 나눈 평균 강도. 비어 있으면 0
    static double combinedStrength(const CycleStateMap& cycle_states);

    // 임계값 분류 -> 전체 정렬 오버라이드 -> 34 사이클 신뢰도 보정
    static SignalDecision determineSignal(const CycleStateMap& cycle_states, double combined_strength);

    // 오버라이드 적용 전 강도만으로 분류한 시그널
    static SignalType classifyStrength(double combined_strength);
    static Confidence confidenceFromStrength(double combined_strength);

    static Guidance generateGuidance(SignalType signal,
                                     Confidence confidence,
                                     double last_price,
                                     const CycleStateMap& cycle_states);

    static bool isBuy(SignalType signal);
    static bool isSell(SignalType signal);
};

std::string toString(SignalType signal);
std::string toString(Confidence confidence);
std::string toString(GuidanceAction action);
std::string toString(Timeframe timeframe);

} // namespace analytics
} // namespace fibcycle
