#include "scanner/CycleScanner.h"
#include "TestHelpers.h"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace fibcycle;
using namespace fibcycle::scanner;
using fibcycle::testing::makeSineCandles;

namespace {

// 심볼 이름으로 응답을 정하는 가짜 시세 소스
class FakeDataSource : public data::IMarketDataSource {
public:
    std::optional<CandleSeries> getData(const std::string& symbol,
                                        const std::string& exchange,
                                        const std::string&,
                                        int n_bars) override {
        ++fetches;
        {
            std::lock_guard<std::mutex> lock(mutex);
            exchanges.push_back(exchange);
        }
        if (symbol == "MISSING") return std::nullopt;
        if (symbol == "BAD") throw std::runtime_error("provider exploded");
        if (symbol == "ODD") throw 42;
        if (symbol == "SHORT") return makeSineCandles(50, 34);

        // 심볼마다 위상을 달리해서 강도가 다르게 나오도록
        double phase = 0.0;
        for (char c : symbol) phase += static_cast<unsigned char>(c) * 0.37;
        auto candles = makeSineCandles(510, 34, 10.0, 100.0, phase);
        if (n_bars > 0 && candles.size() > static_cast<size_t>(n_bars)) {
            candles.erase(candles.begin(), candles.end() - n_bars);
        }
        return candles;
    }

    std::atomic<int> fetches{0};
    std::mutex mutex;
    std::vector<std::string> exchanges;
};

struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> calls;

    Sleeper fn() {
        return [this](std::chrono::milliseconds d) { calls.push_back(d); };
    }
};

std::vector<std::string> makeSymbols(size_t count) {
    std::vector<std::string> symbols;
    for (size_t i = 0; i < count; ++i) {
        symbols.push_back("SYM" + std::to_string(i));
    }
    return symbols;
}

void testBatchChunkingAndPacing() {
    auto source = std::make_shared<FakeDataSource>();
    RecordingSleeper sleeper;
    ScannerSettings settings;
    settings.max_workers = 5;
    CycleScanner scanner(source, settings, sleeper.fn());

    auto results = scanner.scanBatch(makeSymbols(23), "daily");

    // 10 + 10 + 3
    assert(source->fetches == 23);
    assert(sleeper.calls.size() == 2);
    for (auto d : sleeper.calls) {
        assert(d == std::chrono::milliseconds(2000));
    }
    assert(results.size() == 23);

    for (size_t i = 1; i < results.size(); ++i) {
        assert(std::abs(results[i - 1].combined_strength) >= std::abs(results[i].combined_strength));
    }

    assert(scanner.metrics().get("data_fetch").calls == 23);
    assert(scanner.metrics().get("analyze_symbol").calls == 23);
    assert(scanner.metrics().get("batch_scan").calls == 1);
}

void testExactChunkHasNoTrailingPause() {
    auto source = std::make_shared<FakeDataSource>();
    RecordingSleeper sleeper;
    CycleScanner scanner(source, ScannerSettings{}, sleeper.fn());

    scanner.scanBatch(makeSymbols(20), "daily");
    assert(source->fetches == 20);
    assert(sleeper.calls.size() == 1);

    scanner.scanBatch(makeSymbols(3), "daily", ScanParameters{}, 1);
    assert(source->fetches == 23);
    assert(sleeper.calls.size() == 1);
}

void testEmptyBatch() {
    auto source = std::make_shared<FakeDataSource>();
    RecordingSleeper sleeper;
    CycleScanner scanner(source, ScannerSettings{}, sleeper.fn());

    auto results = scanner.scanBatch({}, "daily");
    assert(results.empty());
    assert(sleeper.calls.empty());
    assert(source->fetches == 0);
}

void testFailuresAreIsolated() {
    auto source = std::make_shared<FakeDataSource>();
    RecordingSleeper sleeper;
    CycleScanner scanner(source, ScannerSettings{}, sleeper.fn());

    auto results = scanner.scanBatch({"AAA", "BAD", "ODD", "SHORT", "MISSING", "BBB"}, "daily");
    assert(source->fetches == 6);
    assert(results.size() == 2);
    for (const auto& r : results) {
        assert(r.symbol == "AAA" || r.symbol == "BBB");
    }

    assert(!scanner.analyzeSymbol("BAD", "daily"));
    assert(!scanner.analyzeSymbol("ODD", "daily"));
    assert(!scanner.analyzeSymbol("SHORT", "daily"));
    assert(!scanner.analyzeSymbol("MISSING", "daily"));

    // 잘못된 파라미터도 nullopt
    ScanParameters bad;
    bad.min_period = 300;
    assert(!scanner.analyzeSymbol("AAA", "daily", bad));
}

void testAnalyzeSymbol() {
    auto source = std::make_shared<FakeDataSource>();
    ScannerSettings settings;
    settings.exchange = "BSE";
    RecordingSleeper sleeper;
    CycleScanner scanner(source, settings, sleeper.fn());

    auto result = scanner.analyzeSymbol("RELIANCE", "daily");
    assert(result);
    assert(result->symbol == "RELIANCE");
    assert(result->interval == "daily");
    assert(source->exchanges.back() == "BSE");

    assert(result->cycles.size() == 3);
    assert(result->cycles.front() == 34);
    assert(result->powers.size() == 3);
    assert(result->cycle_states.size() == 3);

    // 스펙트럼 power 가 편차 기반 power 를 대체
    for (size_t i = 0; i < result->cycles.size(); ++i) {
        assert(result->cycle_states.at(result->cycles[i]).power == result->powers[i]);
    }

    const bool has_short = result->cycle_states.count(20) || result->cycle_states.count(21);
    assert(result->has_key_cycles == (has_short && result->cycle_states.count(34) > 0));

    assert(result->last_date.size() == 16);  // "YYYY-MM-DD HH:MM"

    const auto& plot = result->plot_data;
    assert(plot.symbol == "RELIANCE");
    assert(plot.close.size() == CycleScanner::kPlotBars);
    assert(plot.dates.size() == plot.close.size());
    assert(plot.close.back() == result->last_price);
    assert(plot.cycles.size() == 3);
    for (const auto& [cycle, cp] : plot.cycles) {
        assert(cp.fld.size() == plot.close.size());
        assert(cp.color == CycleScanner::cycleColor(cycle));
        assert(cp.wave && cp.wave->size() == static_cast<size_t>(CycleScanner::kWaveBars));
        assert(cp.bullish == result->cycle_states.at(cycle).bullish);
    }
    assert(!plot.crossings.empty());
    for (const auto& x : plot.crossings) {
        assert(x.index < plot.close.size());
        assert(x.date == plot.dates[x.index]);
        assert(x.price == plot.close[x.index]);
    }

    // guidance 는 마지막 종가 기준
    if (result->guidance.stop_loss) {
        const double ratio = *result->guidance.stop_loss / result->last_price;
        assert(std::abs(ratio - 0.98) < 1e-3 || std::abs(ratio - 1.02) < 1e-3);
    }
}

void testShortPlotWindowSkipsWave() {
    auto candles = makeSineCandles(120, 34);
    std::map<int, std::vector<double>> flds{{34, std::vector<double>(candles.size(), 100.0)}};
    analytics::CycleStateMap states{{34, analytics::CycleState{}}};

    auto plot = CycleScanner::generatePlotData("X", candles, {34}, states, flds);
    assert(plot.close.size() == 120);
    assert(plot.cycles.at(34).wave);

    auto tiny = makeSineCandles(80, 34);
    std::map<int, std::vector<double>> tiny_flds{{34, std::vector<double>(tiny.size(), 100.0)}};
    auto tiny_plot = CycleScanner::generatePlotData("X", tiny, {34}, states, tiny_flds);
    assert(tiny_plot.close.size() == 80);
    assert(!tiny_plot.cycles.at(34).wave);
}

void testCycleColors() {
    assert(CycleScanner::cycleColor(20) == "#1f77b4");
    assert(CycleScanner::cycleColor(21) == "#1f77b4");
    assert(CycleScanner::cycleColor(34) == "#ff7f0e");
    assert(CycleScanner::cycleColor(233) == "#8c564b");
    assert(CycleScanner::cycleColor(40) == "#7f7f7f");
}

} // namespace

int main() {
    std::cout << "[TEST] Starting CycleScanner Test..." << std::endl;

    testBatchChunkingAndPacing();
    testExactChunkHasNoTrailingPause();
    testEmptyBatch();
    testFailuresAreIsolated();
    testAnalyzeSymbol();
    testShortPlotWindowSkipsWave();
    testCycleColors();

    std::cout << "[TEST] CycleScanner PASSED" << std::endl;
    return 0;
}
