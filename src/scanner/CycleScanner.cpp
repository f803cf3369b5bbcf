#include "scanner/CycleScanner.h"
#include "analytics/ReferenceLineEngine.h"
#include "analytics/SignalEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace fibcycle {
namespace scanner {

using analytics::CycleDetector;
using analytics::ReferenceLineEngine;
using analytics::SignalEngine;
using analytics::TechnicalIndicators;

CycleScanner::CycleScanner(std::shared_ptr<data::IMarketDataSource> source,
                           ScannerSettings settings,
                           Sleeper sleeper)
    : source_(std::move(source))
    , settings_(std::move(settings))
    , sleeper_(std::move(sleeper))
    , cpu_detector_(CycleDetector::create(false))
    , accelerated_detector_(CycleDetector::create(true))
{
    if (!source_) {
        throw std::invalid_argument("CycleScanner requires a market data source");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    settings_.default_params.validate();
    if (settings_.max_workers < 1) {
        LOG_WARN("max_workers {} < 1, using 1", settings_.max_workers);
        settings_.max_workers = 1;
    }
}

const CycleDetector& CycleScanner::detectorFor(bool use_gpu) const {
    return use_gpu ? accelerated_detector_ : cpu_detector_;
}

std::string CycleScanner::cycleColor(int cycle) {
    switch (cycle) {
        case 20:
        case 21:  return "#1f77b4";
        case 34:  return "#ff7f0e";
        case 55:  return "#2ca02c";
        case 89:  return "#d62728";
        case 144: return "#9467bd";
        case 233: return "#8c564b";
        default:  return "#7f7f7f";
    }
}

std::optional<ScanResult> CycleScanner::analyzeSymbol(const std::string& symbol,
                                                      const std::string& interval) {
    return analyzeSymbol(symbol, interval, settings_.default_params);
}

std::optional<ScanResult> CycleScanner::analyzeSymbol(const std::string& symbol,
                                                      const std::string& interval,
                                                      const ScanParameters& params) {
    ScanMetrics::ScopedTimer timer(metrics_, "analyze_symbol");
    try {
        auto result = runAnalysis(symbol, interval, params);
        if (!result) {
            timer.fail();
        }
        return result;
    } catch (const std::exception& e) {
        timer.fail();
        LOG_ERROR("Error analyzing {} on {}: {}", symbol, interval, e.what());
        return std::nullopt;
    } catch (...) {
        timer.fail();
        LOG_ERROR("Unknown error analyzing {} on {}", symbol, interval);
        return std::nullopt;
    }
}

std::optional<ScanResult> CycleScanner::runAnalysis(const std::string& symbol,
                                                    const std::string& interval,
                                                    const ScanParameters& params) {
    params.validate();

    // 1. 데이터 조회
    std::optional<CandleSeries> fetched;
    {
        ScanMetrics::ScopedTimer timer(metrics_, "data_fetch");
        fetched = source_->getData(symbol, settings_.exchange, interval, params.lookback);
        if (!fetched) {
            timer.fail();
        }
    }

    if (!fetched || fetched->size() < kMinBars) {
        LOG_WARN("Insufficient data for {} on {} ({} bars)",
                 symbol, interval, fetched ? fetched->size() : 0);
        return std::nullopt;
    }
    const CandleSeries& candles = *fetched;

    // 2. 사이클 탐지 (HLC3)
    analytics::CycleDetectionResult detection;
    {
        ScanMetrics::ScopedTimer timer(metrics_, "cycle_detection");
        detection = detectorFor(params.use_gpu).detectCycles(
            TechnicalIndicators::extractTypicalPrices(candles),
            params.min_period, params.max_period, params.num_cycles);
        if (detection.fallback) {
            timer.fail();
        }
    }

    if (detection.periods.empty()) {
        LOG_WARN("No significant cycles found for {}", symbol);
        return std::nullopt;
    }

    ScanResult result;
    result.symbol = symbol;
    result.interval = interval;
    result.last_price = candles.back().close;
    result.last_date = formatTimestamp(candles.back().timestamp);
    result.cycles = detection.periods;
    result.powers = detection.powers;

    // 3. 사이클별 FLD / 상태, power 는 스펙트럼 값으로 덮어씀
    std::map<int, std::vector<double>> reference_lines;
    {
        ScanMetrics::ScopedTimer timer(metrics_, "signal_generation");

        for (size_t i = 0; i < detection.periods.size(); ++i) {
            const int cycle = detection.periods[i];
            auto fld = ReferenceLineEngine::calculateReferenceLine(candles, cycle);
            auto state = ReferenceLineEngine::calculateCycleState(candles, cycle, fld);
            if (i < detection.powers.size()) {
                state.power = detection.powers[i];
            }
            result.cycle_states[cycle] = state;
            reference_lines[cycle] = std::move(fld);
        }

        auto has = [&](int c) { return result.cycle_states.count(c) > 0; };
        result.has_key_cycles = (has(20) || has(21)) && has(34);

        // 4. 시그널
        result.combined_strength = SignalEngine::combinedStrength(result.cycle_states);
        const auto decision = SignalEngine::determineSignal(result.cycle_states, result.combined_strength);
        result.signal = decision.signal;
        result.confidence = decision.confidence;
        result.guidance = SignalEngine::generateGuidance(
            result.signal, result.confidence, result.last_price, result.cycle_states);
    }

    result.plot_data = generatePlotData(symbol, candles, result.cycles,
                                        result.cycle_states, reference_lines);

    LOG_INFO("Analysis completed for {} on {}: {} ({})",
             symbol, interval,
             analytics::toString(result.signal), analytics::toString(result.confidence));
    Logger::getInstance().logSignal(symbol, interval,
                                    analytics::toString(result.signal),
                                    analytics::toString(result.confidence),
                                    result.combined_strength, result.last_price);
    return result;
}

std::vector<ScanResult> CycleScanner::scanBatch(const std::vector<std::string>& symbols,
                                                const std::string& interval) {
    return scanBatch(symbols, interval, settings_.default_params);
}

std::vector<ScanResult> CycleScanner::scanBatch(const std::vector<std::string>& symbols,
                                                const std::string& interval,
                                                const ScanParameters& params,
                                                std::optional<int> max_workers) {
    ScanMetrics::ScopedTimer batch_timer(metrics_, "batch_scan");

    std::vector<ScanResult> results;
    if (symbols.empty()) {
        LOG_INFO("Scan requested with no symbols");
        return results;
    }

    const size_t workers_limit = static_cast<size_t>(std::max(1, max_workers.value_or(settings_.max_workers)));
    const size_t total_batches = (symbols.size() + kBatchSize - 1) / kBatchSize;

    LOG_INFO("Scanning {} symbols on {} in {} batches", symbols.size(), interval, total_batches);

    for (size_t batch_idx = 0; batch_idx < total_batches; ++batch_idx) {
        const size_t start = batch_idx * kBatchSize;
        const size_t end = std::min(start + kBatchSize, symbols.size());

        LOG_INFO("Processing batch {}/{} ({} symbols)", batch_idx + 1, total_batches, end - start);

        std::mutex results_mutex;
        std::atomic<size_t> next{start};

        auto worker = [&]() {
            for (size_t i = next++; i < end; i = next++) {
                const std::string& symbol = symbols[i];
                try {
                    auto result = analyzeSymbol(symbol, interval, params);
                    if (result) {
                        std::lock_guard<std::mutex> lock(results_mutex);
                        results.push_back(std::move(*result));
                    }
                } catch (const std::exception& e) {
                    LOG_ERROR("Error processing {} result: {}", symbol, e.what());
                } catch (...) {
                    // 워커 스레드 밖으로 예외가 나가면 terminate
                    LOG_ERROR("Unknown error processing {} result", symbol);
                }
            }
        };

        const size_t thread_count = std::min(workers_limit, end - start);
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& th : threads) {
            th.join();
        }

        // Rate limit - 마지막 배치 뒤에는 대기하지 않음
        if (batch_idx + 1 < total_batches) {
            sleeper_(kBatchDelay);
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const ScanResult& a, const ScanResult& b) {
        return std::abs(a.combined_strength) > std::abs(b.combined_strength);
    });

    LOG_INFO("Scan completed with {} results", results.size());
    LOG_DEBUG("Scan metrics: {}", metrics_.summary().dump());
    return results;
}

PlotData CycleScanner::generatePlotData(const std::string& symbol,
                                        const CandleSeries& candles,
                                        const std::vector<int>& cycles,
                                        const analytics::CycleStateMap& cycle_states,
                                        const std::map<int, std::vector<double>>& reference_lines) {
    PlotData plot;
    plot.symbol = symbol;

    try {
        const size_t visible = std::min(kPlotBars, candles.size());
        const CandleSeries window(candles.end() - visible, candles.end());

        for (const auto& c : window) {
            plot.dates.push_back(formatTimestamp(c.timestamp));
            plot.open.push_back(c.open);
            plot.high.push_back(c.high);
            plot.low.push_back(c.low);
            plot.close.push_back(c.close);
            plot.volume.push_back(c.volume);
        }

        const auto typical = TechnicalIndicators::extractTypicalPrices(window);

        for (int cycle : cycles) {
            auto fld_it = reference_lines.find(cycle);
            if (fld_it == reference_lines.end()) continue;
            const auto& fld = fld_it->second;
            if (fld.size() < visible) continue;

            CyclePlot cp;
            cp.fld.assign(fld.end() - visible, fld.end());
            auto state_it = cycle_states.find(cycle);
            cp.bullish = (state_it != cycle_states.end()) && state_it->second.bullish;
            cp.color = cycleColor(cycle);

            // 합성 파형: 마지막 고점(없으면 저점)으로 위상 맞춤
            if (window.size() >= static_cast<size_t>(kWaveBars)) {
                const auto extremes = CycleDetector::detectCycleExtremes(typical, cycle);
                const double pi = std::acos(-1.0);
                double phase = 0.0;
                if (!extremes.peaks.empty()) {
                    phase = 2.0 * pi * (static_cast<double>(extremes.peaks.back()) / cycle);
                } else if (!extremes.troughs.empty()) {
                    phase = 2.0 * pi * (static_cast<double>(extremes.troughs.back()) / cycle) + pi;
                }

                auto wave = CycleDetector::generateCycleWave(cycle, kWaveBars, -phase);
                const auto [min_it, max_it] = std::minmax_element(typical.begin(), typical.end());
                const double range = *max_it - *min_it;
                const double mid = (*max_it + *min_it) / 2.0;
                for (auto& v : wave) {
                    v = v * (range * 0.25) + mid;
                }
                cp.wave = std::move(wave);
            }

            for (const auto& x : ReferenceLineEngine::detectCrossings(plot.close, cp.fld)) {
                PlotCrossing marker;
                marker.index = x.index;
                marker.date = plot.dates[x.index];
                marker.price = x.price;
                marker.type = x.type;
                marker.cycle = cycle;
                plot.crossings.push_back(marker);
            }

            plot.cycles[cycle] = std::move(cp);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error generating plot data for {}: {}", symbol, e.what());
        PlotData empty;
        empty.symbol = symbol;
        return empty;
    }

    return plot;
}

} // namespace scanner
} // namespace fibcycle
