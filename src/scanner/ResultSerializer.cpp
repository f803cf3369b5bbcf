#include "scanner/ResultSerializer.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>

namespace fibcycle {
namespace scanner {

namespace {

nlohmann::json optionalPrice(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json ResultSerializer::toJson(const analytics::CycleState& state) {
    return {
        {"cycle", state.cycle},
        {"fld_value", state.fld_value},
        {"bullish", state.bullish},
        {"recent_crossover", state.recent_crossover},
        {"recent_crossunder", state.recent_crossunder},
        {"power", state.power}
    };
}

nlohmann::json ResultSerializer::toJson(const analytics::Guidance& guidance) {
    return {
        {"action", analytics::toString(guidance.action)},
        {"entry_strategy", guidance.entry_strategy},
        {"exit_strategy", guidance.exit_strategy},
        {"stop_loss", optionalPrice(guidance.stop_loss)},
        {"target", optionalPrice(guidance.target)},
        {"position_size", guidance.position_size},
        {"timeframe", analytics::toString(guidance.timeframe)}
    };
}

nlohmann::json ResultSerializer::toJson(const PlotData& plot) {
    nlohmann::json j;
    j["symbol"] = plot.symbol;
    j["dates"] = plot.dates;
    j["open"] = plot.open;
    j["high"] = plot.high;
    j["low"] = plot.low;
    j["close"] = plot.close;
    j["volume"] = plot.volume;

    // JSON 키는 문자열이어야 함
    nlohmann::json cycles = nlohmann::json::object();
    for (const auto& [cycle, cp] : plot.cycles) {
        nlohmann::json c;
        c["fld"] = cp.fld;
        c["bullish"] = cp.bullish;
        c["color"] = cp.color;
        c["wave"] = cp.wave ? nlohmann::json(*cp.wave) : nlohmann::json(nullptr);
        cycles[std::to_string(cycle)] = c;
    }
    j["cycles"] = cycles;

    nlohmann::json crossings = nlohmann::json::array();
    for (const auto& x : plot.crossings) {
        crossings.push_back({
            {"index", x.index},
            {"date", x.date},
            {"price", x.price},
            {"type", analytics::toString(x.type)},
            {"cycle", x.cycle}
        });
    }
    j["crossings"] = crossings;
    return j;
}

nlohmann::json ResultSerializer::toJson(const ScanResult& result, bool include_plot) {
    nlohmann::json j;
    j["symbol"] = result.symbol;
    j["interval"] = result.interval;
    j["last_price"] = result.last_price;
    j["last_date"] = result.last_date;
    j["cycles"] = result.cycles;
    j["powers"] = result.powers;

    nlohmann::json states = nlohmann::json::object();
    for (const auto& [cycle, state] : result.cycle_states) {
        states[std::to_string(cycle)] = toJson(state);
    }
    j["cycle_states"] = states;

    j["combined_strength"] = result.combined_strength;
    j["has_key_cycles"] = result.has_key_cycles;
    j["signal"] = analytics::toString(result.signal);
    j["confidence"] = analytics::toString(result.confidence);
    j["guidance"] = toJson(result.guidance);

    if (include_plot) {
        j["plot_data"] = toJson(result.plot_data);
    }
    return j;
}

nlohmann::json ResultSerializer::toJson(const std::vector<ScanResult>& results, bool include_plot) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& result : results) {
        arr.push_back(toJson(result, include_plot));
    }
    return arr;
}

bool ResultSerializer::writeReport(const std::vector<ScanResult>& results, const std::string& path) {
    try {
        const std::filesystem::path out_path(path);
        if (out_path.has_parent_path()) {
            std::filesystem::create_directories(out_path.parent_path());
        }

        std::ofstream file(out_path);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open report file: {}", path);
            return false;
        }
        file << toJson(results).dump(2);
        LOG_INFO("Scan report written: {} ({} results)", path, results.size());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write report {}: {}", path, e.what());
        return false;
    }
}

std::string ResultSerializer::reportFileName(const std::string& interval, size_t count) {
    return "scan_" + interval + "_" + std::to_string(count) + "_results.json";
}

} // namespace scanner
} // namespace fibcycle
