#include "common/Logger.h"
#include "common/Config.h"
#include "data/CachedMarketDataSource.h"
#include "data/CsvMarketDataSource.h"
#include "data/SymbolLoader.h"
#include "scanner/CycleScanner.h"
#include "scanner/ResultSerializer.h"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace fibcycle;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string scan;
    std::string file;
    std::optional<std::string> interval;
    std::optional<int> lookback;
    std::optional<std::string> exchange;
    std::optional<std::string> output;
    bool gpu = false;
    std::optional<int> workers;
    bool help = false;
};

void printUsage() {
    std::cout << "Usage: fibcycle_scanner [--config PATH] (--scan SYM[,SYM...] | --file PATH)\n"
              << "                        [--interval daily] [--lookback N] [--exchange NSE]\n"
              << "                        [--output DIR] [--gpu] [--workers N]\n";
}

int parseIntArg(const std::string& name, const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + name + " value: " + value);
    }
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") opts.help = true;
        else if (arg == "--config") opts.config_path = next();
        else if (arg == "--scan") opts.scan = next();
        else if (arg == "--file") opts.file = next();
        else if (arg == "--interval") opts.interval = next();
        else if (arg == "--lookback") opts.lookback = parseIntArg(arg, next());
        else if (arg == "--exchange") opts.exchange = next();
        else if (arg == "--output") opts.output = next();
        else if (arg == "--gpu") opts.gpu = true;
        else if (arg == "--workers") opts.workers = parseIntArg(arg, next());
        else throw std::invalid_argument("Unknown argument: " + arg);
    }
    return opts;
}

void printAnalysis(const scanner::ScanResult& result) {
    std::cout << "\nAnalysis for " << result.symbol << " (" << result.interval << "):\n";
    std::cout << "Signal: " << analytics::toString(result.signal)
              << " (" << analytics::toString(result.confidence) << ")\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Strength: " << result.combined_strength << "\n";
    std::cout << "Cycles: ";
    for (size_t i = 0; i < result.cycles.size(); ++i) {
        std::cout << (i ? ", " : "") << result.cycles[i];
    }
    std::cout << "\n";
    std::cout << "Last Price: " << result.last_price << "\n";
    std::cout << "Last Date: " << result.last_date << "\n";

    const auto& g = result.guidance;
    std::cout << "\nTrading Recommendation:\n";
    std::cout << "Action: " << analytics::toString(g.action) << "\n";
    std::cout << "Entry Strategy: " << g.entry_strategy << "\n";
    std::cout << "Exit Strategy: " << g.exit_strategy << "\n";
    if (g.stop_loss) std::cout << "Stop Loss: " << *g.stop_loss << "\n";
    if (g.target) std::cout << "Target: " << *g.target << "\n";
    std::cout << "Position Size: " << static_cast<int>(g.position_size * 100) << "%\n";
    std::cout << "Timeframe: " << analytics::toString(g.timeframe) << "\n";
}

void printTopSignals(const std::vector<scanner::ScanResult>& results, bool buy) {
    std::cout << (buy ? "\nTop Buy Signals:\n" : "\nTop Sell Signals:\n");
    int rank = 0;
    for (const auto& r : results) {
        const bool match = buy ? analytics::SignalEngine::isBuy(r.signal)
                               : analytics::SignalEngine::isSell(r.signal);
        if (!match) continue;
        std::cout << ++rank << ". " << r.symbol << ": " << analytics::toString(r.signal)
                  << " (" << std::fixed << std::setprecision(2) << r.combined_strength << ")\n";
        if (rank >= 5) break;
    }
    if (rank == 0) {
        std::cout << "  (none)\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const CliOptions opts = parseArgs(argc, argv);
        if (opts.help || (opts.scan.empty() && opts.file.empty())) {
            printUsage();
            return opts.help ? 0 : 1;
        }

        AppConfig config = Config::load(opts.config_path);
        Logger::getInstance().initialize(config.log_dir, config.log_level);

        const std::string interval = opts.interval.value_or(config.default_interval);
        const std::string output_dir = opts.output.value_or(config.report_dir);

        scanner::ScanParameters params = config.analysis;
        if (opts.lookback) params.lookback = *opts.lookback;
        if (opts.gpu) params.use_gpu = true;
        params.validate();

        scanner::ScannerSettings settings;
        settings.exchange = opts.exchange.value_or(config.default_exchange);
        settings.default_params = params;
        settings.max_workers = opts.workers.value_or(config.max_workers);

        auto source = std::make_shared<data::CachedMarketDataSource>(
            std::make_shared<data::CsvMarketDataSource>(config.data_dir),
            std::chrono::seconds(config.cache_expiry_seconds));
        scanner::CycleScanner cycle_scanner(source, settings);

        std::vector<std::string> symbols;
        if (!opts.file.empty()) {
            symbols = data::SymbolLoader::loadSymbols(opts.file);
            if (symbols.empty()) {
                std::cerr << "No symbols found in file: " << opts.file << "\n";
                return 1;
            }
            std::cout << "Loaded " << symbols.size() << " symbols from " << opts.file << "\n";
        } else {
            symbols = data::SymbolLoader::parseSymbolList(opts.scan);
        }

        if (symbols.size() == 1) {
            std::cout << "Scanning " << symbols.front() << " on " << interval << " timeframe...\n";
            auto result = cycle_scanner.analyzeSymbol(symbols.front(), interval, params);
            if (!result) {
                std::cout << "No data available for " << symbols.front() << "\n";
                return 1;
            }
            printAnalysis(*result);
            return 0;
        }

        const auto started = std::chrono::steady_clock::now();
        auto results = cycle_scanner.scanBatch(symbols, interval, params);
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

        std::cout << "\nScan completed in " << std::fixed << std::setprecision(2) << elapsed << " seconds.\n";
        if (results.empty()) {
            std::cout << "No signals found in " << symbols.size() << " symbols.\n";
            return 0;
        }
        std::cout << "Found " << results.size() << " signals in " << symbols.size() << " symbols.\n";

        printTopSignals(results, true);
        printTopSignals(results, false);

        const auto report_path = std::filesystem::path(output_dir)
            / scanner::ResultSerializer::reportFileName(interval, results.size());
        if (scanner::ResultSerializer::writeReport(results, report_path.string())) {
            std::cout << "\nResults saved to: " << report_path.string() << "\n";
        }

        LOG_INFO("Scan metrics: {}", cycle_scanner.metrics().summary().dump());
        LOG_INFO("Cache hits={} misses={}", source->hits(), source->misses());
        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
