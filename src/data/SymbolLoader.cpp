#include "data/SymbolLoader.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace fibcycle {
namespace data {

std::string SymbolLoader::normalizeSymbol(std::string symbol) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    symbol.erase(symbol.begin(), std::find_if(symbol.begin(), symbol.end(), not_space));
    symbol.erase(std::find_if(symbol.rbegin(), symbol.rend(), not_space).base(), symbol.end());

    if (symbol.size() >= 2 && symbol.front() == '"' && symbol.back() == '"') {
        symbol = symbol.substr(1, symbol.size() - 2);
    }

    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}

std::vector<std::string> SymbolLoader::parseSymbolList(const std::string& text) {
    std::vector<std::string> symbols;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        auto symbol = normalizeSymbol(token);
        if (!symbol.empty()) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

std::vector<std::string> SymbolLoader::loadSymbols(const std::string& path) {
    std::vector<std::string> symbols;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Symbols file not found: {}", path);
        return symbols;
    }

    std::string line;
    while (std::getline(file, line)) {
        // CSV 면 첫 컬럼만
        const auto comma = line.find(',');
        auto symbol = normalizeSymbol(comma == std::string::npos ? line : line.substr(0, comma));

        if (symbol.empty() || symbol.front() == '#') continue;
        if (symbol == "SYMBOL") continue;

        symbols.push_back(symbol);
    }

    LOG_INFO("Loaded {} symbols from {}", symbols.size(), path);
    return symbols;
}

} // namespace data
} // namespace fibcycle
