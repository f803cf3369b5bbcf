#pragma once

#include <string>
#include <vector>

namespace fibcycle {
namespace data {

class SymbolLoader {
public:
    // 한 줄에 하나 (CSV 면 첫 컬럼). 공백 제거 후 대문자로 변환
    // 빈 줄, '#' 주석, "symbol" 헤더는 건너뜀. 중복 제거는 하지 않음
    static std::vector<std::string> loadSymbols(const std::string& path);

    // "reliance, tcs,INFY" -> {"RELIANCE", "TCS", "INFY"}
    static std::vector<std::string> parseSymbolList(const std::string& text);

    static std::string normalizeSymbol(std::string symbol);
};

} // namespace data
} // namespace fibcycle
