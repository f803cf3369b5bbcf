#include "data/DataHistory.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include "common/Logger.h"

namespace fibcycle {
namespace data {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

bool isInteger(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    return std::all_of(s.begin() + start, s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

double readNumber(const nlohmann::json& item, const char* key, const char* short_key) {
    if (item.contains(key)) return item[key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    return 0.0;
}

} // namespace

std::optional<long long> DataHistory::parseTimestamp(const std::string& cell) {
    if (isInteger(cell)) {
        return std::stoll(cell);
    }

    static const char* formats[] = {
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M",
        "%Y-%m-%d",
    };

    for (const char* format : formats) {
        std::tm tm{};
        std::istringstream ss(cell);
        ss >> std::get_time(&tm, format);
        if (ss.fail()) continue;

        // 남은 문자가 있으면 (예: 타임존 접미사) 실패로 보지 않고 무시
        const std::time_t seconds = timegm(&tm);
        return static_cast<long long>(seconds) * 1000LL;
    }
    return std::nullopt;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 5) continue;
        if (row[0].empty()) continue;

        auto timestamp = parseTimestamp(row[0]);
        if (!timestamp) {
            // Header or malformed row.
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = *timestamp;
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = (row.size() > 5 && !row[5].empty()) ? std::stod(row[5]) : 0.0;
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    // Ensure sorted by timestamp ascending
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });

    LOG_DEBUG("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            if (item.contains("timestamp")) candle.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) candle.timestamp = item["t"].get<long long>();
            else {
                LOG_WARN("Skipping JSON candle without timestamp: {}", item.dump());
                continue;
            }

            candle.open = readNumber(item, "open", "o");
            candle.high = readNumber(item, "high", "h");
            candle.low = readNumber(item, "low", "l");
            candle.close = readNumber(item, "close", "c");
            candle.volume = readNumber(item, "volume", "v");

            candles.push_back(candle);
        }
        std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
            return a.timestamp < b.timestamp;
        });

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_DEBUG("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::keepRecent(const std::vector<Candle>& candles, int count) {
    if (count <= 0 || candles.size() <= static_cast<size_t>(count)) {
        return candles;
    }
    return std::vector<Candle>(candles.end() - count, candles.end());
}

} // namespace data
} // namespace fibcycle
