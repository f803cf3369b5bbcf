#include "scanner/ScanResult.h"
#include <stdexcept>
#include <string>

namespace fibcycle {
namespace scanner {

void ScanParameters::validate() const {
    if (min_period < 2) {
        throw std::invalid_argument("min_period must be >= 2 (got " + std::to_string(min_period) + ")");
    }
    if (min_period >= max_period) {
        throw std::invalid_argument("min_period must be less than max_period ("
            + std::to_string(min_period) + " >= " + std::to_string(max_period) + ")");
    }
    if (num_cycles < 1) {
        throw std::invalid_argument("num_cycles must be >= 1 (got " + std::to_string(num_cycles) + ")");
    }
    if (lookback < 1) {
        throw std::invalid_argument("lookback must be >= 1 (got " + std::to_string(lookback) + ")");
    }
}

} // namespace scanner
} // namespace fibcycle
