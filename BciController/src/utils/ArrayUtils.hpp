// utils/ArrayUtils.hpp
// -----------------------------------------------------------------------------
// Small index helpers for training sequences (header-only)
//   - random non-repeating draws of target indices
//   - joining a sequence for log lines
// -----------------------------------------------------------------------------

#pragma once
#include <algorithm>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bcictl {
namespace arrayutils {

// Draws `count` distinct ints uniformly from [lo, hi).
// Throws std::invalid_argument if the range can't supply that many.
inline std::vector<int> generate_rnra(int count, int lo, int hi, std::mt19937& rng) {
    if (count < 0) {
        throw std::invalid_argument("generate_rnra: negative count " + std::to_string(count));
    }
    const int available = (hi > lo) ? (hi - lo) : 0;
    if (count > available) {
        std::ostringstream oss;
        oss << "generate_rnra: requested " << count << " distinct values but only "
            << available << " available in [" << lo << ", " << hi << ")";
        throw std::invalid_argument(oss.str());
    }

    std::vector<int> pool(static_cast<std::size_t>(available));
    std::iota(pool.begin(), pool.end(), lo);
    std::shuffle(pool.begin(), pool.end(), rng);
    pool.resize(static_cast<std::size_t>(count));
    return pool;
}

inline std::string join_values(const std::vector<int>& values, const char* sep = ", ") {
    std::ostringstream oss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << sep;
        oss << values[i];
    }
    return oss.str();
}

} // namespace arrayutils
} // namespace bcictl
