#pragma once
// Shared fitting steps for the reference-based models

#include "codonbias/codon_counter.hpp"
#include "codonbias/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace codonbias {
namespace detail {

enum class MeanKind { GEOMETRIC, ARITHMETIC };

// Throws ConfigError for anything but "geometric" / "arithmetic"
inline MeanKind resolve_mean(const std::string& mean) {
    if (mean == "geometric") return MeanKind::GEOMETRIC;
    if (mean == "arithmetic") return MeanKind::ARITHMETIC;
    throw ConfigError("unknown mean: " + mean);
}

inline void check_pseudocount(double pseudocount) {
    if (!(pseudocount >= 0.0)) {
        throw ConfigError("pseudocount must be >= 0");
    }
}

// Divide every entry by the maximum of its synonymous group
inline std::vector<double> ratio_to_group_max(const CodonDomain& domain,
                                              const std::vector<double>& table) {
    std::vector<double> out(table.size(), kMissing);
    for (size_t g = 0; g < domain.num_groups(); ++g) {
        const auto& members = domain.group_members(g);
        double max_val = -std::numeric_limits<double>::infinity();
        for (size_t i : members) {
            if (!std::isnan(table[i]) && table[i] > max_val) max_val = table[i];
        }
        for (size_t i : members) out[i] = table[i] / max_val;
    }
    return out;
}

// Observed over expected ratio, or max(ratio, 1/ratio) when directional
inline double enrichment(double observed, double expected, bool directional) {
    double r = observed / expected;
    if (!directional) return r;
    return std::max(r, expected / observed);
}

}  // namespace detail
}  // namespace codonbias
