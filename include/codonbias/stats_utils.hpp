#pragma once

#include "codon_counter.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace codonbias {

// Weighted arithmetic mean; entries with a NaN value are skipped.
// NaN when no weight remains.
template <typename W>
double weighted_mean(const std::vector<double>& values, const std::vector<W>& weights) {
    double num = 0.0;
    double den = 0.0;
    const size_t n = std::min(values.size(), weights.size());
    for (size_t i = 0; i < n; ++i) {
        const double w = static_cast<double>(weights[i]);
        if (w == 0.0 || std::isnan(values[i])) continue;
        num += w * values[i];
        den += w;
    }
    return den > 0.0 ? num / den : kMissing;
}

// Weighted geometric mean from log values: exp(weighted_mean(log_values))
template <typename W>
double geomean(const std::vector<double>& log_values, const std::vector<W>& weights) {
    return std::exp(weighted_mean(log_values, weights));
}

inline std::vector<double> log_of(const std::vector<double>& values) {
    std::vector<double> out(values.size());
    for (size_t i = 0; i < values.size(); ++i) out[i] = std::log(values[i]);
    return out;
}

} // namespace codonbias
