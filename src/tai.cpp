#include "codonbias/tai.hpp"
#include "codonbias/errors.hpp"
#include "codonbias/log_utils.hpp"
#include "codonbias/stats_utils.hpp"

#include <algorithm>
#include <cmath>

namespace codonbias {

TrnaAdaptationIndex::TrnaAdaptationIndex(const GcnTable& gcn, const TaiParams& params)
    : TrnaAdaptationIndex(gcn, tai_coefficients(params.s_values), params) {}

TrnaAdaptationIndex::TrnaAdaptationIndex(const GcnTable& gcn,
                                         const TaiCoefficientSet& coefficients,
                                         const TaiParams& params)
    : params_(params)
    , counter_(params.genetic_code, 1, true)  // not defined for stop codons
    , gcn_(normalize_gcn(gcn)) {
    weights_ = WeightTable(counter_.domain_ptr(), calc_weights(coefficients));
    log_weights_ = log_of(weights_.values());

    log_utils::log_info("tAI", std::to_string(weights_.size()) + " codon weights from " +
                                   std::to_string(gcn_.size()) + " anti-codons (" +
                                   params_.s_values + ", " +
                                   (params_.prokaryote ? "prokaryote" : "eukaryote") + ")");
}

TrnaAdaptationIndex TrnaAdaptationIndex::from_source(const GcnSource& source,
                                                     const GcnFetcher& fetcher,
                                                     const TaiParams& params) {
    return TrnaAdaptationIndex(resolve_gcn(source, fetcher), params);
}

std::vector<double> TrnaAdaptationIndex::calc_weights(
    const TaiCoefficientSet& coefficients) const {
    TaiCoefficientSet active;
    for (const auto& c : coefficients) {
        if (params_.prokaryote || !c.prokaryote) active.push_back(c);
    }

    struct Trna {
        std::string anti;
        std::string rc;   // codon positions 1-2 are rc[0], rc[1]
        double n;
    };
    std::vector<Trna> trnas;
    for (const auto& [anti, n] : gcn_) {
        trnas.push_back({anti, reverse_complement(anti), n});
    }

    const CodonDomain& dom = counter_.domain();
    std::vector<double> w(dom.size(), 0.0);
    for (size_t i = 0; i < dom.size(); ++i) {
        const std::string& codon = dom.key(i);
        const int deg = static_cast<int>(dom.degeneracy(i));
        for (const auto& t : trnas) {
            if (t.rc[0] != codon[0] || t.rc[1] != codon[1]) continue;
            for (const auto& c : active) {
                if (c.anti == t.anti[0] && c.cod == codon[2] && deg >= c.min_deg) {
                    w[i] += (1.0 - c.weight) * t.n;
                }
            }
        }
    }

    const double max_w = *std::max_element(w.begin(), w.end());
    if (!(max_w > 0.0)) {
        throw ConfigError("tAI: no tRNA gene decodes any codon");
    }
    for (double& v : w) v /= max_w;

    // Zero weights would collapse the geometric mean
    double log_sum = 0.0;
    size_t n_nonzero = 0;
    for (double v : w) {
        if (v != 0.0 && std::isfinite(v)) {
            log_sum += std::log(v);
            ++n_nonzero;
        }
    }
    const double fill = std::exp(log_sum / static_cast<double>(n_nonzero));
    size_t n_filled = 0;
    for (double& v : w) {
        if (v == 0.0) {
            v = fill;
            ++n_filled;
        }
    }
    if (n_filled > 0) {
        log_utils::log_info("tAI", std::to_string(n_filled) +
                                       " codons without tRNA set to " + std::to_string(fill));
    }
    return w;
}

double TrnaAdaptationIndex::calc_score(const std::string& seq) const {
    return geomean(log_weights_, counter_.count(seq).counts());
}

std::vector<double> TrnaAdaptationIndex::calc_vector(const std::string& seq) const {
    return weights_.per_position(seq);
}

} // namespace codonbias
