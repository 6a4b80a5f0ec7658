#include "codonbias/rcbs.hpp"
#include "codonbias/stats_utils.hpp"
#include "weight_utils.hpp"

#include <array>

namespace codonbias {

RelativeCodonBiasScore::RelativeCodonBiasScore(const RcbsParams& params)
    : params_(params)
    , counter_(params.genetic_code, 1, params.ignore_stop) {
    detail::check_pseudocount(params_.pseudocount);
}

WeightTable RelativeCodonBiasScore::calc_weights(const std::string& seq,
                                                 const CodonCounts& counts) const {
    const auto bnc = positional_composition(seq);

    // Expected codon frequencies over all 64 codons
    std::array<double, 64> bcc{};
    double bcc_sum = 0.0;
    for (int idx = 0; idx < 64; ++idx) {
        const std::string c = idx_to_codon(idx);
        bcc[idx] = bnc[0][fast_base_idx(c[0])] * bnc[1][fast_base_idx(c[1])] *
                   bnc[2][fast_base_idx(c[2])];
        bcc_sum += bcc[idx];
    }

    const CodonDomain& dom = counter_.domain();
    const auto observed = counts.codon_table(true, params_.pseudocount);
    std::vector<double> ratios(dom.size());
    for (size_t i = 0; i < dom.size(); ++i) {
        const std::string& c = dom.key(i);
        const double expected = bcc[codon_to_idx(c[0], c[1], c[2])] / bcc_sum;
        ratios[i] = detail::enrichment(observed[i], expected, params_.directional);
    }
    return WeightTable(counter_.domain_ptr(), std::move(ratios));
}

WeightTable RelativeCodonBiasScore::weights(const std::string& seq) const {
    return calc_weights(seq, counter_.count(seq));
}

double RelativeCodonBiasScore::calc_score(const std::string& seq) const {
    auto counts = counter_.count(seq);
    auto w = calc_weights(seq, counts);

    switch (detail::resolve_mean(params_.mean)) {
        case detail::MeanKind::GEOMETRIC:
            return geomean(log_of(w.values()), counts.counts()) - 1.0;
        case detail::MeanKind::ARITHMETIC:
            return weighted_mean(w.values(), counts.counts());
    }
    return kMissing;
}

std::vector<double> RelativeCodonBiasScore::calc_vector(const std::string& seq) const {
    return weights(seq).per_position(seq);
}

} // namespace codonbias
