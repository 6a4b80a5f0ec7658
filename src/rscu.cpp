#include "codonbias/rscu.hpp"
#include "codonbias/log_utils.hpp"
#include "codonbias/stats_utils.hpp"
#include "weight_utils.hpp"

namespace codonbias {

RelativeSynonymousCodonUsage::RelativeSynonymousCodonUsage(const RscuParams& params)
    : RelativeSynonymousCodonUsage(nullptr, params) {}

RelativeSynonymousCodonUsage::RelativeSynonymousCodonUsage(
    const std::vector<std::string>& ref_seqs, const RscuParams& params)
    : RelativeSynonymousCodonUsage(&ref_seqs, params) {}

RelativeSynonymousCodonUsage::RelativeSynonymousCodonUsage(
    const std::vector<std::string>* ref_seqs, const RscuParams& params)
    : params_(params)
    , counter_(params.genetic_code, 1, params.ignore_stop) {
    detail::check_pseudocount(params_.pseudocount);

    const CodonDomain& dom = counter_.domain();
    std::vector<double> bg(dom.size());
    if (ref_seqs) {
        bg = counter_.count(*ref_seqs).aa_table(true, params_.pseudocount);
    } else {
        for (size_t i = 0; i < dom.size(); ++i) {
            bg[i] = 1.0 / static_cast<double>(dom.degeneracy(i));
        }
    }
    background_ = WeightTable(counter_.domain_ptr(), std::move(bg));

    log_utils::log_info("RSCU", std::string("background: ") +
                                    (ref_seqs ? std::to_string(ref_seqs->size()) +
                                                    " reference sequences"
                                              : "uniform"));
}

WeightTable RelativeSynonymousCodonUsage::calc_weights(const CodonCounts& counts) const {
    auto observed = counts.aa_table(true, params_.pseudocount);
    std::vector<double> ratios(observed.size());
    for (size_t i = 0; i < observed.size(); ++i) {
        ratios[i] = detail::enrichment(observed[i], background_[i], params_.directional);
    }
    return WeightTable(counter_.domain_ptr(), std::move(ratios));
}

WeightTable RelativeSynonymousCodonUsage::weights(const std::string& seq) const {
    return calc_weights(counter_.count(seq));
}

double RelativeSynonymousCodonUsage::calc_score(const std::string& seq) const {
    auto counts = counter_.count(seq);
    auto w = calc_weights(counts);

    switch (detail::resolve_mean(params_.mean)) {
        case detail::MeanKind::GEOMETRIC:
            return geomean(log_of(w.values()), counts.counts()) - 1.0;
        case detail::MeanKind::ARITHMETIC:
            return weighted_mean(w.values(), counts.counts());
    }
    return kMissing;
}

std::vector<double> RelativeSynonymousCodonUsage::calc_vector(const std::string& seq) const {
    return weights(seq).per_position(seq);
}

} // namespace codonbias
