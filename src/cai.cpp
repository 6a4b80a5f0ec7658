#include "codonbias/cai.hpp"
#include "codonbias/log_utils.hpp"
#include "codonbias/stats_utils.hpp"
#include "weight_utils.hpp"

namespace codonbias {

CodonAdaptationIndex::CodonAdaptationIndex(const std::vector<std::string>& ref_seqs,
                                           const CaiParams& params)
    : params_(params)
    , counter_(params.genetic_code, params.k_mer, params.ignore_stop) {
    detail::check_pseudocount(params_.pseudocount);

    auto counts = counter_.count(ref_seqs);
    auto freqs = counts.aa_table(true, params_.pseudocount);
    weights_ = WeightTable(counter_.domain_ptr(),
                           detail::ratio_to_group_max(counter_.domain(), freqs));
    log_weights_ = log_of(weights_.values());

    log_utils::log_info("CAI", std::to_string(weights_.size()) + " " +
                                   std::to_string(params_.k_mer) + "-mer weights from " +
                                   std::to_string(counts.total()) + " reference windows");
}

double CodonAdaptationIndex::calc_score(const std::string& seq) const {
    return geomean(log_weights_, counter_.count(seq).counts());
}

std::vector<double> CodonAdaptationIndex::calc_vector(const std::string& seq) const {
    return weights_.per_position(seq);
}

} // namespace codonbias
