#include "codonbias/fop.hpp"
#include "codonbias/log_utils.hpp"
#include "codonbias/stats_utils.hpp"
#include "weight_utils.hpp"

namespace codonbias {

FrequencyOfOptimalCodons::FrequencyOfOptimalCodons(
    const std::vector<std::string>& ref_seqs, const FopParams& params)
    : params_(params)
    , counter_(params.genetic_code, 1, params.ignore_stop) {
    detail::check_pseudocount(params_.pseudocount);
    if (!(params_.threshold >= 0.0 && params_.threshold <= 1.0)) {
        throw ConfigError("FOP threshold must be in [0, 1]");
    }

    auto freqs = counter_.count(ref_seqs).aa_table(true, params_.pseudocount);
    auto ratios = detail::ratio_to_group_max(counter_.domain(), freqs);

    size_t n_optimal = 0;
    for (double& r : ratios) {
        if (std::isnan(r)) continue;
        r = r >= params_.threshold ? 1.0 : 0.0;
        if (r == 1.0) ++n_optimal;
    }
    weights_ = WeightTable(counter_.domain_ptr(), std::move(ratios));

    log_utils::log_info("FOP", std::to_string(n_optimal) + " of " +
                                   std::to_string(weights_.size()) +
                                   " codons optimal (threshold " +
                                   std::to_string(params_.threshold) + ")");
}

double FrequencyOfOptimalCodons::calc_score(const std::string& seq) const {
    return weighted_mean(weights_.values(), counter_.count(seq).counts());
}

std::vector<double> FrequencyOfOptimalCodons::calc_vector(const std::string& seq) const {
    return weights_.per_position(seq);
}

} // namespace codonbias
