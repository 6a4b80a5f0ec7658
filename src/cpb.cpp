#include "codonbias/cpb.hpp"
#include "codonbias/log_utils.hpp"
#include "codonbias/stats_utils.hpp"
#include "weight_utils.hpp"

#include <cmath>
#include <unordered_map>

namespace codonbias {

CodonPairBias::CodonPairBias(const std::vector<std::string>& ref_seqs,
                             const CpbParams& params)
    : params_(params)
    , counter_(params.genetic_code, params.k_mer, params.ignore_stop) {
    detail::check_pseudocount(params_.pseudocount);

    const CodonDomain& dom = counter_.domain();
    const size_t k = static_cast<size_t>(params_.k_mer);
    const size_t n_codons = dom.codons().size();

    const auto ref_counts = counter_.count(ref_seqs);
    const auto counts = ref_counts.aa_table(false, params_.pseudocount);

    double total = 0.0;
    for (double c : counts) total += c;

    // Marginal codon and amino acid counts, pooled over all k positions
    std::vector<double> codon_marginal(n_codons, 0.0);
    std::unordered_map<char, double> aa_marginal;
    std::vector<double> aa_mer(dom.num_groups(), 0.0);
    std::vector<size_t> digits(k);

    auto decode = [&](size_t idx) {
        for (size_t j = k; j-- > 0;) {
            digits[j] = idx % n_codons;
            idx /= n_codons;
        }
    };

    for (size_t i = 0; i < dom.size(); ++i) {
        decode(i);
        const std::string& aa = dom.aa_key(i);
        for (size_t j = 0; j < k; ++j) {
            codon_marginal[digits[j]] += counts[i];
            aa_marginal[aa[j]] += counts[i];
        }
        aa_mer[dom.group_of(i)] += counts[i];
    }
    const double marginal_total = total * static_cast<double>(k);

    std::vector<double> log_ratio(dom.size());
    for (size_t i = 0; i < dom.size(); ++i) {
        decode(i);
        const std::string& aa = dom.aa_key(i);
        double codon_ind = 1.0;
        double aa_ind = 1.0;
        for (size_t j = 0; j < k; ++j) {
            codon_ind *= codon_marginal[digits[j]] / marginal_total;
            aa_ind *= aa_marginal[aa[j]] / marginal_total;
        }
        const double codon_obs = counts[i] / total;
        const double aa_obs = aa_mer[dom.group_of(i)] / total;
        log_ratio[i] = std::log(codon_obs / codon_ind * aa_ind / aa_obs);
    }
    weights_ = WeightTable(counter_.domain_ptr(), std::move(log_ratio));

    log_utils::log_info("CPB", std::to_string(weights_.size()) + " " +
                                   std::to_string(k) + "-mer scores from " +
                                   std::to_string(ref_counts.total()) + " reference windows");
}

double CodonPairBias::calc_score(const std::string& seq) const {
    return weighted_mean(weights_.values(), counter_.count(seq).counts());
}

std::vector<double> CodonPairBias::calc_vector(const std::string& seq) const {
    return weights_.per_position(seq);
}

} // namespace codonbias
