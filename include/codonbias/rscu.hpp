#pragma once

#include "codon_counter.hpp"
#include "scorer.hpp"

#include <string>
#include <vector>

namespace codonbias {

struct RscuParams {
    bool directional = false;          // max(ratio, 1/ratio), after Sabi & Tuller
    std::string mean = "geometric";    // "geometric" or "arithmetic"
    int genetic_code = 1;
    bool ignore_stop = true;
    double pseudocount = 1.0;
};

/**
 * Relative Synonymous Codon Usage (Sharp & Li, NAR, 1986)
 *
 * Each codon is weighted by the ratio of its within-amino-acid frequency in
 * the scored sequence to its background frequency: uniform over synonymous
 * codons, or taken from a reference set when one is given. The score is the
 * geometric mean of the ratios minus 1 (or their arithmetic mean).
 */
class RelativeSynonymousCodonUsage : public ScalarScorer, public VectorScorer {
public:
    // Uniform background
    explicit RelativeSynonymousCodonUsage(const RscuParams& params = {});
    // Background from the codon usage of ref_seqs
    explicit RelativeSynonymousCodonUsage(const std::vector<std::string>& ref_seqs,
                                          const RscuParams& params = {});

    // Ratio of every codon of the domain for one sequence
    WeightTable weights(const std::string& seq) const;

    const WeightTable& background() const { return background_; }
    const RscuParams& params() const { return params_; }

protected:
    double calc_score(const std::string& seq) const override;
    std::vector<double> calc_vector(const std::string& seq) const override;

private:
    RelativeSynonymousCodonUsage(const std::vector<std::string>* ref_seqs,
                                 const RscuParams& params);

    WeightTable calc_weights(const CodonCounts& counts) const;

    RscuParams params_;
    CodonCounter counter_;
    WeightTable background_;
};

} // namespace codonbias
