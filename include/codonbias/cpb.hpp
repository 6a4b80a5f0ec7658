#pragma once

#include "codon_counter.hpp"
#include "scorer.hpp"

#include <string>
#include <vector>

namespace codonbias {

struct CpbParams {
    int k_mer = 2;
    int genetic_code = 1;
    bool ignore_stop = true;
    double pseudocount = 1.0;
};

/**
 * Codon Pair Bias (Coleman et al., Science, 2008), extended to codon k-mers
 *
 * Codon pair score of a k-mer:
 *   log( (F(codon k-mer) / prod F(codon)) / (F(aa k-mer) / prod F(aa)) )
 * with frequencies from the reference set (counts + pseudocount). 0 means
 * no bias beyond what the amino acid pairing explains; positive values are
 * over-represented k-mers. The score is the mean over the sequence.
 */
class CodonPairBias : public ScalarScorer, public VectorScorer {
public:
    explicit CodonPairBias(const std::vector<std::string>& ref_seqs,
                           const CpbParams& params = {});

    const WeightTable& weights() const { return weights_; }
    const CpbParams& params() const { return params_; }

protected:
    double calc_score(const std::string& seq) const override;
    std::vector<double> calc_vector(const std::string& seq) const override;

private:
    CpbParams params_;
    CodonCounter counter_;
    WeightTable weights_;
};

} // namespace codonbias
