#pragma once

#include "codon_counter.hpp"
#include "scorer.hpp"

#include <string>
#include <vector>

namespace codonbias {

struct FopParams {
    double threshold = 0.95;   // min frequency ratio to the group's top codon
    int genetic_code = 1;
    bool ignore_stop = true;
    double pseudocount = 1.0;
};

/**
 * Frequency of Optimal Codons (Ikemura, J Mol Biol, 1981)
 *
 * A codon is optimal (weight 1) when its reference frequency is at least
 * `threshold` times that of the most frequent synonymous codon, otherwise
 * non-optimal (weight 0). The score is the fraction of optimal codons.
 */
class FrequencyOfOptimalCodons : public ScalarScorer, public VectorScorer {
public:
    explicit FrequencyOfOptimalCodons(const std::vector<std::string>& ref_seqs,
                                      const FopParams& params = {});

    const WeightTable& weights() const { return weights_; }
    const FopParams& params() const { return params_; }

protected:
    double calc_score(const std::string& seq) const override;
    std::vector<double> calc_vector(const std::string& seq) const override;

private:
    FopParams params_;
    CodonCounter counter_;
    WeightTable weights_;
};

} // namespace codonbias
