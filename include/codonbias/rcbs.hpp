#pragma once

#include "codon_counter.hpp"
#include "scorer.hpp"

#include <string>
#include <vector>

namespace codonbias {

struct RcbsParams {
    bool directional = false;          // DCBS (Sabi & Tuller, DNA Research, 2014)
    std::string mean = "geometric";    // "geometric" or "arithmetic"
    int genetic_code = 1;
    bool ignore_stop = true;
    double pseudocount = 1.0;
};

/**
 * Relative Codon Bias Score (Roymondal, Das & Sahoo, DNA Research, 2009)
 *
 * Nothing is fitted: each sequence is compared with its own background,
 * the product of the nucleotide compositions of the three codon positions.
 * Codon weight = observed / expected frequency, or max(o/e, e/o) when
 * directional. The score is the geometric mean of the weights minus 1
 * (or their arithmetic mean).
 */
class RelativeCodonBiasScore : public ScalarScorer, public VectorScorer {
public:
    explicit RelativeCodonBiasScore(const RcbsParams& params = {});

    // Ratio of every codon of the domain for one sequence
    WeightTable weights(const std::string& seq) const;

    const RcbsParams& params() const { return params_; }

protected:
    double calc_score(const std::string& seq) const override;
    std::vector<double> calc_vector(const std::string& seq) const override;

private:
    WeightTable calc_weights(const std::string& seq, const CodonCounts& counts) const;

    RcbsParams params_;
    CodonCounter counter_;
};

} // namespace codonbias
