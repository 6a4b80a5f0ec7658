#pragma once

#include "codon_counter.hpp"
#include "scorer.hpp"

#include <string>
#include <vector>

namespace codonbias {

struct CaiParams {
    int k_mer = 1;
    int genetic_code = 1;
    bool ignore_stop = true;
    double pseudocount = 1.0;
};

/**
 * Codon Adaptation Index (Sharp & Li, NAR, 1987), extended to codon k-mers
 *
 * Weight of a codon (k-mer) = its reference frequency relative to the most
 * frequent synonymous codon (k-mer). The score is the geometric mean of
 * the weights over the sequence, in (0, 1].
 */
class CodonAdaptationIndex : public ScalarScorer, public VectorScorer {
public:
    explicit CodonAdaptationIndex(const std::vector<std::string>& ref_seqs,
                                  const CaiParams& params = {});

    const WeightTable& weights() const { return weights_; }
    const CaiParams& params() const { return params_; }

protected:
    double calc_score(const std::string& seq) const override;
    std::vector<double> calc_vector(const std::string& seq) const override;

private:
    CaiParams params_;
    CodonCounter counter_;
    WeightTable weights_;
    std::vector<double> log_weights_;
};

} // namespace codonbias
