#pragma once

#include "codon_counter.hpp"
#include "scorer.hpp"
#include "tai_coefficients.hpp"
#include "trna_gcn.hpp"

#include <string>
#include <vector>

namespace codonbias {

struct TaiParams {
    bool prokaryote = false;           // enables prokaryote-only couplings
    std::string s_values = "dosReis";  // packaged coefficient set
    int genetic_code = 1;
};

/**
 * tRNA Adaptation Index (dos Reis, Savva & Wernisch, NAR, 2004)
 *
 * Codon weights combine the gene copy numbers of the tRNAs able to decode
 * the codon with their coupling efficiency (1 - s). Weights are scaled to
 * a maximum of 1; codons no tRNA decodes get the geometric mean of the
 * other weights. The score is the geometric mean of the weights over the
 * sequence, in (0, 1].
 */
class TrnaAdaptationIndex : public ScalarScorer, public VectorScorer {
public:
    // Coefficients from the packaged set named in params.s_values
    explicit TrnaAdaptationIndex(const GcnTable& gcn, const TaiParams& params = {});
    TrnaAdaptationIndex(const GcnTable& gcn, const TaiCoefficientSet& coefficients,
                        const TaiParams& params = {});

    // Resolves gene copy numbers first (may block on the fetcher).
    // Throws ConfigError when the source holds neither table nor fetch parameters.
    static TrnaAdaptationIndex from_source(const GcnSource& source,
                                           const GcnFetcher& fetcher,
                                           const TaiParams& params = {});

    const WeightTable& weights() const { return weights_; }
    const GcnTable& gcn() const { return gcn_; }
    const TaiParams& params() const { return params_; }

protected:
    double calc_score(const std::string& seq) const override;
    std::vector<double> calc_vector(const std::string& seq) const override;

private:
    std::vector<double> calc_weights(const TaiCoefficientSet& coefficients) const;

    TaiParams params_;
    CodonCounter counter_;
    GcnTable gcn_;
    WeightTable weights_;
    std::vector<double> log_weights_;
};

} // namespace codonbias
