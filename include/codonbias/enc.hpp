#pragma once

#include "codon_counter.hpp"
#include "scorer.hpp"

#include <map>
#include <string>
#include <vector>

namespace codonbias {

struct EncParams {
    bool bg_correction = false;   // Novembre (MBE, 2002) background correction
    int genetic_code = 1;
};

/**
 * Effective Number of Codons (Wright, Gene, 1990)
 *
 * Ranges from 20 (one codon per amino acid) to 61 (uniform synonymous
 * usage) under the standard code. The per-amino-acid homozygosity F is
 * computed from a chi-square deviation against a background codon
 * composition: uniform within each amino acid by default, or derived from
 * the nucleotide composition of the sequence (or of a separate background
 * sequence) when bg_correction is set.
 *
 * Degeneracy classes without any usable amino acid (fewer than two
 * observations, or non-finite F) fall back to F = 1/degeneracy; a missing
 * 3-fold class is interpolated from the 2- and 4-fold classes.
 */
class EffectiveNumberOfCodons : public ScalarScorer {
public:
    explicit EffectiveNumberOfCodons(const EncParams& params = {});

    // Background nucleotides from `background` (used with bg_correction only);
    // the slice applies to seq alone
    double score_with_background(const std::string& seq,
                                 const std::string& background) const;
    double score_with_background(const std::string& seq,
                                 const std::string& background,
                                 const Slice& slice) const;

    const EncParams& params() const { return params_; }

protected:
    double calc_score(const std::string& seq) const override;

private:
    double calc_enc(const std::string& seq, const std::string& background) const;
    std::vector<double> background_codon_composition(const NucleotideComposition& bnc) const;

    EncParams params_;
    CodonCounter counter_;
    std::vector<double> bcc_uniform_;
    std::map<size_t, size_t> class_sizes_;  // degeneracy -> number of amino acids
};

} // namespace codonbias
