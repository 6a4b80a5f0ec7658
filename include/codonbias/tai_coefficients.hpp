#pragma once

#include <string>
#include <vector>

namespace codonbias {

/**
 * tRNA-codon coupling coefficient (s-value)
 *
 * Pairs the first (wobble) anti-codon base with the third codon base.
 * Bases are DNA letters; 'A' in the anti-codon stands for inosine.
 * weight in [0, 1]: 0 = full efficiency. The pairing only applies to
 * codons whose amino acid has at least min_deg synonymous codons.
 */
struct TaiCoefficient {
    char anti = 'N';
    char cod = 'N';
    double weight = 0.0;
    int min_deg = 1;
    bool prokaryote = false;   // only valid in prokaryotes (e.g. lysidine)
};

using TaiCoefficientSet = std::vector<TaiCoefficient>;

// Packaged sets: "dosReis" (dos Reis et al., NAR, 2004), "Tuller"
// (Tuller et al., refit on protein abundance). Throws ConfigError.
const TaiCoefficientSet& tai_coefficients(const std::string& name);

std::vector<std::string> tai_coefficient_set_names();

// CSV with header anti,cod,weight,min_deg,prokaryote; '#' comments.
// Throws RetrievalError when unreadable or malformed.
TaiCoefficientSet load_tai_coefficients(const std::string& path);

} // namespace codonbias
