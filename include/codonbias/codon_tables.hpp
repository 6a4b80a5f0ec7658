#pragma once

#include <array>
#include <string>
#include <vector>

namespace codonbias {

/**
 * Fast inline character operations
 * Using lookup tables instead of branches/function calls
 */

// Fast uppercase
inline char fast_upper(char c) {
    return (c >= 'a' && c <= 'z') ? (c - 32) : c;
}

// Fast complement - direct lookup
inline char fast_complement(char c) {
    switch (c) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'a': return 't';
        case 't': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        default: return 'N';
    }
}

// Base to index in ACGT order (nucleotide composition tables)
inline int fast_base_idx(char c) {
    switch (c) {
        case 'A': case 'a': return 0;
        case 'C': case 'c': return 1;
        case 'G': case 'g': return 2;
        case 'T': case 't': return 3;
        default: return -1;
    }
}

inline constexpr std::array<char, 4> kAcgt = {'A', 'C', 'G', 'T'};

// Base to index in TCAG order (NCBI genetic code tables)
inline int tcag_idx(char c) {
    switch (fast_upper(c)) {
        case 'T': return 0;
        case 'C': return 1;
        case 'A': return 2;
        case 'G': return 3;
        default: return -1;
    }
}

inline constexpr std::array<char, 4> kTcag = {'T', 'C', 'A', 'G'};

// Codon to array index 0-63 (TCAG order), -1 for ambiguous bases
inline int codon_to_idx(char c1, char c2, char c3) {
    int i1 = tcag_idx(c1);
    int i2 = tcag_idx(c2);
    int i3 = tcag_idx(c3);
    if (i1 < 0 || i2 < 0 || i3 < 0) return -1;
    return i1 * 16 + i2 * 4 + i3;
}

inline std::string idx_to_codon(int idx) {
    std::string codon(3, 'N');
    codon[0] = kTcag[(idx >> 4) & 3];
    codon[1] = kTcag[(idx >> 2) & 3];
    codon[2] = kTcag[idx & 3];
    return codon;
}

inline std::string reverse_complement(const std::string& seq) {
    std::string rc;
    rc.reserve(seq.length());
    for (auto it = seq.rbegin(); it != seq.rend(); ++it) {
        rc += fast_complement(*it);
    }
    return rc;
}

/**
 * NCBI genetic code (translation table)
 *
 * Codon order is TCAG: index = base1*16 + base2*4 + base3.
 * Stop codons translate to '*'.
 */
class GeneticCode {
public:
    // Throws ConfigError for ids without a table
    explicit GeneticCode(int id = 1);

    int id() const { return id_; }
    const std::string& name() const { return name_; }

    // '\0' for codons with ambiguous bases
    char translate(const char* codon) const {
        int idx = codon_to_idx(codon[0], codon[1], codon[2]);
        return idx < 0 ? '\0' : aa_[idx];
    }
    char translate(const std::string& codon) const {
        return codon.size() < 3 ? '\0' : translate(codon.data());
    }
    char translate_idx(int idx) const { return aa_[idx]; }

    bool is_stop(const std::string& codon) const { return translate(codon) == '*'; }

    std::vector<std::string> stop_codons() const;

    // Table ids this build knows about
    static std::vector<int> available_ids();

private:
    int id_;
    std::string name_;
    std::string aa_;  // 64 letters, TCAG order
};

} // namespace codonbias
