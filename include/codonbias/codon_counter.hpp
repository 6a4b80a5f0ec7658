#pragma once

#include "codon_tables.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codonbias {

// Missing value: codon outside the domain, partial window
inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

/**
 * Enumeration of all codon k-mers under a genetic code
 *
 * Entries are the k-fold product of the codons of the code (stop codons
 * dropped when ignore_stop), in TCAG order. Each entry carries its
 * concatenated codon key ("AAAGGC") and amino acid key ("KG"); entries
 * sharing an amino acid key form a synonymous group.
 */
class CodonDomain {
public:
    CodonDomain(const GeneticCode& code, int k_mer, bool ignore_stop);

    size_t size() const { return keys_.size(); }
    int k_mer() const { return k_mer_; }
    size_t key_length() const { return static_cast<size_t>(3 * k_mer_); }

    const std::string& key(size_t i) const { return keys_[i]; }
    const std::string& aa_key(size_t i) const { return aa_keys_[i]; }

    size_t group_of(size_t i) const { return group_[i]; }
    size_t num_groups() const { return groups_.size(); }
    const std::vector<size_t>& group_members(size_t g) const { return groups_[g]; }
    const std::string& group_label(size_t g) const { return group_labels_[g]; }

    // Number of synonymous entries sharing the group of entry i
    size_t degeneracy(size_t i) const { return groups_[group_[i]].size(); }

    // Codons of a single position (k=1 domain)
    const std::vector<std::string>& codons() const { return codons_; }
    int codon_id(const char* c) const {
        int idx = codon_to_idx(c[0], c[1], c[2]);
        return idx < 0 ? -1 : codon_id_of_idx_[idx];
    }

    // Index of a k-mer key (case-insensitive); nullopt when outside the domain
    std::optional<size_t> find(std::string_view key) const;

private:
    int k_mer_;
    std::vector<std::string> codons_;
    std::array<int, 64> codon_id_of_idx_{};
    std::vector<std::string> keys_;
    std::vector<std::string> aa_keys_;
    std::vector<size_t> group_;
    std::vector<std::vector<size_t>> groups_;
    std::vector<std::string> group_labels_;
};

/**
 * Raw k-mer counts aligned to a CodonDomain
 */
class CodonCounts {
public:
    CodonCounts(std::shared_ptr<const CodonDomain> domain,
                std::vector<uint64_t> counts);

    const CodonDomain& domain() const { return *domain_; }
    const std::vector<uint64_t>& counts() const { return counts_; }
    uint64_t total() const { return total_; }

    // Per-group sums of the raw counts (indexed by group)
    std::vector<double> group_totals() const;

    // counts + pseudocount, normalized within each synonymous group when normed
    std::vector<double> aa_table(bool normed = false, double pseudocount = 0.0) const;

    // counts + pseudocount, normalized over the whole domain when normed
    std::vector<double> codon_table(bool normed = false, double pseudocount = 0.0) const;

private:
    std::shared_ptr<const CodonDomain> domain_;
    std::vector<uint64_t> counts_;
    uint64_t total_ = 0;
};

/**
 * Codon (k-mer) counting engine
 *
 * Windows of k codons step one codon from the start of the sequence.
 * Trailing partial windows and windows with a codon outside the domain
 * (ambiguous base, dropped stop) are skipped.
 */
class CodonCounter {
public:
    explicit CodonCounter(int genetic_code = 1, int k_mer = 1, bool ignore_stop = true);

    CodonCounts count(const std::string& seq) const;
    // Counts summed over all sequences
    CodonCounts count(const std::vector<std::string>& seqs) const;

    const GeneticCode& genetic_code() const { return code_; }
    const CodonDomain& domain() const { return *domain_; }
    const std::shared_ptr<const CodonDomain>& domain_ptr() const { return domain_; }
    bool ignore_stop() const { return ignore_stop_; }

private:
    void accumulate(const std::string& seq, std::vector<uint64_t>& counts) const;

    GeneticCode code_;
    bool ignore_stop_;
    std::shared_ptr<const CodonDomain> domain_;
};

/**
 * Frozen per-entry weights over a CodonDomain
 */
class WeightTable {
public:
    WeightTable() = default;
    WeightTable(std::shared_ptr<const CodonDomain> domain, std::vector<double> values);

    size_t size() const { return values_.size(); }
    double operator[](size_t i) const { return values_[i]; }
    const std::vector<double>& values() const { return values_; }
    const CodonDomain& domain() const { return *domain_; }

    // kMissing when the key is outside the domain
    double lookup(std::string_view key) const;

    // One weight per codon start position (0, 3, 6, ...); windows running
    // past the end of the sequence are kMissing
    std::vector<double> per_position(const std::string& seq) const;

private:
    std::shared_ptr<const CodonDomain> domain_;
    std::vector<double> values_;
};

// A, C, G, T frequencies
using NucleotideComposition = std::array<double, 4>;

// Non-ACGT characters are ignored; no valid base yields the uniform 0.25
NucleotideComposition nucleotide_composition(const std::string& seq);
NucleotideComposition nucleotide_composition(const std::vector<std::string>& seqs);

// Composition of each codon position, from seq[i::3]
std::array<NucleotideComposition, 3> positional_composition(const std::string& seq);

} // namespace codonbias
