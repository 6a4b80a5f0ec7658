#include "codonbias/codon_counter.hpp"
#include "codonbias/errors.hpp"

#include <unordered_map>

namespace codonbias {

// ---------------------------------------------------------------------------
// CodonDomain
// ---------------------------------------------------------------------------

CodonDomain::CodonDomain(const GeneticCode& code, int k_mer, bool ignore_stop)
    : k_mer_(k_mer) {
    if (k_mer < 1) {
        throw ConfigError("k_mer must be >= 1, got " + std::to_string(k_mer));
    }

    std::string codon_aa;
    codon_id_of_idx_.fill(-1);
    for (int idx = 0; idx < 64; ++idx) {
        char aa = code.translate_idx(idx);
        if (ignore_stop && aa == '*') continue;
        codon_id_of_idx_[idx] = static_cast<int>(codons_.size());
        codons_.push_back(idx_to_codon(idx));
        codon_aa += aa;
    }

    const size_t n = codons_.size();
    size_t total = 1;
    for (int j = 0; j < k_mer; ++j) total *= n;

    keys_.reserve(total);
    aa_keys_.reserve(total);
    group_.reserve(total);

    std::unordered_map<std::string, size_t> group_index;
    std::vector<size_t> digits(k_mer, 0);
    for (size_t t = 0; t < total; ++t) {
        // Mixed radix, most significant codon first
        size_t rem = t;
        for (int j = k_mer - 1; j >= 0; --j) {
            digits[j] = rem % n;
            rem /= n;
        }

        std::string key;
        std::string aa_key;
        key.reserve(3 * k_mer);
        aa_key.reserve(k_mer);
        for (int j = 0; j < k_mer; ++j) {
            key += codons_[digits[j]];
            aa_key += codon_aa[digits[j]];
        }

        auto it = group_index.find(aa_key);
        size_t g;
        if (it == group_index.end()) {
            g = groups_.size();
            group_index.emplace(aa_key, g);
            groups_.emplace_back();
            group_labels_.push_back(aa_key);
        } else {
            g = it->second;
        }
        groups_[g].push_back(t);
        group_.push_back(g);
        keys_.push_back(std::move(key));
        aa_keys_.push_back(std::move(aa_key));
    }
}

std::optional<size_t> CodonDomain::find(std::string_view key) const {
    if (key.size() != key_length()) return std::nullopt;

    const size_t n = codons_.size();
    size_t idx = 0;
    for (int j = 0; j < k_mer_; ++j) {
        int id = codon_id(key.data() + 3 * j);
        if (id < 0) return std::nullopt;
        idx = idx * n + static_cast<size_t>(id);
    }
    return idx;
}

// ---------------------------------------------------------------------------
// CodonCounts
// ---------------------------------------------------------------------------

CodonCounts::CodonCounts(std::shared_ptr<const CodonDomain> domain,
                         std::vector<uint64_t> counts)
    : domain_(std::move(domain))
    , counts_(std::move(counts)) {
    for (uint64_t c : counts_) total_ += c;
}

std::vector<double> CodonCounts::group_totals() const {
    std::vector<double> totals(domain_->num_groups(), 0.0);
    for (size_t i = 0; i < counts_.size(); ++i) {
        totals[domain_->group_of(i)] += static_cast<double>(counts_[i]);
    }
    return totals;
}

std::vector<double> CodonCounts::aa_table(bool normed, double pseudocount) const {
    std::vector<double> table(counts_.size());
    for (size_t i = 0; i < counts_.size(); ++i) {
        table[i] = static_cast<double>(counts_[i]) + pseudocount;
    }
    if (!normed) return table;

    std::vector<double> sums(domain_->num_groups(), 0.0);
    for (size_t i = 0; i < table.size(); ++i) {
        sums[domain_->group_of(i)] += table[i];
    }
    // Empty groups become 0/0 (NaN), i.e. undefined frequencies
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] /= sums[domain_->group_of(i)];
    }
    return table;
}

std::vector<double> CodonCounts::codon_table(bool normed, double pseudocount) const {
    std::vector<double> table(counts_.size());
    double sum = 0.0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        table[i] = static_cast<double>(counts_[i]) + pseudocount;
        sum += table[i];
    }
    if (normed) {
        for (double& v : table) v /= sum;
    }
    return table;
}

// ---------------------------------------------------------------------------
// CodonCounter
// ---------------------------------------------------------------------------

CodonCounter::CodonCounter(int genetic_code, int k_mer, bool ignore_stop)
    : code_(genetic_code)
    , ignore_stop_(ignore_stop)
    , domain_(std::make_shared<const CodonDomain>(code_, k_mer, ignore_stop)) {}

void CodonCounter::accumulate(const std::string& seq,
                              std::vector<uint64_t>& counts) const {
    const CodonDomain& dom = *domain_;
    const size_t num_codons = seq.length() / 3;
    const size_t k = static_cast<size_t>(dom.k_mer());
    if (num_codons < k) return;

    std::vector<int> ids(num_codons);
    for (size_t c = 0; c < num_codons; ++c) {
        ids[c] = dom.codon_id(seq.data() + 3 * c);
    }

    const size_t n = dom.codons().size();
    for (size_t start = 0; start + k <= num_codons; ++start) {
        size_t idx = 0;
        bool valid = true;
        for (size_t j = 0; j < k; ++j) {
            int id = ids[start + j];
            if (id < 0) {
                valid = false;
                break;
            }
            idx = idx * n + static_cast<size_t>(id);
        }
        if (valid) ++counts[idx];
    }
}

CodonCounts CodonCounter::count(const std::string& seq) const {
    std::vector<uint64_t> counts(domain_->size(), 0);
    accumulate(seq, counts);
    return CodonCounts(domain_, std::move(counts));
}

CodonCounts CodonCounter::count(const std::vector<std::string>& seqs) const {
    std::vector<uint64_t> counts(domain_->size(), 0);
    for (const auto& seq : seqs) {
        accumulate(seq, counts);
    }
    return CodonCounts(domain_, std::move(counts));
}

// ---------------------------------------------------------------------------
// WeightTable
// ---------------------------------------------------------------------------

WeightTable::WeightTable(std::shared_ptr<const CodonDomain> domain,
                         std::vector<double> values)
    : domain_(std::move(domain))
    , values_(std::move(values)) {}

double WeightTable::lookup(std::string_view key) const {
    auto idx = domain_->find(key);
    return idx ? values_[*idx] : kMissing;
}

std::vector<double> WeightTable::per_position(const std::string& seq) const {
    const size_t len = domain_->key_length();
    std::vector<double> out;
    out.reserve((seq.length() + 2) / 3);
    for (size_t i = 0; i < seq.length(); i += 3) {
        if (i + len > seq.length()) {
            out.push_back(kMissing);
        } else {
            out.push_back(lookup(std::string_view(seq).substr(i, len)));
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Nucleotide composition
// ---------------------------------------------------------------------------

namespace {

void add_bases(const std::string& seq, size_t start, size_t step,
               std::array<uint64_t, 4>& counts) {
    for (size_t i = start; i < seq.length(); i += step) {
        int b = fast_base_idx(seq[i]);
        if (b >= 0) ++counts[b];
    }
}

NucleotideComposition normalize(const std::array<uint64_t, 4>& counts) {
    uint64_t total = counts[0] + counts[1] + counts[2] + counts[3];
    NucleotideComposition comp;
    for (int b = 0; b < 4; ++b) {
        comp[b] = total == 0 ? 0.25
                             : static_cast<double>(counts[b]) / static_cast<double>(total);
    }
    return comp;
}

} // namespace

NucleotideComposition nucleotide_composition(const std::string& seq) {
    std::array<uint64_t, 4> counts{};
    add_bases(seq, 0, 1, counts);
    return normalize(counts);
}

NucleotideComposition nucleotide_composition(const std::vector<std::string>& seqs) {
    std::array<uint64_t, 4> counts{};
    for (const auto& seq : seqs) add_bases(seq, 0, 1, counts);
    return normalize(counts);
}

std::array<NucleotideComposition, 3> positional_composition(const std::string& seq) {
    std::array<NucleotideComposition, 3> comps;
    for (size_t pos = 0; pos < 3; ++pos) {
        std::array<uint64_t, 4> counts{};
        add_bases(seq, pos, 3, counts);
        comps[pos] = normalize(counts);
    }
    return comps;
}

} // namespace codonbias
