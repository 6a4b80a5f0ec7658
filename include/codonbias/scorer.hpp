#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codonbias {

/**
 * Half-open sub-range of a sequence, applied before scoring
 *
 * Negative bounds count from the end; bounds are clamped to the sequence,
 * so an out-of-range slice yields an empty (or shorter) sequence.
 */
struct Slice {
    std::optional<std::ptrdiff_t> start;
    std::optional<std::ptrdiff_t> stop;

    static Slice to(std::ptrdiff_t stop) { return Slice{std::nullopt, stop}; }
    static Slice from(std::ptrdiff_t start) { return Slice{start, std::nullopt}; }
    static Slice range(std::ptrdiff_t start, std::ptrdiff_t stop) { return Slice{start, stop}; }

    std::string apply(const std::string& seq) const;
};

/**
 * Models producing one scalar per sequence
 *
 * Collections are scored element by element, in input order; the
 * per-sequence computation is the model's calc_score().
 */
class ScalarScorer {
public:
    virtual ~ScalarScorer() = default;

    double score(const std::string& seq) const;
    double score(const std::string& seq, const Slice& slice) const;
    std::vector<double> score(const std::vector<std::string>& seqs) const;
    std::vector<double> score(const std::vector<std::string>& seqs, const Slice& slice) const;

protected:
    virtual double calc_score(const std::string& seq) const = 0;
};

/**
 * Models producing one value per codon position
 */
class VectorScorer {
public:
    virtual ~VectorScorer() = default;

    std::vector<double> vector(const std::string& seq) const;
    std::vector<double> vector(const std::string& seq, const Slice& slice) const;
    std::vector<std::vector<double>> vector(const std::vector<std::string>& seqs) const;
    std::vector<std::vector<double>> vector(const std::vector<std::string>& seqs,
                                            const Slice& slice) const;

protected:
    virtual std::vector<double> calc_vector(const std::string& seq) const = 0;
};

} // namespace codonbias
