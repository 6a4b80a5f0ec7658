#include "codonbias/scorer.hpp"

#include <exception>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace codonbias {

namespace {

std::ptrdiff_t clamp_bound(std::ptrdiff_t b, std::ptrdiff_t len) {
    if (b < 0) b += len;
    if (b < 0) return 0;
    return b > len ? len : b;
}

// Ordered map of fn over seqs. Sequences are independent, so the loop is
// parallel; the first exception raised by any element is rethrown.
template <typename Result, typename Fn>
std::vector<Result> fan_out(const std::vector<std::string>& seqs, Fn fn) {
    std::vector<Result> out(seqs.size());
    std::exception_ptr error;
    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(seqs.size());

    #pragma omp parallel for schedule(dynamic, 16)
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        try {
            out[i] = fn(seqs[i]);
        } catch (...) {
            #pragma omp critical
            {
                if (!error) error = std::current_exception();
            }
        }
    }

    if (error) std::rethrow_exception(error);
    return out;
}

} // namespace

std::string Slice::apply(const std::string& seq) const {
    const std::ptrdiff_t len = static_cast<std::ptrdiff_t>(seq.length());
    const std::ptrdiff_t b = start ? clamp_bound(*start, len) : 0;
    const std::ptrdiff_t e = stop ? clamp_bound(*stop, len) : len;
    if (e <= b) return std::string();
    return seq.substr(static_cast<size_t>(b), static_cast<size_t>(e - b));
}

// ---------------------------------------------------------------------------
// ScalarScorer
// ---------------------------------------------------------------------------

double ScalarScorer::score(const std::string& seq) const {
    return calc_score(seq);
}

double ScalarScorer::score(const std::string& seq, const Slice& slice) const {
    return calc_score(slice.apply(seq));
}

std::vector<double> ScalarScorer::score(const std::vector<std::string>& seqs) const {
    return fan_out<double>(seqs, [this](const std::string& s) { return calc_score(s); });
}

std::vector<double> ScalarScorer::score(const std::vector<std::string>& seqs,
                                        const Slice& slice) const {
    return fan_out<double>(seqs, [this, &slice](const std::string& s) {
        return calc_score(slice.apply(s));
    });
}

// ---------------------------------------------------------------------------
// VectorScorer
// ---------------------------------------------------------------------------

std::vector<double> VectorScorer::vector(const std::string& seq) const {
    return calc_vector(seq);
}

std::vector<double> VectorScorer::vector(const std::string& seq, const Slice& slice) const {
    return calc_vector(slice.apply(seq));
}

std::vector<std::vector<double>> VectorScorer::vector(
    const std::vector<std::string>& seqs) const {
    return fan_out<std::vector<double>>(seqs, [this](const std::string& s) {
        return calc_vector(s);
    });
}

std::vector<std::vector<double>> VectorScorer::vector(
    const std::vector<std::string>& seqs, const Slice& slice) const {
    return fan_out<std::vector<double>>(seqs, [this, &slice](const std::string& s) {
        return calc_vector(slice.apply(s));
    });
}

} // namespace codonbias
