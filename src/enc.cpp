#include "codonbias/enc.hpp"
#include "codonbias/log_utils.hpp"

#include <algorithm>
#include <cmath>

namespace codonbias {

namespace {

// Amino acids need at least this F to enter their class average
constexpr double MIN_F = 1e-6;

} // namespace

EffectiveNumberOfCodons::EffectiveNumberOfCodons(const EncParams& params)
    : params_(params)
    , counter_(params.genetic_code, 1, true) {  // not defined for stop codons
    const CodonDomain& dom = counter_.domain();
    for (size_t g = 0; g < dom.num_groups(); ++g) {
        ++class_sizes_[dom.group_members(g).size()];
    }
    bcc_uniform_ = background_codon_composition(nucleotide_composition(std::string()));

    log_utils::log_info("ENC", std::to_string(dom.num_groups()) + " amino acids in " +
                                   std::to_string(class_sizes_.size()) +
                                   " degeneracy classes, background correction " +
                                   (params_.bg_correction ? "on" : "off"));
}

std::vector<double> EffectiveNumberOfCodons::background_codon_composition(
    const NucleotideComposition& bnc) const {
    const CodonDomain& dom = counter_.domain();
    std::vector<double> bcc(dom.size());
    for (size_t i = 0; i < dom.size(); ++i) {
        const std::string& c = dom.key(i);
        bcc[i] = bnc[fast_base_idx(c[0])] * bnc[fast_base_idx(c[1])] *
                 bnc[fast_base_idx(c[2])];
    }
    for (size_t g = 0; g < dom.num_groups(); ++g) {
        double sum = 0.0;
        for (size_t i : dom.group_members(g)) sum += bcc[i];
        for (size_t i : dom.group_members(g)) bcc[i] /= sum;
    }
    return bcc;
}

double EffectiveNumberOfCodons::calc_enc(const std::string& seq,
                                         const std::string& background) const {
    const CodonDomain& dom = counter_.domain();
    const auto counts = counter_.count(seq);
    const auto& raw = counts.counts();
    const auto totals = counts.group_totals();

    std::vector<double> bcc_corrected;
    if (params_.bg_correction) {
        bcc_corrected = background_codon_composition(nucleotide_composition(background));
    }
    const std::vector<double>& bcc = params_.bg_correction ? bcc_corrected : bcc_uniform_;

    // degeneracy -> (sum of F, number of amino acids with a usable F)
    std::map<size_t, std::pair<double, size_t>> class_f;

    for (size_t g = 0; g < dom.num_groups(); ++g) {
        const auto& members = dom.group_members(g);
        const double deg = static_cast<double>(members.size());
        const double n = totals[g];
        if (n <= 1.0) continue;

        double chi2 = 0.0;
        for (size_t i : members) {
            const double p = static_cast<double>(raw[i]) / n;
            chi2 += (p - bcc[i]) * (p - bcc[i]) / bcc[i];
        }
        chi2 *= n;

        const double f = (chi2 + n - deg) / ((n - 1.0) * deg);
        if (!std::isfinite(f) || f <= MIN_F) continue;

        auto& acc = class_f[members.size()];
        acc.first += f;
        ++acc.second;
    }

    std::map<size_t, double> f_avg;
    for (const auto& entry : class_sizes_) {
        const size_t deg = entry.first;
        auto it = class_f.find(deg);
        f_avg[deg] = it != class_f.end()
                         ? it->second.first / static_cast<double>(it->second.second)
                         : 1.0 / static_cast<double>(deg);
    }
    if (class_sizes_.count(3) && !class_f.count(3) &&
        f_avg.count(2) && f_avg.count(4)) {
        f_avg[3] = 0.5 * (f_avg[2] + f_avg[4]);
    }

    double enc = 0.0;
    for (const auto& [deg, n_aa] : class_sizes_) {
        enc += static_cast<double>(n_aa) / f_avg[deg];
    }
    return std::min(static_cast<double>(dom.size()), enc);
}

double EffectiveNumberOfCodons::calc_score(const std::string& seq) const {
    return calc_enc(seq, seq);
}

double EffectiveNumberOfCodons::score_with_background(const std::string& seq,
                                                      const std::string& background) const {
    return calc_enc(seq, background);
}

double EffectiveNumberOfCodons::score_with_background(const std::string& seq,
                                                      const std::string& background,
                                                      const Slice& slice) const {
    return calc_enc(slice.apply(seq), background);
}

} // namespace codonbias
