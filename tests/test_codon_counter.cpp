// Unit tests for genetic codes, the codon counting engine and the
// numeric helpers shared by the models.

#include "codonbias/codon_counter.hpp"
#include "codonbias/codon_tables.hpp"
#include "codonbias/errors.hpp"
#include "codonbias/stats_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <numeric>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool approx(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

int test_genetic_codes() {
    std::cout << "Testing genetic codes... ";
    int failed = 0;

    codonbias::GeneticCode standard(1);
    expect(standard.translate("ATG") == 'M', "ATG is Met", failed);
    expect(standard.translate("tgg") == 'W', "lower case codon", failed);
    expect(standard.is_stop("TGA"), "TGA is a stop in table 1", failed);
    expect(standard.translate("ANG") == '\0', "ambiguous codon", failed);
    expect(standard.stop_codons().size() == 3, "three stops in table 1", failed);
    expect(standard.name() == "Standard", "table 1 name", failed);

    auto ids = codonbias::GeneticCode::available_ids();
    bool all_construct = !ids.empty();
    for (int id : ids) {
        codonbias::GeneticCode code(id);
        all_construct = all_construct && code.id() == id && !code.name().empty();
    }
    expect(all_construct, "every listed table constructs", failed);
    expect(std::find(ids.begin(), ids.end(), 7) == ids.end(), "table 7 not listed", failed);

    codonbias::GeneticCode mito(2);
    expect(mito.translate("TGA") == 'W', "TGA is Trp in table 2", failed);
    expect(mito.is_stop("AGA"), "AGA is a stop in table 2", failed);
    expect(mito.stop_codons().size() == 4, "four stops in table 2", failed);

    bool threw = false;
    try {
        codonbias::GeneticCode bad(7);
    } catch (const codonbias::ConfigError&) {
        threw = true;
    }
    expect(threw, "table 7 does not exist", failed);

    expect(codonbias::reverse_complement("ATGCa") == "tGCAT", "reverse complement", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_domain() {
    std::cout << "Testing codon domain... ";
    int failed = 0;

    codonbias::CodonCounter counter(1, 1, true);
    const auto& dom = counter.domain();
    expect(dom.size() == 61, "61 sense codons", failed);
    expect(dom.num_groups() == 20, "20 amino acids", failed);

    std::map<size_t, size_t> classes;
    for (size_t g = 0; g < dom.num_groups(); ++g) ++classes[dom.group_members(g).size()];
    expect(classes[1] == 2 && classes[2] == 9 && classes[3] == 1 &&
           classes[4] == 5 && classes[6] == 3, "degeneracy classes of table 1", failed);

    auto idx = dom.find("CTG");
    expect(idx.has_value() && dom.aa_key(*idx) == "L" && dom.degeneracy(*idx) == 6,
           "CTG is a 6-fold Leu codon", failed);
    expect(idx.has_value() && dom.group_label(dom.group_of(*idx)) == "L", "Leu group label",
           failed);
    expect(!dom.find("TAA").has_value(), "stop codon outside the domain", failed);
    expect(!dom.find("ANA").has_value(), "ambiguous codon outside the domain", failed);

    codonbias::CodonCounter with_stops(1, 1, false);
    expect(with_stops.domain().size() == 64, "64 codons with stops", failed);
    expect(with_stops.domain().num_groups() == 21, "stop group", failed);

    codonbias::CodonCounter pairs(1, 2, true);
    expect(pairs.domain().size() == 61 * 61, "61^2 codon pairs", failed);
    auto pidx = pairs.domain().find("aaagga");
    expect(pidx.has_value() && pairs.domain().key(*pidx) == "AAAGGA", "pair lookup", failed);
    expect(pidx.has_value() && pairs.domain().aa_key(*pidx) == "KG", "pair amino acids", failed);
    expect(pidx.has_value() && pairs.domain().degeneracy(*pidx) == 8, "KG has 2*4 pairs", failed);

    expect(codonbias::CodonCounter(2, 1, true).domain().size() == 60, "table 2 sense codons", failed);

    bool threw = false;
    try {
        codonbias::CodonCounter bad(1, 0, true);
    } catch (const codonbias::ConfigError&) {
        threw = true;
    }
    expect(threw, "k_mer 0 rejected", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_counting() {
    std::cout << "Testing codon counting... ";
    int failed = 0;

    codonbias::CodonCounter counter;
    const auto& dom = counter.domain();

    auto c = counter.count("ATGAAAaagTAANNNGC");
    expect(c.total() == 3, "stop, ambiguous and partial codons skipped", failed);
    expect(c.counts()[*dom.find("AAG")] == 1, "lower case counted", failed);

    auto summed = counter.count(std::vector<std::string>{"AAA", "AAAAAG"});
    expect(summed.counts()[*dom.find("AAA")] == 2, "counts summed over sequences", failed);

    auto empty = counter.count("");
    expect(empty.total() == 0 && empty.counts().size() == 61, "empty query keeps the domain", failed);

    auto aa = c.aa_table(true, 1.0);
    expect(approx(aa[*dom.find("AAA")], 0.5) && approx(aa[*dom.find("AAG")], 0.5),
           "Lys frequencies with pseudocount", failed);
    expect(approx(aa[*dom.find("ATG")], 1.0), "single-codon group", failed);
    expect(approx(aa[*dom.find("GCT")], 0.25), "unobserved group is uniform", failed);

    auto raw = c.aa_table(true, 0.0);
    expect(std::isnan(raw[*dom.find("GCT")]), "unobserved group without pseudocount", failed);

    auto codon = c.codon_table(true, 1.0);
    double sum = std::accumulate(codon.begin(), codon.end(), 0.0);
    expect(approx(sum, 1.0), "codon table sums to 1", failed);
    expect(approx(codon[*dom.find("ATG")], 2.0 / 64.0), "codon table with pseudocount", failed);

    codonbias::CodonCounter pairs(1, 2, true);
    auto pc = pairs.count("ATGAAAAAGTAAGGG");
    expect(pc.total() == 2, "pair windows step one codon and skip stops", failed);
    expect(pc.counts()[*pairs.domain().find("AAAAAG")] == 1, "pair counted", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_nucleotides_and_helpers() {
    std::cout << "Testing nucleotide composition and helpers... ";
    int failed = 0;

    auto comp = codonbias::nucleotide_composition("AACGN");
    expect(approx(comp[0], 0.5) && approx(comp[1], 0.25) && approx(comp[2], 0.25) &&
           approx(comp[3], 0.0), "composition ignores N", failed);

    bool acgt_order = true;
    for (size_t b = 0; b < codonbias::kAcgt.size(); ++b) {
        acgt_order = acgt_order &&
                     codonbias::fast_base_idx(codonbias::kAcgt[b]) == static_cast<int>(b);
    }
    expect(acgt_order, "composition order is A, C, G, T", failed);

    auto uniform = codonbias::nucleotide_composition(std::string());
    expect(approx(uniform[0], 0.25) && approx(uniform[3], 0.25), "empty is uniform", failed);

    auto pos = codonbias::positional_composition("ATGATC");
    expect(approx(pos[0][0], 1.0), "position 1 all A", failed);
    expect(approx(pos[1][3], 1.0), "position 2 all T", failed);
    expect(approx(pos[2][1], 0.5) && approx(pos[2][2], 0.5), "position 3 C/G", failed);

    std::vector<double> values = {1.0, codonbias::kMissing, 3.0};
    std::vector<uint64_t> weights = {1, 5, 3};
    expect(approx(codonbias::weighted_mean(values, weights), 2.5), "mean skips NaN", failed);
    expect(approx(codonbias::geomean(codonbias::log_of({1.0, 4.0}), std::vector<int>{1, 1}), 2.0),
           "geometric mean", failed);
    expect(std::isnan(codonbias::weighted_mean(values, std::vector<int>{0, 0, 0})),
           "no weight is NaN", failed);

    codonbias::CodonCounter counter;
    std::vector<double> w(61);
    std::iota(w.begin(), w.end(), 0.0);
    codonbias::WeightTable table(counter.domain_ptr(), w);
    auto v = table.per_position("TTTTTCNNNGG");
    expect(v.size() == 4, "one entry per codon start", failed);
    expect(approx(v[0], 0.0) && approx(v[1], 1.0), "TTT, TTC weights", failed);
    expect(std::isnan(v[2]) && std::isnan(v[3]), "ambiguous and partial codons missing", failed);
    expect(std::isnan(table.lookup("TGA")), "stop codon lookup missing", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_genetic_codes();
    total += test_domain();
    total += test_counting();
    total += test_nucleotides_and_helpers();

    if (total == 0) {
        std::cout << "\nAll codon counter tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
