// Tests for the tRNA Adaptation Index: codon weights, gene copy number
// tables and the GtRNAdb file fetcher

#include "codonbias/errors.hpp"
#include "codonbias/tai.hpp"
#include "codonbias/tai_coefficients.hpp"
#include "codonbias/trna_gcn.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool approx(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

// Equal, or both missing
bool same(double a, double b) {
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

bool same(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!same(a[i], b[i])) return false;
    }
    return true;
}

fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / "codonbias_test_tai";
    fs::create_directories(dir);
    return dir;
}

void write_text(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

bool write_gz(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    gzFile gz = gzopen(path.string().c_str(), "wb");
    if (!gz) return false;
    bool ok = gzputs(gz, content.c_str()) >= 0;
    return gzclose(gz) == Z_OK && ok;
}

// Phe tRNA (GAA) x2 reads TTC/TTT, Met tRNA (CAT) x1 reads ATG
const codonbias::GcnTable GCN = {{"GAA", 2.0}, {"CAT", 1.0}};

const char* TRNASCAN_OUT =
    "Sequence\t\ttRNA\tBounds\ttRNA\tAnti\tIntron Bounds\tInf\t\n"
    "Name    \ttRNA #\tBegin\tEnd\tType\tCodon\tBegin\tEnd\tScore\tNote\n"
    "--------\t------\t-----\t------\t----\t-----\t-----\t----\t------\t------\n"
    "chr1\t1\t100\t172\tPhe\tGAA\t0\t0\t62.1\t\n"
    "chr1\t2\t300\t372\tPhe\tGAA\t0\t0\t60.0\t\n"
    "chr1\t3\t500\t572\tMet\tCAT\t0\t0\t55.2\t\n"
    "chr1\t4\t700\t772\tLeu\tCAG\t0\t0\t30.0\tpseudo\n"
    "chr1\t5\t900\t972\tUndet\tNNN\t0\t0\t20.0\t\n"
    "chr1\t6\t1100\t1172\tSeC\tTCA\t0\t0\t70.0\t\n";

int test_weights() {
    std::cout << "Testing tAI weights... ";
    int failed = 0;

    codonbias::TrnaAdaptationIndex tai(GCN);
    const auto& w = tai.weights();
    expect(approx(w.lookup("TTC"), 1.0), "Watson-Crick pairing, most genes", failed);
    expect(approx(w.lookup("TTT"), 0.59), "G:U wobble", failed);
    expect(approx(w.lookup("ATG"), 0.5), "single Met gene", failed);

    const double fill = std::cbrt(1.0 * 0.59 * 0.5);
    expect(approx(w.lookup("GCT"), fill), "undecoded codon gets the geometric mean", failed);
    expect(approx(w.lookup("ATA"), fill), "lysidine pairing off for eukaryotes", failed);

    expect(approx(tai.score("TTCTTC"), 1.0), "optimal codons score 1", failed);
    expect(approx(tai.score("TTCTTT"), std::sqrt(0.59)), "geometric mean", failed);
    auto v = tai.vector("TTCTTTNNN");
    expect(v.size() == 3 && approx(v[0], 1.0) && approx(v[1], 0.59) && std::isnan(v[2]),
           "per-codon weights", failed);

    codonbias::TaiParams prok;
    prok.prokaryote = true;
    codonbias::TrnaAdaptationIndex tai_prok(GCN, prok);
    expect(approx(tai_prok.weights().lookup("ATA"), 0.055), "lysidine pairing for prokaryotes",
           failed);
    expect(approx(tai_prok.weights().lookup("GCT"), std::pow(0.59 * 0.5 * 0.055, 0.25)),
           "fill over four decoded codons", failed);

    codonbias::TaiParams tuller;
    tuller.s_values = "Tuller";
    codonbias::TrnaAdaptationIndex tai_tuller(GCN, tuller);
    expect(approx(tai_tuller.weights().lookup("TTT"), 1.0 - 0.7861), "Tuller G:U", failed);

    bool threw = false;
    try {
        codonbias::TaiParams bad;
        bad.s_values = "unknown";
        codonbias::TrnaAdaptationIndex t(GCN, bad);
    } catch (const codonbias::ConfigError&) {
        threw = true;
    }
    expect(threw, "unknown coefficient set", failed);

    threw = false;
    try {
        // Only the stop codon reader
        codonbias::TrnaAdaptationIndex t(codonbias::GcnTable{{"TTA", 3.0}});
    } catch (const codonbias::ConfigError&) {
        threw = true;
    }
    expect(threw, "no decodable codon", failed);

    expect(codonbias::tai_coefficient_set_names().size() == 2, "packaged sets", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_gcn_tables() {
    std::cout << "Testing gene copy number tables... ";
    int failed = 0;
    const fs::path dir = scratch_dir();

    auto norm = codonbias::normalize_gcn({{"gaa", 1.0}, {"GAA", 2.0}, {"uuc", 1.0}});
    expect(norm.size() == 2 && norm["GAA"] == 3.0 && norm["TTC"] == 1.0,
           "case and RNA letters folded", failed);

    bool threw = false;
    try {
        codonbias::normalize_gcn({{"GA", 1.0}});
    } catch (const codonbias::ConfigError&) {
        threw = true;
    }
    expect(threw, "short anti-codon rejected", failed);

    const fs::path plain = dir / "gcn.tsv";
    write_text(plain, "anti_codon\tGCN\nGAA\t2\nCAT\t1\n");
    expect(codonbias::load_gcn_table(plain.string()) == GCN, "plain table", failed);

    const fs::path gz = dir / "gcn.csv.gz";
    expect(write_gz(gz, "# copy numbers\ngaa,1\nGAA,1\nCAU,1\n"), "write gz table", failed);
    expect(codonbias::load_gcn_table(gz.string()) == GCN, "gzip table", failed);

    const fs::path bad = dir / "bad.tsv";
    write_text(bad, "GAA\t2\nXYZW\t1\n");
    threw = false;
    try {
        codonbias::load_gcn_table(bad.string());
    } catch (const codonbias::RetrievalError&) {
        threw = true;
    }
    expect(threw, "malformed line", failed);

    const fs::path trnas = dir / "genome-tRNAs.out";
    write_text(trnas, TRNASCAN_OUT);
    expect(codonbias::load_trnascan_output(trnas.string()) == GCN,
           "tRNAscan listing without pseudo genes", failed);

    threw = false;
    try {
        codonbias::load_gcn_table((dir / "missing.tsv").string());
    } catch (const codonbias::RetrievalError&) {
        threw = true;
    }
    expect(threw, "missing file", failed);

    const fs::path coef = dir / "coefficients.csv";
    write_text(coef, "anti,cod,weight,min_deg,prokaryote\nG,C,0,1,false\nG,U,0.5,2,false\n");
    auto set = codonbias::load_tai_coefficients(coef.string());
    expect(set.size() == 2 && set[1].cod == 'T' && set[1].weight == 0.5, "coefficient file",
           failed);
    codonbias::TrnaAdaptationIndex custom(GCN, set);
    expect(approx(custom.weights().lookup("TTT"), 0.5), "custom wobble weight", failed);
    expect(approx(custom.weights().lookup("ATG"), std::sqrt(0.5)), "unpaired Met filled",
           failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_sources() {
    std::cout << "Testing gene copy number sources... ";
    int failed = 0;
    const fs::path dir = scratch_dir();
    const fs::path mirror = dir / "mirror";
    expect(write_gz(mirror / "bacteria" / "Ecoli" / "Ecoli-tRNAs.out.gz", TRNASCAN_OUT),
           "write mirror listing", failed);
    const fs::path listing = dir / "gcn_url.tsv";
    write_text(listing, "GAA\t2\nCAT\t1\n");

    codonbias::GtrnadbFileFetcher fetcher(mirror.string());

    codonbias::GcnSource by_genome;
    by_genome.genome_id = "Ecoli";
    by_genome.domain = "bacteria";
    expect(codonbias::resolve_gcn(by_genome, fetcher) == GCN, "genome id in mirror", failed);
    auto tai = codonbias::TrnaAdaptationIndex::from_source(by_genome, fetcher);
    expect(approx(tai.weights().lookup("TTT"), 0.59), "model from mirror", failed);

    // Fetch parameters win over a supplied table
    codonbias::GcnSource both;
    both.table = codonbias::GcnTable{{"GAA", 1.0}};
    both.url = "file://" + listing.string();
    expect(codonbias::resolve_gcn(both, fetcher) == GCN, "url before table", failed);

    codonbias::GcnSource table_only;
    table_only.table = GCN;
    expect(codonbias::resolve_gcn(table_only, fetcher) == GCN, "supplied table", failed);

    bool threw = false;
    try {
        codonbias::TrnaAdaptationIndex::from_source(codonbias::GcnSource{}, fetcher);
    } catch (const codonbias::ConfigError&) {
        threw = true;
    }
    expect(threw, "no table and no fetch parameters", failed);

    threw = false;
    try {
        codonbias::GcnSource remote;
        remote.url = "http://gtrnadb.ucsc.edu/genomes/bacteria/Ecoli/Ecoli-tRNAs.out";
        fetcher.fetch(remote);
    } catch (const codonbias::RetrievalError&) {
        threw = true;
    }
    expect(threw, "remote url", failed);

    threw = false;
    try {
        codonbias::GcnSource absent;
        absent.genome_id = "Nobody";
        absent.domain = "archaea";
        fetcher.fetch(absent);
    } catch (const codonbias::RetrievalError&) {
        threw = true;
    }
    expect(threw, "genome not in mirror", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_collections_and_slices() {
    std::cout << "Testing tAI collections and slices... ";
    int failed = 0;

    codonbias::TrnaAdaptationIndex tai(GCN);
    const std::vector<std::string> seqs = {"TTCTTTATGGCT", "ATGTTCNNNTTT", "TTC", ""};
    const auto slice = codonbias::Slice::range(3, 9);

    auto scores = tai.score(seqs);
    auto sliced = tai.score(seqs, slice);
    auto vecs = tai.vector(seqs);
    auto sliced_vecs = tai.vector(seqs, slice);
    expect(scores.size() == seqs.size() && sliced.size() == seqs.size() &&
               vecs.size() == seqs.size() && sliced_vecs.size() == seqs.size(),
           "one result per sequence", failed);

    for (size_t i = 0; i < seqs.size(); ++i) {
        const std::string sub = slice.apply(seqs[i]);
        expect(same(scores[i], tai.score(seqs[i])), "collection score matches single", failed);
        expect(same(tai.score(seqs[i], slice), tai.score(sub)),
               "slice equals scoring the substring", failed);
        expect(same(sliced[i], tai.score(sub)), "sliced collection score", failed);
        expect(same(vecs[i], tai.vector(seqs[i])), "collection vector matches single", failed);
        expect(same(sliced_vecs[i], tai.vector(sub)), "sliced collection vector", failed);
    }
    expect(approx(sliced[0], std::sqrt(0.59 * 0.5)), "TTTATG window", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_weights();
    total += test_gcn_tables();
    total += test_sources();
    total += test_collections_and_slices();

    fs::remove_all(fs::temp_directory_path() / "codonbias_test_tai");

    if (total == 0) {
        std::cout << "\nAll tAI tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
