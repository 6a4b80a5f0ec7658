#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace codonbias {

// tRNA gene copy number per anti-codon (DNA letters, upper case)
using GcnTable = std::map<std::string, double>;

// Upper-case, U->T, sum duplicate anti-codons
GcnTable normalize_gcn(const GcnTable& gcn);

/**
 * Two-column table: anti_codon, GCN
 * Tab, comma or space separated; optional header line; '#' comments;
 * gzip compressed files accepted (.gz). Throws RetrievalError.
 */
GcnTable load_gcn_table(const std::string& path);

/**
 * tRNAscan-SE / GtRNAdb "-tRNAs.out" listing
 * One line per tRNA gene; genes are counted per anti-codon. Pseudo genes,
 * undetermined anti-codons and SeC/Sup genes are skipped.
 * gzip compressed files accepted (.gz). Throws RetrievalError.
 */
GcnTable load_trnascan_output(const std::string& path);

/**
 * Where tRNA gene copy numbers come from
 *
 * Either a ready table, a URL / path of a GtRNAdb listing, or a GtRNAdb
 * genome id with its taxonomic domain.
 */
struct GcnSource {
    std::optional<GcnTable> table;
    std::string url;
    std::string genome_id;
    std::string domain;

    bool has_fetch_parameters() const {
        return !url.empty() || (!genome_id.empty() && !domain.empty());
    }
};

/**
 * Retrieval of gene copy numbers from a url or genome id
 */
class GcnFetcher {
public:
    virtual ~GcnFetcher() = default;
    // Throws RetrievalError
    virtual GcnTable fetch(const GcnSource& source) const = 0;
};

/**
 * GtRNAdb listings stored on disk
 *
 * url: plain path or file:// URL of a "-tRNAs.out" file (or a two-column
 * table when the name ends in .tsv/.csv/.txt, optionally .gz).
 * genome_id + domain: <mirror_root>/<domain>/<genome_id>/<genome_id>-tRNAs.out[.gz]
 * Remote URLs are not handled here.
 */
class GtrnadbFileFetcher : public GcnFetcher {
public:
    explicit GtrnadbFileFetcher(std::string mirror_root = ".")
        : mirror_root_(std::move(mirror_root)) {}

    GcnTable fetch(const GcnSource& source) const override;

private:
    std::string mirror_root_;
};

// Fetch parameters take precedence over a supplied table.
// Throws ConfigError when the source names neither.
GcnTable resolve_gcn(const GcnSource& source, const GcnFetcher& fetcher);

} // namespace codonbias
