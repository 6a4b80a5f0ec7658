#include "codonbias/trna_gcn.hpp"
#include "codonbias/codon_tables.hpp"
#include "codonbias/errors.hpp"
#include "codonbias/log_utils.hpp"
#include "line_reader.hpp"

#include <cctype>
#include <chrono>
#include <stdexcept>
#include <sys/stat.h>

namespace codonbias {

namespace {

// Upper case, U->T; empty string if not a clean 3-letter anti-codon
std::string clean_anticodon(const std::string& raw) {
    std::string a = trim(raw);
    if (a.size() != 3) return std::string();
    for (char& c : a) {
        c = fast_upper(c);
        if (c == 'U') c = 'T';
        if (fast_base_idx(c) < 0) return std::string();
    }
    return a;
}

bool is_number(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

GcnTable normalize_gcn(const GcnTable& gcn) {
    GcnTable out;
    for (const auto& [anti, n] : gcn) {
        std::string a = clean_anticodon(anti);
        if (a.empty()) {
            throw ConfigError("invalid anti-codon in tRNA gene table: " + anti);
        }
        out[a] += n;
    }
    return out;
}

GcnTable load_gcn_table(const std::string& path) {
    LineReader reader(path);
    std::string line;
    GcnTable gcn;
    bool first = true;

    while (reader.getline(line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto fields = split_fields(t);
        if (fields.size() < 2) {
            throw RetrievalError(path + ":" + std::to_string(reader.line_number()) +
                                 ": expected anti_codon and GCN columns");
        }

        std::string anti = clean_anticodon(fields[0]);
        double n = 0.0;
        bool numeric = true;
        try {
            size_t used = 0;
            n = std::stod(fields[1], &used);
            numeric = used == fields[1].size();
        } catch (const std::logic_error&) {
            numeric = false;
        }

        if (anti.empty() || !numeric) {
            if (first) {  // header
                first = false;
                continue;
            }
            throw RetrievalError(path + ":" + std::to_string(reader.line_number()) +
                                 ": malformed line: " + t);
        }
        first = false;
        gcn[anti] += n;
    }

    if (gcn.empty()) throw RetrievalError("no tRNA genes in " + path);
    return gcn;
}

GcnTable load_trnascan_output(const std::string& path) {
    LineReader reader(path);
    std::string line;
    GcnTable gcn;
    size_t n_genes = 0;
    size_t n_skipped = 0;

    while (reader.getline(line)) {
        auto fields = split_fields(line);
        // Header lines have no numeric tRNA index
        if (fields.size() < 6 || !is_number(fields[1])) continue;

        const std::string type = fields[4];
        bool pseudo = false;
        for (size_t i = 8; i < fields.size(); ++i) {
            if (lower(fields[i]).find("pseudo") != std::string::npos) pseudo = true;
        }
        std::string anti = clean_anticodon(fields[5]);
        if (pseudo || anti.empty() || type == "Undet" || type == "SeC" ||
            type == "Sup" || type == "Pseudo") {
            ++n_skipped;
            continue;
        }
        gcn[anti] += 1.0;
        ++n_genes;
    }

    if (gcn.empty()) throw RetrievalError("no tRNA genes in " + path);
    log_utils::log_info("tRNA", std::to_string(n_genes) + " genes, " +
                                    std::to_string(gcn.size()) + " anti-codons, " +
                                    std::to_string(n_skipped) + " skipped in " + path);
    return gcn;
}

GcnTable GtrnadbFileFetcher::fetch(const GcnSource& source) const {
    auto start = std::chrono::steady_clock::now();

    std::string path;
    if (!source.url.empty()) {
        path = source.url;
        if (path.rfind("file://", 0) == 0) {
            path = path.substr(7);
        } else if (path.find("://") != std::string::npos) {
            throw RetrievalError("remote URL not supported by the file fetcher: " + path);
        }
    } else if (!source.genome_id.empty() && !source.domain.empty()) {
        std::string base = mirror_root_ + "/" + source.domain + "/" + source.genome_id +
                           "/" + source.genome_id + "-tRNAs.out";
        path = file_exists(base) ? base : base + ".gz";
    } else {
        throw ConfigError("GtRNAdb fetch needs a url or genome_id + domain");
    }

    if (!file_exists(path)) {
        throw RetrievalError("GtRNAdb listing not found: " + path);
    }

    std::string stem = ends_with(path, ".gz") ? path.substr(0, path.size() - 3) : path;
    GcnTable gcn = (ends_with(stem, ".tsv") || ends_with(stem, ".csv") || ends_with(stem, ".txt"))
                       ? load_gcn_table(path)
                       : load_trnascan_output(path);

    log_utils::log_info("tRNA", "loaded " + path + " in " +
                                    log_utils::format_elapsed(start, std::chrono::steady_clock::now()));
    return gcn;
}

GcnTable resolve_gcn(const GcnSource& source, const GcnFetcher& fetcher) {
    if (source.has_fetch_parameters()) {
        return normalize_gcn(fetcher.fetch(source));
    }
    if (source.table) {
        return normalize_gcn(*source.table);
    }
    throw ConfigError(
        "must provide either: tRNA gene copy number table, GtRNAdb url, "
        "or GtRNAdb genome_id + domain");
}

} // namespace codonbias
