/**
 * tRNA-codon coupling coefficients (s-values) for tAI
 *
 * Anti-codon base (wobble position 34) x codon base (position 3).
 * 'A' at position 34 is read as inosine (I).
 */

#include "codonbias/tai_coefficients.hpp"
#include "codonbias/codon_tables.hpp"
#include "codonbias/errors.hpp"
#include "line_reader.hpp"

#include <cctype>
#include <map>
#include <stdexcept>

namespace codonbias {

namespace {

// dos Reis, Savva & Wernisch, NAR, 2004
const TaiCoefficientSet DOS_REIS = {
    {'A', 'T', 0.0,    1, false},  // I:U
    {'G', 'C', 0.0,    1, false},  // G:C
    {'T', 'A', 0.0,    1, false},  // U:A
    {'C', 'G', 0.0,    1, false},  // C:G
    {'G', 'T', 0.41,   2, false},  // G:U
    {'A', 'C', 0.28,   2, false},  // I:C
    {'A', 'A', 0.9999, 3, false},  // I:A
    {'T', 'G', 0.68,   2, false},  // U:G
    {'C', 'A', 0.89,   3, true},   // L:A (lysidine)
};

// Refit on protein abundance (Tuller et al.)
const TaiCoefficientSet TULLER = {
    {'A', 'T', 0.0,    1, false},
    {'G', 'C', 0.0,    1, false},
    {'T', 'A', 0.0,    1, false},
    {'C', 'G', 0.0,    1, false},
    {'G', 'T', 0.7861, 2, false},
    {'A', 'C', 0.4659, 2, false},
    {'A', 'A', 0.9075, 3, false},
    {'T', 'G', 0.6295, 2, false},
    {'C', 'A', 0.89,   3, true},
};

char to_dna_base(const std::string& field) {
    if (field.size() != 1) return 'N';
    char c = fast_upper(field[0]);
    if (c == 'U') c = 'T';
    if (c == 'I') c = 'A';
    return fast_base_idx(c) < 0 ? 'N' : c;
}

bool parse_bool(const std::string& field, bool& out) {
    std::string v;
    for (char c : field) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "true" || v == "1" || v == "yes") { out = true; return true; }
    if (v == "false" || v == "0" || v == "no") { out = false; return true; }
    return false;
}

} // namespace

const TaiCoefficientSet& tai_coefficients(const std::string& name) {
    if (name == "dosReis") return DOS_REIS;
    if (name == "Tuller") return TULLER;
    throw ConfigError("unknown tAI coefficient set: " + name);
}

std::vector<std::string> tai_coefficient_set_names() {
    return {"dosReis", "Tuller"};
}

TaiCoefficientSet load_tai_coefficients(const std::string& path) {
    LineReader reader(path);
    std::string line;
    std::map<std::string, size_t> columns;
    TaiCoefficientSet set;

    auto bad_line = [&](const std::string& why) {
        return RetrievalError(path + ":" + std::to_string(reader.line_number()) + ": " + why);
    };

    while (reader.getline(line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto fields = split_fields(t);

        if (columns.empty()) {
            for (size_t i = 0; i < fields.size(); ++i) columns[fields[i]] = i;
            for (const char* col : {"anti", "cod", "weight", "min_deg", "prokaryote"}) {
                if (!columns.count(col)) throw bad_line(std::string("missing column ") + col);
            }
            continue;
        }

        auto field = [&](const char* col) -> const std::string& {
            size_t i = columns.at(col);
            if (i >= fields.size()) throw bad_line("too few fields");
            return fields[i];
        };

        TaiCoefficient c;
        c.anti = to_dna_base(field("anti"));
        c.cod = to_dna_base(field("cod"));
        if (c.anti == 'N' || c.cod == 'N') throw bad_line("invalid base");
        try {
            c.weight = std::stod(field("weight"));
            c.min_deg = std::stoi(field("min_deg"));
        } catch (const std::logic_error&) {
            throw bad_line("invalid number");
        }
        if (!parse_bool(field("prokaryote"), c.prokaryote)) {
            throw bad_line("invalid prokaryote flag: " + field("prokaryote"));
        }
        set.push_back(c);
    }

    if (set.empty()) throw RetrievalError("no coefficients in " + path);
    return set;
}

} // namespace codonbias
