/**
 * NCBI translation tables
 *
 * Encoding: T=0, C=1, A=2, G=3
 * Index = base1*16 + base2*4 + base3
 */

#include "codonbias/codon_tables.hpp"
#include "codonbias/errors.hpp"

#include <array>

namespace codonbias {

namespace {

struct TableInfo {
    int id;
    const char* aa;
    const char* name;
};

// Amino acid strings as published by NCBI (TCAG order)
const std::array<TableInfo, 26> TABLES = {{
    {1,  "FFLLSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Standard"},
    {2,  "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNKKSS**VVVVAAAADDEEGGGG", "Vertebrate Mitochondrial"},
    {3,  "FFLLSSSSYY**CCWWTTTTPPPPHHQQRRRRIIMMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Yeast Mitochondrial"},
    {4,  "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Mold, Protozoan, and Coelenterate Mitochondrial and Mycoplasma/Spiroplasma"},
    {5,  "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNKKSSSSVVVVAAAADDEEGGGG", "Invertebrate Mitochondrial"},
    {6,  "FFLLSSSSYYQQCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Ciliate, Dasycladacean and Hexamita Nuclear"},
    {9,  "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNNKSSSSVVVVAAAADDEEGGGG", "Echinoderm and Flatworm Mitochondrial"},
    {10, "FFLLSSSSYY**CCCWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Euplotid Nuclear"},
    {11, "FFLLSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Bacterial, Archaeal and Plant Plastid"},
    {12, "FFLLSSSSYY**CC*WLLLSPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Alternative Yeast Nuclear"},
    {13, "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNKKSSGGVVVVAAAADDEEGGGG", "Ascidian Mitochondrial"},
    {14, "FFLLSSSSYYY*CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNNKSSSSVVVVAAAADDEEGGGG", "Alternative Flatworm Mitochondrial"},
    {15, "FFLLSSSSYY*QCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Blepharisma Macronuclear"},
    {16, "FFLLSSSSYY*LCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Chlorophycean Mitochondrial"},
    {21, "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNNKSSSSVVVVAAAADDEEGGGG", "Trematode Mitochondrial"},
    {22, "FFLLSS*SYY*LCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Scenedesmus obliquus Mitochondrial"},
    {23, "FF*LSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Thraustochytrium Mitochondrial"},
    {24, "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSSKVVVVAAAADDEEGGGG", "Pterobranchia Mitochondrial"},
    {25, "FFLLSSSSYY**CCGWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Candidate Division SR1 and Gracilibacteria"},
    {26, "FFLLSSSSYY**CC*WLLLAPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Pachysolen tannophilus Nuclear"},
    {27, "FFLLSSSSYYQQCCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Karyorelict Nuclear"},
    {28, "FFLLSSSSYYQQCCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Condylostoma Nuclear"},
    {29, "FFLLSSSSYYYYCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Mesodinium Nuclear"},
    {30, "FFLLSSSSYYEECC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Peritrich Nuclear"},
    {31, "FFLLSSSSYYEECCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG", "Blastocrithidia Nuclear"},
    {33, "FFLLSSSSYYY*CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSSKVVVVAAAADDEEGGGG", "Cephalodiscidae Mitochondrial UAA-Tyr"},
}};

} // namespace

GeneticCode::GeneticCode(int id) : id_(id) {
    for (const auto& t : TABLES) {
        if (t.id == id) {
            name_ = t.name;
            aa_ = t.aa;
            return;
        }
    }
    throw ConfigError("Unknown genetic code id: " + std::to_string(id));
}

std::vector<std::string> GeneticCode::stop_codons() const {
    std::vector<std::string> stops;
    for (int i = 0; i < 64; ++i) {
        if (aa_[i] == '*') stops.push_back(idx_to_codon(i));
    }
    return stops;
}

std::vector<int> GeneticCode::available_ids() {
    std::vector<int> ids;
    ids.reserve(TABLES.size());
    for (const auto& t : TABLES) ids.push_back(t.id);
    return ids;
}

} // namespace codonbias
