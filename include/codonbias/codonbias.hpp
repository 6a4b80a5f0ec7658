#pragma once
// Codon usage bias models

#include "codonbias/version.h"
#include "codonbias/errors.hpp"
#include "codonbias/codon_tables.hpp"
#include "codonbias/codon_counter.hpp"
#include "codonbias/scorer.hpp"
#include "codonbias/fop.hpp"
#include "codonbias/rscu.hpp"
#include "codonbias/cai.hpp"
#include "codonbias/enc.hpp"
#include "codonbias/tai.hpp"
#include "codonbias/cpb.hpp"
#include "codonbias/rcbs.hpp"
