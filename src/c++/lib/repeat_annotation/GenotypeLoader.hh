//
// TRanno - Tandem Repeat Annotation
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \brief Load the annotated genotype of one repeat locus from a repeat call VCF
///

#pragma once

#include "BaseLabelDispatcher.hh"
#include "RepeatAllele.hh"
#include "RepeatLocus.hh"

#include "htsapi/vcf_record.hh"

#include <string>
#include <vector>


/// assemble the full sequence of each called allele: left flank + REF or ALT sequence + right flank
///
/// \param[in] genotype allele indices parsed from GT, in call order
///
/// throws InputFormatException if an allele index does not refer to REF or an ALT allele
std::vector<std::string>
getAlleleSequences(
    const RepeatLocus& locus,
    const vcf_record& record,
    const std::vector<int>& genotype);


/// build annotated alleles from a call record already matched to the locus
///
/// the first sample's GT and MS values are used
///
/// throws IncompleteGenotypeException if any allele call is missing
std::vector<RepeatAllele>
getGenotype(
    const RepeatLocus& locus,
    const vcf_record& record,
    const BaseLabelDispatcher& baseLabeler);


/// find the first record in vcfFilename with INFO/TRID matching the locus id, and build
/// its annotated alleles in call order
///
/// throws LocusNotFoundException if no record matches the locus id
std::vector<RepeatAllele>
loadGenotype(
    const std::string& vcfFilename,
    const RepeatLocus& locus,
    const BaseLabelDispatcher& baseLabeler);
