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
/// \brief Build region and flank label decompositions of a called allele
///

#pragma once

#include "MotifSpan.hh"
#include "RegionLabel.hh"
#include "RepeatLocus.hh"

#include <string>


/// build the full region label decomposition of one allele
///
/// Motif spans are shifted from repeat to allele coordinates by the left flank size.
/// Any repeat sequence between spans, or between the last span and the right flank, is
/// labeled SEQ. If the allele has no motif spans, the repeat is labeled with a single
/// OTHER interval.
///
/// \param[in] alleleSeq the full allele sequence including both flanks
///
/// throws InputFormatException if the spans can't be reconciled with the allele, this
/// includes out of range motif indices, overlapping or unsorted spans and spans extending
/// into the right flank
RegionLabels
getRegionLabels(
    const RepeatLocus& locus,
    const std::string& alleleSeq,
    const AlleleMotifSpans& spans);


/// collapse region labels into flank-repeat-flank
///
/// The repeat interval size is the total size of all non-flank labels.
RegionLabels
getFlankLabels(const RegionLabels& regionLabels);
