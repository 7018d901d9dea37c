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
/// \brief Extract repeat annotated reads for one locus from an alignment file
///

#pragma once

#include "RepeatAnnotationOptions.hh"
#include "RepeatLocus.hh"
#include "RepeatRead.hh"

#include "htsapi/bam_record.hh"

#include <cstdint>

#include <string>
#include <vector>


/// get the read fetch range for the locus, 0-indexed half-open
///
/// the range begin is clipped at the contig start
void
getReadSearchRange(
    const RepeatLocus& locus,
    const unsigned searchRadius,
    int64_t& beginPos,
    int64_t& endPos);


/// convert a tagged alignment record to a repeat read
///
/// \return false if the record is tagged with a locus other than locusId
///
/// throws MalformedReadTagException if any tag is missing or malformed
bool
getRepeatRead(
    const bam_record& bamRead,
    const std::string& locusId,
    RepeatRead& read);


/// get all reads assigned to the locus, in alignment file order
///
/// the alignment file must be indexed
std::vector<RepeatRead>
extractRepeatReads(
    const std::string& alignmentFilename,
    const RepeatLocus& locus,
    const RepeatAnnotationOptions& opt);
