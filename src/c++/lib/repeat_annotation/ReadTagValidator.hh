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
/// \brief Typed access to the custom repeat annotation tags of an alignment record
///
/// Tags:
///   TR - string, id of the locus the read was assigned to
///   AL - integer, index of the called allele the read supports
///   FL - unsigned integer array of size 2, flank bases retained on the left and right of the repeat
///   MC - uint8 array, per-base methylation probabilities (optional)
///
/// Every accessor throws MalformedReadTagException naming the read and tag if a required tag
/// is absent, or if any tag has an unexpected type or shape.
///

#pragma once

#include "htsapi/bam_record.hh"

#include "boost/optional.hpp"

#include <cstdint>

#include <string>
#include <vector>


std::string
getReadLocusId(const bam_record& bamRead);

int32_t
getReadAllele(const bam_record& bamRead);

void
getReadFlankTrim(
    const bam_record& bamRead,
    unsigned& leftFlank,
    unsigned& rightFlank);

/// \return none if the tag is absent or empty
boost::optional<std::vector<uint8_t>>
getReadMethylation(const bam_record& bamRead);
