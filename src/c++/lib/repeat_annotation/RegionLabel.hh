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
/// \brief Labeled intervals over a full allele sequence (flanks included)
///

#pragma once

#include <iosfwd>
#include <string>
#include <vector>


namespace REGION_LABEL
{
enum index_t
{
    FLANK,
    OTHER,  ///< repeat sequence without finer annotation
    SEQ,    ///< repeat sequence between annotated motif occurrences
    TR      ///< one annotated motif occurrence
};

inline
const char*
label(const index_t i)
{
    switch (i)
    {
    case FLANK:
        return "Flank";
    case OTHER:
        return "Other";
    case SEQ:
        return "Seq";
    case TR:
        return "Tr";
    default:
        return "Unknown";
    }
}
}


/// one labeled interval in allele coordinates, 0-indexed, half-open
///
/// motif is only set for TR labels
struct RegionLabel
{
    RegionLabel(
        const REGION_LABEL::index_t initType,
        const unsigned initStart,
        const unsigned initEnd,
        const std::string& initMotif = "")
        : type(initType),
          start(initStart),
          end(initEnd),
          motif(initMotif)
    {}

    unsigned
    size() const
    {
        return (end-start);
    }

    bool
    isFlank() const
    {
        return (type == REGION_LABEL::FLANK);
    }

    bool
    operator==(const RegionLabel& rhs) const
    {
        return ((type == rhs.type) &&
                (start == rhs.start) &&
                (end == rhs.end) &&
                (motif == rhs.motif));
    }

    bool
    operator!=(const RegionLabel& rhs) const
    {
        return (! (*this == rhs));
    }

    REGION_LABEL::index_t type;
    unsigned start;
    unsigned end;
    std::string motif;
};

typedef std::vector<RegionLabel> RegionLabels;


/// throw an InputFormatException unless labels are ordered, contiguous and cover [0,alleleSize) exactly
void
assertRegionLabelsCoverAllele(
    const RegionLabels& labels,
    const unsigned alleleSize);


/// prints labels in the form "Flank(0,10)" or "Tr(10,30,CAG)"
std::ostream&
operator<<(std::ostream& os, const RegionLabel& label);

std::ostream&
operator<<(std::ostream& os, const RegionLabels& labels);
