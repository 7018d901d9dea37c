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
///

#include "RegionLabel.hh"

#include "common/Exceptions.hh"

#include <iostream>
#include <sstream>



void
assertRegionLabelsCoverAllele(
    const RegionLabels& labels,
    const unsigned alleleSize)
{
    unsigned expectedStart(0);
    bool isValid(true);
    for (const RegionLabel& label : labels)
    {
        if ((label.start != expectedStart) || (label.end < label.start))
        {
            isValid = false;
            break;
        }
        expectedStart = label.end;
    }

    if (isValid && (expectedStart == alleleSize)) return;

    std::ostringstream oss;
    oss << "Region labels do not cover allele of length " << alleleSize << " exactly once: " << labels;
    BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
}



std::ostream&
operator<<(std::ostream& os, const RegionLabel& label)
{
    os << REGION_LABEL::label(label.type) << '(' << label.start << ',' << label.end;
    if (label.type == REGION_LABEL::TR)
    {
        os << ',' << label.motif;
    }
    os << ')';
    return os;
}



std::ostream&
operator<<(std::ostream& os, const RegionLabels& labels)
{
    bool isFirst(true);
    for (const RegionLabel& label : labels)
    {
        if (! isFirst) os << ", ";
        os << label;
        isFirst = false;
    }
    return os;
}
