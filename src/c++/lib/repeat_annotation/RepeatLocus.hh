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
/// \brief Definition of a single cataloged tandem repeat site
///

#pragma once

#include <string>
#include <vector>


/// a resolved tandem repeat locus
///
/// loci are resolved from the repeat catalog and reference outside of this library,
/// and are treated as read-only here
///
struct RepeatLocus
{
    unsigned
    leftFlankSize() const
    {
        return leftFlank.size();
    }

    unsigned
    rightFlankSize() const
    {
        return rightFlank.size();
    }

    std::string id;

    /// reference region of the repeat, 0-indexed, half-open
    std::string contig;
    unsigned start = 0;
    unsigned end = 0;

    std::string leftFlank;
    std::string rightFlank;

    /// candidate motifs, motif spans refer to motifs by index in this list
    std::vector<std::string> motifs;

    /// repeat structure descriptor, such as "(CAG)n" or "<HMM>"
    std::string structure;
};
