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
/// \brief Per-base allele labels used for rendering
///

#pragma once

#include <vector>


namespace BASE_LABEL
{
enum index_t
{
    MOTIF_BOUND,
    MATCH,
    MISMATCH,
    FLANK,
    NO_LABEL
};

inline
const char*
label(const index_t i)
{
    switch (i)
    {
    case MOTIF_BOUND:
        return "MotifBound";
    case MATCH:
        return "Match";
    case MISMATCH:
        return "Mismatch";
    case FLANK:
        return "Flank";
    case NO_LABEL:
        return "NoLabel";
    default:
        return "Unknown";
    }
}
}

typedef std::vector<BASE_LABEL::index_t> BaseLabels;
