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

#pragma once

#include "boost/optional.hpp"

#include <cstdint>

#include <iosfwd>
#include <string>
#include <vector>


/// repeat annotation extracted from one alignment record
struct RepeatRead
{
    std::string name;
    std::string seq;

    /// number of flank bases retained on each side of the repeat in seq
    unsigned leftFlank = 0;
    unsigned rightFlank = 0;

    /// index of the called allele this read was assigned to support
    int32_t allele = 0;

    /// per-base methylation probabilities, none if the read carries no calls
    boost::optional<std::vector<uint8_t>> meth;
};


std::ostream&
operator<<(std::ostream& os, const RepeatRead& read);
