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
/// \brief Decoder for the per-allele motif span (MS) encoding of repeat calls
///
/// Each allele is encoded as '.' when no motif occurrences were annotated, or as an
/// underscore-separated list of occurrences "<motifIndex>(<start>-<end>)", where start
/// and end are half-open coordinates relative to the start of the repeat (excluding flanks).
/// Alleles are separated by ','.
///

#pragma once

#include "boost/optional.hpp"

#include <iosfwd>
#include <string>
#include <vector>


/// one motif occurrence in an allele's repeat sequence, in repeat coordinates
struct MotifSpan
{
    MotifSpan(
        const unsigned initMotifIndex = 0,
        const unsigned initStart = 0,
        const unsigned initEnd = 0)
        : motifIndex(initMotifIndex),
          start(initStart),
          end(initEnd)
    {}

    bool
    operator==(const MotifSpan& rhs) const
    {
        return ((motifIndex == rhs.motifIndex) &&
                (start == rhs.start) &&
                (end == rhs.end));
    }

    unsigned motifIndex;
    unsigned start;
    unsigned end;
};

typedef std::vector<MotifSpan> MotifSpans;

/// motif spans for one allele, none if the allele was encoded as '.'
typedef boost::optional<MotifSpans> AlleleMotifSpans;


/// decode one allele's motif span encoding
///
/// spans are returned in encoding order, no sorting or coordinate adjustment is applied.
///
/// throws InputFormatException for any malformed encoding
AlleleMotifSpans
decodeAlleleMotifSpans(const std::string& encoding);

/// decode the full MS field, returning one entry per allele
///
/// throws InputFormatException for any malformed encoding
std::vector<AlleleMotifSpans>
decodeMotifSpans(const std::string& msField);

/// inverse of decodeAlleleMotifSpans
std::string
encodeAlleleMotifSpans(const AlleleMotifSpans& spans);


std::ostream&
operator<<(std::ostream& os, const MotifSpan& span);
