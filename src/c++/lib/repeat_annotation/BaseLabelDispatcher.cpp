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

#include "BaseLabelDispatcher.hh"

#include "common/Exceptions.hh"

#include <sstream>



BASE_LABEL_STRATEGY::index_t
getBaseLabelStrategy(const std::string& structure)
{
    if (structure.find('<') != std::string::npos)
    {
        return BASE_LABEL_STRATEGY::NESTED_STRUCTURE;
    }
    return BASE_LABEL_STRATEGY::MOTIF_SPANS;
}



static
void
checkBaseLabels(
    const RepeatLocus& locus,
    const BASE_LABEL_STRATEGY::index_t strategy,
    const std::vector<std::string>& alleleSeqs,
    const std::vector<BaseLabels>& labelsByAllele)
{
    using namespace tranno::common;

    const unsigned alleleCount(alleleSeqs.size());
    if (labelsByAllele.size() != alleleCount)
    {
        std::ostringstream oss;
        oss << "Base labeler '" << BASE_LABEL_STRATEGY::label(strategy) << "' returned labels for "
            << labelsByAllele.size() << " alleles, expected " << alleleCount
            << " at locus '" << locus.id << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    for (unsigned alleleIndex(0); alleleIndex<alleleCount; ++alleleIndex)
    {
        if (labelsByAllele[alleleIndex].size() == alleleSeqs[alleleIndex].size()) continue;

        std::ostringstream oss;
        oss << "Base labeler '" << BASE_LABEL_STRATEGY::label(strategy) << "' returned "
            << labelsByAllele[alleleIndex].size() << " labels for allele " << alleleIndex
            << " of length " << alleleSeqs[alleleIndex].size()
            << " at locus '" << locus.id << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }
}



std::vector<BaseLabels>
BaseLabelDispatcher::
getBaseLabels(
    const RepeatLocus& locus,
    const std::vector<AlleleMotifSpans>& spansByAllele,
    const std::vector<std::string>& alleleSeqs) const
{
    const BASE_LABEL_STRATEGY::index_t strategy(getBaseLabelStrategy(locus.structure));

    std::vector<BaseLabels> labelsByAllele;
    if (strategy == BASE_LABEL_STRATEGY::NESTED_STRUCTURE)
    {
        labelsByAllele = _nestedLabeler.getBaseLabels(locus, alleleSeqs);
    }
    else
    {
        labelsByAllele = _motifSpanLabeler.getBaseLabels(locus, spansByAllele, alleleSeqs);
    }

    checkBaseLabels(locus, strategy, alleleSeqs, labelsByAllele);
    return labelsByAllele;
}
