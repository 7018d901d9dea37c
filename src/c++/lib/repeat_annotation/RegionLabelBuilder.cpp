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

#include "RegionLabelBuilder.hh"

#include "common/Exceptions.hh"

#include <sstream>


//#define DEBUG_REGION_LABEL

#ifdef DEBUG_REGION_LABEL
#include "blt_util/log.hh"
#include <iostream>
#endif



static
void
throwSpanReconcileException(
    const RepeatLocus& locus,
    const std::string& alleleSeq,
    const AlleleMotifSpans& spans,
    const std::string& reason)
{
    std::ostringstream oss;
    oss << "Can't reconcile motif spans '" << encodeAlleleMotifSpans(spans)
        << "' with allele of length " << alleleSeq.size()
        << " at locus '" << locus.id << "': " << reason;
    BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
}



RegionLabels
getRegionLabels(
    const RepeatLocus& locus,
    const std::string& alleleSeq,
    const AlleleMotifSpans& spans)
{
    using namespace REGION_LABEL;

    const unsigned leftFlankSize(locus.leftFlankSize());
    const unsigned rightFlankSize(locus.rightFlankSize());
    const unsigned alleleSize(alleleSeq.size());

    if (alleleSize < (leftFlankSize+rightFlankSize))
    {
        throwSpanReconcileException(locus, alleleSeq, spans, "allele is shorter than its flanks");
    }

    const unsigned repeatEnd(alleleSize-rightFlankSize);

    RegionLabels labels;
    labels.emplace_back(FLANK, 0, leftFlankSize);

    if (! spans)
    {
        labels.emplace_back(OTHER, leftFlankSize, repeatEnd);
    }
    else
    {
        const unsigned motifCount(locus.motifs.size());
        unsigned lastSegmentEnd(leftFlankSize);
        for (const MotifSpan& span : *spans)
        {
            if (span.motifIndex >= motifCount)
            {
                std::ostringstream oss;
                oss << "motif index " << span.motifIndex << " exceeds locus motif count " << motifCount;
                throwSpanReconcileException(locus, alleleSeq, spans, oss.str());
            }
            if (span.end < span.start)
            {
                throwSpanReconcileException(locus, alleleSeq, spans, "span ends before it starts");
            }

            // compare in repeat coordinates before the flank offset is added:
            if (span.end > (repeatEnd-leftFlankSize))
            {
                throwSpanReconcileException(locus, alleleSeq, spans, "span extends into the right flank");
            }

            const unsigned start(span.start+leftFlankSize);
            const unsigned end(span.end+leftFlankSize);

            if (start < lastSegmentEnd)
            {
                throwSpanReconcileException(locus, alleleSeq, spans, "spans overlap or are out of order");
            }

            if (start != lastSegmentEnd)
            {
                labels.emplace_back(SEQ, lastSegmentEnd, start);
            }
            labels.emplace_back(TR, start, end, locus.motifs[span.motifIndex]);
            lastSegmentEnd = end;
        }

        if (lastSegmentEnd != repeatEnd)
        {
            labels.emplace_back(SEQ, lastSegmentEnd, repeatEnd);
        }
    }

    labels.emplace_back(FLANK, repeatEnd, alleleSize);

#ifdef DEBUG_REGION_LABEL
    log_os << __FUNCTION__ << ": locus: " << locus.id << " spans: " << encodeAlleleMotifSpans(spans)
           << " labels: " << labels << "\n";
#endif

    assertRegionLabelsCoverAllele(labels, alleleSize);
    return labels;
}



RegionLabels
getFlankLabels(const RegionLabels& regionLabels)
{
    using namespace REGION_LABEL;

    if (regionLabels.empty() ||
        (! regionLabels.front().isFlank()) ||
        (! regionLabels.back().isFlank()))
    {
        std::ostringstream oss;
        oss << "Region labels must begin and end with a flank: " << regionLabels;
        BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
    }

    const unsigned leftFlankSize(regionLabels.front().size());
    const unsigned rightFlankSize(regionLabels.back().size());

    unsigned repeatSize(0);
    for (const RegionLabel& label : regionLabels)
    {
        if (label.isFlank()) continue;
        repeatSize += label.size();
    }

    const unsigned repeatEnd(leftFlankSize+repeatSize);

    RegionLabels flankLabels;
    flankLabels.emplace_back(FLANK, 0, leftFlankSize);
    flankLabels.emplace_back(OTHER, leftFlankSize, repeatEnd);
    flankLabels.emplace_back(FLANK, repeatEnd, repeatEnd+rightFlankSize);
    return flankLabels;
}
