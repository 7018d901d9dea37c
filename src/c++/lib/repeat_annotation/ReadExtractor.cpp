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

#include "ReadExtractor.hh"
#include "ReadTagValidator.hh"

#include "common/Exceptions.hh"
#include "htsapi/bam_streamer.hh"

#include <algorithm>
#include <sstream>


//#define DEBUG_READ_EXTRACT

#ifdef DEBUG_READ_EXTRACT
#include "blt_util/log.hh"
#include <iostream>
#endif



void
getReadSearchRange(
    const RepeatLocus& locus,
    const unsigned searchRadius,
    int64_t& beginPos,
    int64_t& endPos)
{
    beginPos = std::max(static_cast<int64_t>(0), static_cast<int64_t>(locus.start) - searchRadius);
    endPos = static_cast<int64_t>(locus.end) + searchRadius;
}



bool
getRepeatRead(
    const bam_record& bamRead,
    const std::string& locusId,
    RepeatRead& read)
{
    if (getReadLocusId(bamRead) != locusId) return false;

    read.name = bamRead.qname();
    read.seq = bamRead.get_read_string();
    read.allele = getReadAllele(bamRead);
    getReadFlankTrim(bamRead, read.leftFlank, read.rightFlank);
    read.meth = getReadMethylation(bamRead);
    return true;
}



std::vector<RepeatRead>
extractRepeatReads(
    const std::string& alignmentFilename,
    const RepeatLocus& locus,
    const RepeatAnnotationOptions& opt)
{
    const char* referenceFilename(opt.referenceFilename.empty() ? nullptr : opt.referenceFilename.c_str());
    bam_streamer readStream(alignmentFilename.c_str(), referenceFilename);

    const int32_t contigId(readStream.target_name_to_id(locus.contig.c_str()));
    if (contigId < 0)
    {
        std::ostringstream oss;
        oss << "Contig '" << locus.contig << "' of locus '" << locus.id
            << "' is not found in the header of alignment file '" << alignmentFilename << "'";
        BOOST_THROW_EXCEPTION(tranno::common::GeneralException(oss.str()));
    }

    int64_t beginPos(0);
    int64_t endPos(0);
    getReadSearchRange(locus, opt.readSearchRadius, beginPos, endPos);
    readStream.resetRegion(contigId, beginPos, endPos);

    std::vector<RepeatRead> reads;
    while (readStream.next())
    {
        const bam_record& bamRead(*readStream.get_record_ptr());

        RepeatRead read;
        if (! getRepeatRead(bamRead, locus.id, read)) continue;

#ifdef DEBUG_READ_EXTRACT
        log_os << __FUNCTION__ << ": " << read << "\n";
#endif

        reads.push_back(read);
    }

    return reads;
}
