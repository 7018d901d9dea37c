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

#include "htsapi/bam_record.hh"

#include <limits>



std::string
bam_record::
get_read_string() const
{
    const uint8_t* bseq(bam_get_seq(_bp));
    const unsigned rsize(read_size());
    std::string read(rsize,'N');
    for (unsigned i(0); i<rsize; ++i)
    {
        read[i] = seq_nt16_str[bam_seqi(bseq,i)];
    }
    return read;
}



const char*
bam_record::
get_string_tag(const char* tag) const
{
    uint8_t* auxPtr(bam_aux_get(_bp,tag));
    if (nullptr == auxPtr) return nullptr;
    if (*auxPtr != 'Z') return nullptr;
    return bam_aux2Z(auxPtr);
}



bool
bam_record::
get_num_tag(
    const char* tag,
    int32_t& num) const
{
    uint8_t* auxPtr(bam_aux_get(_bp,tag));
    if (nullptr == auxPtr) return false;

    switch (*auxPtr)
    {
    case 'c':
    case 'C':
    case 's':
    case 'S':
    case 'i':
    case 'I':
        break;
    default:
        return false;
    }

    // 'I' values above the int32 range are rejected rather than wrapped:
    const int64_t value(bam_aux2i(auxPtr));
    if ((value > std::numeric_limits<int32_t>::max()) ||
        (value < std::numeric_limits<int32_t>::min())) return false;

    num = static_cast<int32_t>(value);
    return true;
}



bool
bam_record::
get_unsigned_array_tag(
    const char* tag,
    std::vector<uint32_t>& values) const
{
    values.clear();
    uint8_t* auxPtr(bam_aux_get(_bp,tag));
    if (nullptr == auxPtr) return false;
    if (auxPtr[0] != 'B') return false;

    switch (auxPtr[1])
    {
    case 'C':
    case 'S':
    case 'I':
        break;
    default:
        return false;
    }

    const uint32_t valueCount(bam_auxB_len(auxPtr));
    for (uint32_t valueIndex(0); valueIndex<valueCount; ++valueIndex)
    {
        values.push_back(static_cast<uint32_t>(bam_auxB2i(auxPtr,valueIndex)));
    }
    return true;
}



bool
bam_record::
get_uint8_array_tag(
    const char* tag,
    std::vector<uint8_t>& values) const
{
    values.clear();
    uint8_t* auxPtr(bam_aux_get(_bp,tag));
    if (nullptr == auxPtr) return false;
    if ((auxPtr[0] != 'B') || (auxPtr[1] != 'C')) return false;

    const uint32_t valueCount(bam_auxB_len(auxPtr));
    for (uint32_t valueIndex(0); valueIndex<valueCount; ++valueIndex)
    {
        values.push_back(static_cast<uint8_t>(bam_auxB2i(auxPtr,valueIndex)));
    }
    return true;
}
