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

#include "htsapi/bam_util.hh"
#include "common/Exceptions.hh"

#include <cerrno>
#include <cstring>

#include <sstream>



static
void
checkAuxUpdate(
    const int retval,
    const char* tag,
    const bam1_t& br)
{
    if (retval >= 0) return;

    using namespace tranno::common;
    std::ostringstream oss;
    oss << "Failed to add aux tag '" << tag << "' to bam record '" << bam_get_qname(&br) << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
}



void
edit_bam_read(
    const char* qname,
    const char* read,
    bam1_t& br)
{
    const size_t readSize(strlen(read));
    const int retval(bam_set1(&br, strlen(qname), qname, BAM_FUNMAP, -1, -1, 0,
                              0, nullptr, -1, -1, 0,
                              readSize, read, nullptr, 0));
    if (retval < 0)
    {
        using namespace tranno::common;
        std::ostringstream oss;
        oss << "Failed to set read data for bam record '" << qname << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }
}



void
edit_bam_mapped_read(
    const char* qname,
    const int32_t tid,
    const int64_t pos,
    const char* read,
    bam1_t& br)
{
    const size_t readSize(strlen(read));
    const uint32_t cigar(bam_cigar_gen(readSize, BAM_CMATCH));
    const int retval(bam_set1(&br, strlen(qname), qname, 0, tid, pos, 60,
                              1, &cigar, -1, -1, 0,
                              readSize, read, nullptr, 0));
    if (retval < 0)
    {
        using namespace tranno::common;
        std::ostringstream oss;
        oss << "Failed to set read data for bam record '" << qname << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }
}



void
add_bam_string_tag(
    const char* tag,
    const char* value,
    bam1_t& br)
{
    const int retval(bam_aux_append(&br, tag, 'Z', strlen(value)+1,
                                    reinterpret_cast<const uint8_t*>(value)));
    checkAuxUpdate(retval, tag, br);
}



void
add_bam_int_tag(
    const char* tag,
    const int32_t value,
    bam1_t& br)
{
    const int retval(bam_aux_append(&br, tag, 'i', sizeof(value),
                                    reinterpret_cast<const uint8_t*>(&value)));
    checkAuxUpdate(retval, tag, br);
}



void
add_bam_uint32_array_tag(
    const char* tag,
    const std::vector<uint32_t>& values,
    bam1_t& br)
{
    const int retval(bam_aux_update_array(&br, tag, 'I', values.size(),
                                          const_cast<uint32_t*>(values.data())));
    checkAuxUpdate(retval, tag, br);
}



void
add_bam_uint8_array_tag(
    const char* tag,
    const std::vector<uint8_t>& values,
    bam1_t& br)
{
    const int retval(bam_aux_update_array(&br, tag, 'C', values.size(),
                                          const_cast<uint8_t*>(values.data())));
    checkAuxUpdate(retval, tag, br);
}
