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

#include "htsapi/bam_util.hh"

#include <cstdint>

#include <string>
#include <vector>


/// owning wrapper for a single htslib bam1_t record
///
struct bam_record
{
    bam_record() :
        _bp(bam_init1())
    {}

    ~bam_record()
    {
        if (nullptr != _bp) bam_destroy1(_bp);
    }

    bam_record(const bam_record& rhs) :
        _bp(bam_dup1(rhs._bp))
    {}

    bam_record&
    operator=(const bam_record& rhs)
    {
        if (this == &rhs) return *this;
        bam_copy1(_bp,rhs._bp);
        return *this;
    }

    const char* qname() const
    {
        return bam_get_qname(_bp);
    }

    int32_t target_id() const
    {
        return _bp->core.tid;
    }

    /// 1-indexed alignment start position
    int32_t pos() const
    {
        return _bp->core.pos+1;
    }

    bool is_unmapped() const
    {
        return ((_bp->core.flag & BAM_FUNMAP) != 0);
    }

    unsigned read_size() const
    {
        return _bp->core.l_qseq;
    }

    /// decode the read sequence into a string of upper-case bases
    std::string
    get_read_string() const;

    /// true if the aux tag is present, irrespective of type
    bool
    has_tag(const char* tag) const
    {
        return (nullptr != bam_aux_get(_bp,tag));
    }

    /// return the value of a 'Z' aux tag, or nullptr if the tag is absent or has another type
    const char*
    get_string_tag(const char* tag) const;

    /// get the value of an integer aux tag of any integer width
    ///
    /// \return false if the tag is absent, is not an integer, or is outside of the int32 range
    bool
    get_num_tag(
        const char* tag,
        int32_t& num) const;

    /// get the values of a 'B' aux tag with an unsigned integer subtype ('C', 'S' or 'I')
    ///
    /// \return false if the tag is absent or has another type
    bool
    get_unsigned_array_tag(
        const char* tag,
        std::vector<uint32_t>& values) const;

    /// get the values of a 'B:C' (uint8 array) aux tag
    ///
    /// \return false if the tag is absent or has another type
    bool
    get_uint8_array_tag(
        const char* tag,
        std::vector<uint8_t>& values) const;

    bam1_t* get_data()
    {
        return _bp;
    }

    const bam1_t* get_data() const
    {
        return _bp;
    }

private:
    friend struct bam_streamer;

    bam1_t* _bp;
};
