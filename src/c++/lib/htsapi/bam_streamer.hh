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
/// \author Chris Saunders
///

#pragma once

#include "htsapi/bam_record.hh"
#include "htsapi/hts_ptr.hh"

#include "boost/utility.hpp"

#include <iosfwd>
#include <string>


/// stream bam records from an indexed BAM/CRAM file
///
/// no records are streamed until a region is set with resetRegion()
///
struct bam_streamer : private boost::noncopyable
{
    /// \param[in] referenceFilename required to decode CRAM input, may be null for BAM
    explicit
    bam_streamer(
        const char* filename,
        const char* referenceFilename = nullptr);

    ~bam_streamer();

    /// set new region using 0-indexed, half-open coordinates
    void
    resetRegion(
        const int referenceContigId,
        const int64_t beginPos,
        const int64_t endPos);

    bool next();

    const bam_record* get_record_ptr() const
    {
        if (_is_record_set) return &_brec;
        else               return nullptr;
    }

    const char* name() const
    {
        return _stream_name.c_str();
    }

    unsigned record_no() const
    {
        return _record_no;
    }

    void report_state(std::ostream& os) const;

    const char*
    target_id_to_name(const int32_t tid) const;

    /// \return -1 if the contig is not in the file header
    int32_t
    target_name_to_id(const char* seq_name) const;

private:
    void _load_index();

    bool _is_record_set;
    unsigned _record_no;
    std::string _stream_name;

    bool _is_region;
    std::string _region;

    // handles are released in reverse declaration order
    hts_file_ptr _hfp;
    bam_hdr_ptr _hdr;
    hts_idx_ptr _hidx;
    hts_itr_ptr _hitr;

    bam_record _brec;
};
