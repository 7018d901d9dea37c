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

#include "htsapi/hts_ptr.hh"
#include "htsapi/vcf_record.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/utility.hpp"
#include "htslib/hts.h"
#include "htslib/kstring.h"

#include "blt_util/thirdparty_pop.h"

#include <iosfwd>
#include <string>


/// stream all vcf records from a plain or bgzip-compressed VCF file in file order
///
/// header and empty lines are skipped, no index is required
///
struct vcf_streamer : private boost::noncopyable
{
    explicit
    vcf_streamer(const char* filename);

    ~vcf_streamer();

    bool next();

    const vcf_record* get_record_ptr() const
    {
        if (_is_record_set) return &_vcfrec;
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

private:
    bool _is_record_set;
    bool _is_stream_end;
    unsigned _record_no;
    std::string _stream_name;

    hts_file_ptr _hfp;
    kstring_t _kstr;

    vcf_record _vcfrec;
};
