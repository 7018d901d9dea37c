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
/// \brief owning pointer types for htslib handles
///
/// the deleters are used on every exit path, including a streamer constructor
/// which throws after some handles have been opened
///

#pragma once

#include "blt_util/thirdparty_push.h"

#include "htslib/hts.h"
#include "htslib/sam.h"

#include "blt_util/thirdparty_pop.h"

#include <memory>


struct hts_file_deleter
{
    void operator()(htsFile* hfp) const;
};

struct bam_hdr_deleter
{
    void operator()(bam_hdr_t* hdr) const
    {
        bam_hdr_destroy(hdr);
    }
};

struct hts_idx_deleter
{
    void operator()(hts_idx_t* hidx) const
    {
        hts_idx_destroy(hidx);
    }
};

struct hts_itr_deleter
{
    void operator()(hts_itr_t* hitr) const
    {
        hts_itr_destroy(hitr);
    }
};

typedef std::unique_ptr<htsFile, hts_file_deleter> hts_file_ptr;
typedef std::unique_ptr<bam_hdr_t, bam_hdr_deleter> bam_hdr_ptr;
typedef std::unique_ptr<hts_idx_t, hts_idx_deleter> hts_idx_ptr;
typedef std::unique_ptr<hts_itr_t, hts_itr_deleter> hts_itr_ptr;


/// close hfp, logging a warning with the file label if htslib reports an error
void
close_hts_file(
    htsFile* hfp,
    const char* label);
