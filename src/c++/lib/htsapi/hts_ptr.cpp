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

#include "htsapi/hts_ptr.hh"

#include "blt_util/log.hh"

#include <iostream>



void
close_hts_file(
    htsFile* hfp,
    const char* label)
{
    if (nullptr == hfp) return;
    if (0 != hts_close(hfp))
    {
        log_os << "WARNING: Failed to close hts file: '" << label << "'\n";
    }
}



void
hts_file_deleter::
operator()(htsFile* hfp) const
{
    if (nullptr == hfp) return;
    if (0 != hts_close(hfp))
    {
        log_os << "WARNING: Failed to close hts file\n";
    }
}
