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
/// \brief temporary alignment files for unit tests
///

#pragma once

#include "htsapi/bam_record.hh"
#include "htsapi/hts_ptr.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/filesystem.hpp"
#include "boost/test/unit_test.hpp"
#include "boost/utility.hpp"

#include "blt_util/thirdparty_pop.h"

#include <cstring>

#include <string>
#include <vector>


/// a unique temporary file path, the file and any index beside it are removed on destruction
struct TestTempPath : private boost::noncopyable
{
    explicit
    TestTempPath(const char* suffix)
        : path((boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path(std::string("tranno-%%%%-%%%%-%%%%") + suffix)).string())
    {}

    ~TestTempPath()
    {
        boost::system::error_code ec;
        boost::filesystem::remove(path, ec);
        boost::filesystem::remove(path + ".bai", ec);
    }

    const std::string path;
};



/// write reads to an indexed BAM file
///
/// reads must already be sorted by position
inline
void
writeIndexedTestBamFile(
    const std::string& path,
    const std::string& headerText,
    const std::vector<bam_record>& reads)
{
    hts_file_ptr sfp(sam_open(path.c_str(), "wb"));
    BOOST_REQUIRE(sfp);

    bam_hdr_ptr hdr(sam_hdr_parse(headerText.size(), headerText.c_str()));
    BOOST_REQUIRE(hdr);
    BOOST_REQUIRE(sam_hdr_write(sfp.get(), hdr.get()) >= 0);

    for (const bam_record& read : reads)
    {
        BOOST_REQUIRE(sam_write1(sfp.get(), hdr.get(), read.get_data()) >= 0);
    }

    BOOST_REQUIRE_EQUAL(sam_close(sfp.release()), 0);
    BOOST_REQUIRE_EQUAL(sam_index_build(path.c_str(), 0), 0);
}
