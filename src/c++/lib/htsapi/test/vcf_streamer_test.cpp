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

#include "htsapi/vcf_streamer.hh"

#include "common/Exceptions.hh"

#include "boost/test/unit_test.hpp"

#include <sstream>


BOOST_AUTO_TEST_SUITE( test_vcf_streamer )

static
const char*
getTestVcfPath()
{
    static const std::string testPath(std::string(TEST_DATA_PATH) + "/vcf_streamer_test.vcf");
    return testPath.c_str();
}



BOOST_AUTO_TEST_CASE( test_vcf_streamer_whole_file )
{
    vcf_streamer vcfs(getTestVcfPath());

    BOOST_REQUIRE(vcfs.get_record_ptr() == nullptr);

    // header lines are skipped and records are streamed in file order
    BOOST_REQUIRE( vcfs.next() );
    const vcf_record* vptr(vcfs.get_record_ptr());
    BOOST_REQUIRE(vptr != nullptr);
    BOOST_REQUIRE_EQUAL(vptr->chrom, "chr1");
    BOOST_REQUIRE_EQUAL(vptr->pos, 11);
    BOOST_REQUIRE_EQUAL(vptr->info, "TRID=A");
    BOOST_REQUIRE_EQUAL(vcfs.record_no(), 1u);

    BOOST_REQUIRE( vcfs.next() );
    vptr = vcfs.get_record_ptr();
    BOOST_REQUIRE_EQUAL(vptr->pos, 21);
    BOOST_REQUIRE_EQUAL(vptr->sample, "1/1");

    BOOST_REQUIRE( vcfs.next() );
    vptr = vcfs.get_record_ptr();
    BOOST_REQUIRE_EQUAL(vptr->chrom, "chr2");
    BOOST_REQUIRE_EQUAL(vptr->alt[0], "GA");

    {
        std::ostringstream oss;
        vcfs.report_state(oss);
        BOOST_REQUIRE(oss.str().find("vcf_stream_record_no: 3") != std::string::npos);
    }

    // the last record in the test file is truncated
    BOOST_REQUIRE_THROW( vcfs.next(), tranno::common::InputFormatException );
}


BOOST_AUTO_TEST_CASE( test_vcf_streamer_missing_file )
{
    const std::string missingPath(std::string(TEST_DATA_PATH) + "/no_such_file.vcf");
    BOOST_REQUIRE_THROW( vcf_streamer vcfs(missingPath.c_str()), tranno::common::IoException );
}


BOOST_AUTO_TEST_SUITE_END()
