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

#include "repeat_annotation/RepeatCatalog.hh"

#include "common/Exceptions.hh"

#include "boost/test/unit_test.hpp"

#include <sstream>


BOOST_AUTO_TEST_SUITE( test_repeatCatalog )


static const char testCatalog[] =
    "chr1\t100\t130\tID=LOCUS1;MOTIFS=CAG;STRUC=(CAG)n\n"
    "chr1\t500\t530\tID=LOCUS10;MOTIFS=CCG;STRUC=(CCG)n\n"
    "chr2\t100\t130\tID=LOCUS2;MOTIFS=CAG,CCG;STRUC=<NESTED>\n"
    "chr2\t900\t930\tID=LOCUS2;MOTIFS=A;STRUC=(A)n\n";


BOOST_AUTO_TEST_CASE( test_findCatalogLine )
{
    std::istringstream iss(testCatalog);
    BOOST_REQUIRE_EQUAL(findCatalogLine(iss, "LOCUS10"), "chr1\t500\t530\tID=LOCUS10;MOTIFS=CCG;STRUC=(CCG)n");
}


// the id must be followed by the field separator, so LOCUS1 does not match LOCUS10
BOOST_AUTO_TEST_CASE( test_findCatalogLineExactId )
{
    std::istringstream iss(testCatalog);
    BOOST_REQUIRE_EQUAL(findCatalogLine(iss, "LOCUS1"), "chr1\t100\t130\tID=LOCUS1;MOTIFS=CAG;STRUC=(CAG)n");

    std::istringstream iss2(testCatalog);
    BOOST_REQUIRE_THROW(findCatalogLine(iss2, "LOCUS"), tranno::common::LocusNotFoundException);
}


BOOST_AUTO_TEST_CASE( test_findCatalogLineFirstMatch )
{
    std::istringstream iss(testCatalog);
    BOOST_REQUIRE_EQUAL(findCatalogLine(iss, "LOCUS2"), "chr2\t100\t130\tID=LOCUS2;MOTIFS=CAG,CCG;STRUC=<NESTED>");
}


BOOST_AUTO_TEST_CASE( test_findCatalogLineNotFound )
{
    std::istringstream iss(testCatalog);
    try
    {
        findCatalogLine(iss, "LOCUS3");
        BOOST_FAIL("Expected exception");
    }
    catch (const tranno::common::LocusNotFoundException& e)
    {
        BOOST_REQUIRE_EQUAL(e.getLocusId(), "LOCUS3");
        BOOST_REQUIRE_EQUAL(std::string(e.what()), "Unable to find locus LOCUS3");
    }
}


BOOST_AUTO_TEST_SUITE_END()
