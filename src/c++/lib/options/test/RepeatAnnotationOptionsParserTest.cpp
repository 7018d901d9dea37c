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

#include "options/RepeatAnnotationOptionsParser.hh"

#include "boost/test/unit_test.hpp"

#include <vector>


BOOST_AUTO_TEST_SUITE( test_repeatAnnotationOptionsParser )


static
bool
parseTestOptions(
    const std::vector<const char*>& args,
    RepeatAnnotationOptions& opt,
    std::string& errorMsg)
{
    namespace po = boost::program_options;

    std::vector<const char*> argv(args);
    argv.insert(argv.begin(), "test");

    const po::options_description desc(getOptionsDescription(opt));
    po::variables_map vm;
    po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(), desc), vm);
    po::notify(vm);

    parseOptions(vm, opt);
    return checkOptions(opt, errorMsg);
}



BOOST_AUTO_TEST_CASE( test_defaultOptions )
{
    RepeatAnnotationOptions opt;
    std::string errorMsg;
    BOOST_REQUIRE(! parseTestOptions({}, opt, errorMsg));
    BOOST_REQUIRE_EQUAL(opt.readSearchRadius, 1000u);
    BOOST_REQUIRE(opt.referenceFilename.empty());
    BOOST_REQUIRE(errorMsg.empty());
}


BOOST_AUTO_TEST_CASE( test_readSearchRadius )
{
    RepeatAnnotationOptions opt;
    std::string errorMsg;
    BOOST_REQUIRE(! parseTestOptions({"--read-search-radius", "250"}, opt, errorMsg));
    BOOST_REQUIRE_EQUAL(opt.readSearchRadius, 250u);

    RepeatAnnotationOptions opt2;
    BOOST_REQUIRE(parseTestOptions({"--read-search-radius", "0"}, opt2, errorMsg));
    BOOST_REQUIRE(! errorMsg.empty());
}


BOOST_AUTO_TEST_CASE( test_reference )
{
    const std::string testVcfPath(std::string(TEST_DATA_PATH) + "/vcf_streamer_test.vcf");

    RepeatAnnotationOptions opt;
    std::string errorMsg;
    BOOST_REQUIRE(! parseTestOptions({"--ref", testVcfPath.c_str()}, opt, errorMsg));
    BOOST_REQUIRE_EQUAL(opt.referenceFilename, testVcfPath);

    const std::string missingPath(std::string(TEST_DATA_PATH) + "/no_such_file.fa");
    RepeatAnnotationOptions opt2;
    BOOST_REQUIRE(parseTestOptions({"--ref", missingPath.c_str()}, opt2, errorMsg));
    BOOST_REQUIRE(errorMsg.find("no_such_file.fa") != std::string::npos);
}


BOOST_AUTO_TEST_SUITE_END()
