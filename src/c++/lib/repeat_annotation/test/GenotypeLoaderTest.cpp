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

#include "TestBaseLabelers.hh"

#include "repeat_annotation/GenotypeLoader.hh"

#include "common/Exceptions.hh"

#include "boost/test/unit_test.hpp"

#include <sstream>


BOOST_AUTO_TEST_SUITE( test_genotypeLoader )


static
const std::string&
getTestVcfPath()
{
    static const std::string testPath(std::string(TEST_DATA_PATH) + "/genotype_loader_test.vcf");
    return testPath;
}



static
RepeatLocus
getTestLocus(const std::string& locusId)
{
    RepeatLocus locus;
    locus.id = locusId;
    locus.contig = "chr1";
    locus.leftFlank = "ACGTACGTAC";
    locus.rightFlank = "TTGGCCAATT";
    locus.motifs = {"CAG"};
    locus.structure = "(CAG)n";
    return locus;
}



static
std::string
getLabelString(const RegionLabels& labels)
{
    std::ostringstream oss;
    oss << labels;
    return oss.str();
}



BOOST_AUTO_TEST_CASE( test_loadGenotype )
{
    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    const RepeatLocus locus(getTestLocus("TEST_SIMPLE"));
    const std::vector<RepeatAllele> alleles(loadGenotype(getTestVcfPath(), locus, dispatcher));

    // the first record for this locus is used, later duplicates are ignored
    BOOST_REQUIRE_EQUAL(alleles.size(), 2u);
    BOOST_REQUIRE_EQUAL(alleles[0].seq, locus.leftFlank + "CAGCAGCAGCAGCAGCAGCATTTTTGCAGCAGCAGCAGCAGCAGC" + locus.rightFlank);
    BOOST_REQUIRE_EQUAL(alleles[1].seq, locus.leftFlank + "CAGCAGCAGCAGCAGCAGCA" + locus.rightFlank);

    BOOST_REQUIRE_EQUAL(getLabelString(alleles[0].regionLabels),
                        "Flank(0,10), Tr(10,30,CAG), Seq(30,35), Tr(35,55,CAG), Flank(55,65)");
    BOOST_REQUIRE_EQUAL(getLabelString(alleles[0].flankLabels), "Flank(0,10), Other(10,55), Flank(55,65)");

    BOOST_REQUIRE_EQUAL(getLabelString(alleles[1].regionLabels), "Flank(0,10), Other(10,30), Flank(30,40)");
    BOOST_REQUIRE_EQUAL(getLabelString(alleles[1].flankLabels), "Flank(0,10), Other(10,30), Flank(30,40)");

    BOOST_REQUIRE_EQUAL(nestedLabeler.callCount, 0u);
    BOOST_REQUIRE_EQUAL(motifSpanLabeler.callCount, 1u);
    BOOST_REQUIRE_EQUAL(motifSpanLabeler.lastSpansByAllele.size(), 2u);
    BOOST_REQUIRE(! motifSpanLabeler.lastSpansByAllele[1]);

    for (const RepeatAllele& allele : alleles)
    {
        BOOST_REQUIRE_EQUAL(allele.baseLabels.size(), allele.seq.size());
    }
}


// alleles are returned in genotype call order, not allele index order
BOOST_AUTO_TEST_CASE( test_loadNestedGenotype )
{
    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    RepeatLocus locus(getTestLocus("TEST_NESTED"));
    locus.leftFlank = "AA";
    locus.rightFlank = "TT";
    locus.motifs = {"CAG", "CCG"};
    locus.structure = "<NESTED>";

    const std::vector<RepeatAllele> alleles(loadGenotype(getTestVcfPath(), locus, dispatcher));

    BOOST_REQUIRE_EQUAL(alleles.size(), 2u);
    BOOST_REQUIRE_EQUAL(alleles[0].seq, "AACAGCAGCAGCCGCCGCCGTT");
    BOOST_REQUIRE_EQUAL(alleles[1].seq, "AACAGCAGCCGCCGTT");

    BOOST_REQUIRE_EQUAL(getLabelString(alleles[0].regionLabels),
                        "Flank(0,2), Tr(2,11,CAG), Tr(11,20,CCG), Flank(20,22)");
    BOOST_REQUIRE_EQUAL(getLabelString(alleles[1].regionLabels),
                        "Flank(0,2), Tr(2,8,CAG), Tr(8,14,CCG), Flank(14,16)");

    BOOST_REQUIRE_EQUAL(nestedLabeler.callCount, 1u);
    BOOST_REQUIRE_EQUAL(motifSpanLabeler.callCount, 0u);
    BOOST_REQUIRE_EQUAL(alleles[0].baseLabels.size(), 22u);
    BOOST_REQUIRE_EQUAL(alleles[1].baseLabels.size(), 16u);
}


BOOST_AUTO_TEST_CASE( test_loadHaploidGenotype )
{
    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    const RepeatLocus locus(getTestLocus("TEST_HAPLOID"));
    const std::vector<RepeatAllele> alleles(loadGenotype(getTestVcfPath(), locus, dispatcher));

    BOOST_REQUIRE_EQUAL(alleles.size(), 1u);
    BOOST_REQUIRE_EQUAL(alleles[0].seq, locus.leftFlank + "CAGCAGCAG" + locus.rightFlank);
    BOOST_REQUIRE_EQUAL(getLabelString(alleles[0].regionLabels), "Flank(0,10), Tr(10,19,CAG), Flank(19,29)");
}


BOOST_AUTO_TEST_CASE( test_incompleteGenotype )
{
    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    const RepeatLocus locus(getTestLocus("TEST_MISSING"));
    try
    {
        loadGenotype(getTestVcfPath(), locus, dispatcher);
        BOOST_FAIL("Expected exception");
    }
    catch (const tranno::common::IncompleteGenotypeException& e)
    {
        BOOST_REQUIRE_EQUAL(e.getLocusId(), "TEST_MISSING");
        const std::string message(e.what());
        BOOST_REQUIRE(message.find("TRID=TEST_MISSING misses genotyping") != std::string::npos);
    }

    BOOST_REQUIRE_EQUAL(motifSpanLabeler.callCount, 0u);
}


// a single missing allele call is enough to reject the genotype
BOOST_AUTO_TEST_CASE( test_partiallyIncompleteGenotype )
{
    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    static const char* locusIds[] = { "TEST_MISSING_FIRST", "TEST_MISSING_SECOND" };
    for (const char* locusId : locusIds)
    {
        try
        {
            loadGenotype(getTestVcfPath(), getTestLocus(locusId), dispatcher);
            BOOST_FAIL("Expected exception");
        }
        catch (const tranno::common::IncompleteGenotypeException& e)
        {
            BOOST_REQUIRE_EQUAL(e.getLocusId(), locusId);
        }
    }

    BOOST_REQUIRE_EQUAL(motifSpanLabeler.callCount, 0u);
}


BOOST_AUTO_TEST_CASE( test_locusNotFound )
{
    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    const RepeatLocus locus(getTestLocus("TEST_ABSENT"));
    try
    {
        loadGenotype(getTestVcfPath(), locus, dispatcher);
        BOOST_FAIL("Expected exception");
    }
    catch (const tranno::common::LocusNotFoundException& e)
    {
        BOOST_REQUIRE_EQUAL(e.getLocusId(), "TEST_ABSENT");
    }
}


BOOST_AUTO_TEST_CASE( test_malformedGenotypeRecords )
{
    using tranno::common::InputFormatException;

    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    // MS describes fewer alleles than GT calls
    BOOST_REQUIRE_THROW(loadGenotype(getTestVcfPath(), getTestLocus("TEST_BAD_MS"), dispatcher),
                        InputFormatException);

    // GT refers to an allele missing from ALT
    BOOST_REQUIRE_THROW(loadGenotype(getTestVcfPath(), getTestLocus("TEST_BAD_INDEX"), dispatcher),
                        InputFormatException);
}


BOOST_AUTO_TEST_CASE( test_getGenotypeMissingMotifSpans )
{
    TestNestedStructureBaseLabeler nestedLabeler;
    TestMotifSpanBaseLabeler motifSpanLabeler;
    const BaseLabelDispatcher dispatcher(nestedLabeler, motifSpanLabeler);

    vcf_record record;
    BOOST_REQUIRE(record.set("chr1\t10\t.\tCAG\tCAGCAG\t.\t.\tTRID=TEST_SIMPLE\tGT:AL\t0/1:3,6"));
    BOOST_REQUIRE_THROW(getGenotype(getTestLocus("TEST_SIMPLE"), record, dispatcher),
                        tranno::common::InputFormatException);
}


BOOST_AUTO_TEST_CASE( test_getAlleleSequences )
{
    const RepeatLocus locus(getTestLocus("TEST_SIMPLE"));

    vcf_record record;
    BOOST_REQUIRE(record.set("chr1\t10\t.\tCAG\tCAGCAG,C\t.\t.\tTRID=TEST_SIMPLE\tGT\t2/1"));

    const std::vector<std::string> alleleSeqs(getAlleleSequences(locus, record, {2, 1, 0}));
    BOOST_REQUIRE_EQUAL(alleleSeqs.size(), 3u);
    BOOST_REQUIRE_EQUAL(alleleSeqs[0], locus.leftFlank + "C" + locus.rightFlank);
    BOOST_REQUIRE_EQUAL(alleleSeqs[1], locus.leftFlank + "CAGCAG" + locus.rightFlank);
    BOOST_REQUIRE_EQUAL(alleleSeqs[2], locus.leftFlank + "CAG" + locus.rightFlank);

    BOOST_REQUIRE_THROW(getAlleleSequences(locus, record, {3}), tranno::common::InputFormatException);
}


BOOST_AUTO_TEST_SUITE_END()
