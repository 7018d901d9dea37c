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

#include "GenotypeLoader.hh"
#include "RegionLabelBuilder.hh"

#include "common/Exceptions.hh"
#include "htsapi/vcf_streamer.hh"
#include "htsapi/vcf_util.hh"

#include <sstream>


static const char locusIdInfoKey[] = "TRID";
static const char genotypeFormatKey[] = "GT";
static const char motifSpansFormatKey[] = "MS";



std::vector<std::string>
getAlleleSequences(
    const RepeatLocus& locus,
    const vcf_record& record,
    const std::vector<int>& genotype)
{
    std::vector<std::string> alleleSeqs;
    std::string calledSeq;
    for (const int alleleIndex : genotype)
    {
        if (! record.getAlleleSequence(alleleIndex, calledSeq))
        {
            std::ostringstream oss;
            oss << "Genotype allele index " << alleleIndex << " does not match any allele in VCF record for locus '"
                << locus.id << "':\n" << record;
            BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
        }
        alleleSeqs.push_back(locus.leftFlank + calledSeq + locus.rightFlank);
    }
    return alleleSeqs;
}



static
void
getRequiredSampleValue(
    const RepeatLocus& locus,
    const vcf_record& record,
    const char* key,
    std::string& value)
{
    if (record.getSampleValue(key, value)) return;

    std::ostringstream oss;
    oss << "VCF record for locus '" << locus.id << "' is missing required FORMAT/" << key << " value:\n" << record;
    BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
}



std::vector<RepeatAllele>
getGenotype(
    const RepeatLocus& locus,
    const vcf_record& record,
    const BaseLabelDispatcher& baseLabeler)
{
    using namespace tranno::common;

    std::string gtValue;
    getRequiredSampleValue(locus, record, genotypeFormatKey, gtValue);

    std::vector<int> genotype;
    parse_gt(gtValue.c_str(), genotype);

    for (const int alleleIndex : genotype)
    {
        if (alleleIndex >= 0) continue;
        std::ostringstream oss;
        oss << "TRID=" << locus.id << " misses genotyping";
        BOOST_THROW_EXCEPTION(IncompleteGenotypeException(locus.id, oss.str()));
    }

    const std::vector<std::string> alleleSeqs(getAlleleSequences(locus, record, genotype));

    std::string msValue;
    getRequiredSampleValue(locus, record, motifSpansFormatKey, msValue);
    const std::vector<AlleleMotifSpans> spansByAllele(decodeMotifSpans(msValue));

    const unsigned alleleCount(alleleSeqs.size());
    if (spansByAllele.size() != alleleCount)
    {
        std::ostringstream oss;
        oss << "FORMAT/MS value '" << msValue << "' describes " << spansByAllele.size()
            << " alleles, but GT '" << gtValue << "' calls " << alleleCount
            << " alleles for locus '" << locus.id << "'";
        BOOST_THROW_EXCEPTION(InputFormatException(oss.str()));
    }

    std::vector<RepeatAllele> alleles(alleleCount);
    for (unsigned alleleIndex(0); alleleIndex<alleleCount; ++alleleIndex)
    {
        RepeatAllele& allele(alleles[alleleIndex]);
        allele.seq = alleleSeqs[alleleIndex];
        allele.regionLabels = getRegionLabels(locus, allele.seq, spansByAllele[alleleIndex]);
        allele.flankLabels = getFlankLabels(allele.regionLabels);
    }

    const std::vector<BaseLabels> baseLabelsByAllele(baseLabeler.getBaseLabels(locus, spansByAllele, alleleSeqs));
    for (unsigned alleleIndex(0); alleleIndex<alleleCount; ++alleleIndex)
    {
        alleles[alleleIndex].baseLabels = baseLabelsByAllele[alleleIndex];
    }
    return alleles;
}



std::vector<RepeatAllele>
loadGenotype(
    const std::string& vcfFilename,
    const RepeatLocus& locus,
    const BaseLabelDispatcher& baseLabeler)
{
    using namespace tranno::common;

    vcf_streamer vcfStream(vcfFilename.c_str());

    std::string locusId;
    while (vcfStream.next())
    {
        const vcf_record& record(*vcfStream.get_record_ptr());
        if (! record.getInfoValue(locusIdInfoKey, locusId))
        {
            std::ostringstream oss;
            oss << "VCF record is missing required INFO/" << locusIdInfoKey << " value:\n";
            vcfStream.report_state(oss);
            BOOST_THROW_EXCEPTION(InputFormatException(oss.str()));
        }

        if (locusId != locus.id) continue;

        return getGenotype(locus, record, baseLabeler);
    }

    std::ostringstream oss;
    oss << "TRID=" << locus.id << " missing from VCF file '" << vcfFilename << "'";
    BOOST_THROW_EXCEPTION(LocusNotFoundException(locus.id, oss.str()));
}
