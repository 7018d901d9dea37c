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

#include "ReadTagValidator.hh"

#include "common/Exceptions.hh"

#include <sstream>


static const char locusIdTag[] = "TR";
static const char alleleTag[] = "AL";
static const char flankTrimTag[] = "FL";
static const char methylationTag[] = "MC";

static const char producerVersionHint[] = "Was this alignment file generated by the latest version of TRGT?";



static
void
throwMalformedTagException(
    const bam_record& bamRead,
    const char* tag,
    const std::string& problem)
{
    std::ostringstream oss;
    oss << problem << " " << tag << " tag in read '" << bamRead.qname() << "'. " << producerVersionHint;
    BOOST_THROW_EXCEPTION(tranno::common::MalformedReadTagException(bamRead.qname(), tag, oss.str()));
}



std::string
getReadLocusId(const bam_record& bamRead)
{
    const char* locusId(bamRead.get_string_tag(locusIdTag));
    if (nullptr == locusId)
    {
        throwMalformedTagException(bamRead, locusIdTag, "Missing or malformed");
    }
    return locusId;
}



int32_t
getReadAllele(const bam_record& bamRead)
{
    if (! bamRead.has_tag(alleleTag))
    {
        throwMalformedTagException(bamRead, alleleTag, "Missing");
    }

    int32_t allele(0);
    if (! bamRead.get_num_tag(alleleTag, allele))
    {
        throwMalformedTagException(bamRead, alleleTag, "Malformed");
    }
    return allele;
}



void
getReadFlankTrim(
    const bam_record& bamRead,
    unsigned& leftFlank,
    unsigned& rightFlank)
{
    if (! bamRead.has_tag(flankTrimTag))
    {
        throwMalformedTagException(bamRead, flankTrimTag, "Missing");
    }

    std::vector<uint32_t> values;
    if (! bamRead.get_unsigned_array_tag(flankTrimTag, values))
    {
        throwMalformedTagException(bamRead, flankTrimTag, "Malformed");
    }

    if (values.size() != 2)
    {
        std::ostringstream oss;
        oss << "Expected 2 values, found " << values.size() << ", in";
        throwMalformedTagException(bamRead, flankTrimTag, oss.str());
    }

    leftFlank = values[0];
    rightFlank = values[1];
}



boost::optional<std::vector<uint8_t>>
getReadMethylation(const bam_record& bamRead)
{
    typedef boost::optional<std::vector<uint8_t>> meth_t;

    if (! bamRead.has_tag(methylationTag)) return meth_t();

    std::vector<uint8_t> values;
    if (! bamRead.get_uint8_array_tag(methylationTag, values))
    {
        throwMalformedTagException(bamRead, methylationTag, "Malformed");
    }

    if (values.empty()) return meth_t();
    return meth_t(values);
}
