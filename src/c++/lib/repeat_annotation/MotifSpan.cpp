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

#include "MotifSpan.hh"

#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include "boost/algorithm/string/classification.hpp"
#include "boost/algorithm/string/split.hpp"

#include <cctype>

#include <iostream>
#include <sstream>


static const char noSpansEncoding[] = ".";



static
void
throwSpanFormatException(
    const std::string& span,
    const std::string& encoding)
{
    std::ostringstream oss;
    oss << "Malformed motif span '" << span << "' in motif span encoding '" << encoding << "'."
        << " Expected format is '<motif_index>(<start>-<end>)'";
    BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
}



/// parse a non-negative integer field of a span, which must consist of digits only
///
/// leading zeros are rejected, any accepted encoding re-encodes unchanged
static
unsigned
parseSpanValue(
    const std::string& field,
    const std::string& span,
    const std::string& encoding)
{
    if (field.empty()) throwSpanFormatException(span, encoding);
    if ((field.size() > 1) && (field[0] == '0')) throwSpanFormatException(span, encoding);
    for (const char c : field)
    {
        if (! isdigit(static_cast<unsigned char>(c))) throwSpanFormatException(span, encoding);
    }
    return tranno::blt_util::parse_unsigned_str(field);
}



static
MotifSpan
decodeMotifSpan(
    const std::string& span,
    const std::string& encoding)
{
    const size_t openPos(span.find('('));
    const size_t dashPos(span.find('-'));
    const size_t closePos(span.find(')'));

    if ((openPos == std::string::npos) ||
        (dashPos == std::string::npos) ||
        (closePos == std::string::npos) ||
        (openPos > dashPos) ||
        (dashPos > closePos) ||
        ((closePos+1) != span.size()))
    {
        throwSpanFormatException(span, encoding);
    }

    MotifSpan motifSpan;
    motifSpan.motifIndex = parseSpanValue(span.substr(0,openPos), span, encoding);
    motifSpan.start = parseSpanValue(span.substr(openPos+1,dashPos-(openPos+1)), span, encoding);
    motifSpan.end = parseSpanValue(span.substr(dashPos+1,closePos-(dashPos+1)), span, encoding);
    return motifSpan;
}



AlleleMotifSpans
decodeAlleleMotifSpans(const std::string& encoding)
{
    if (encoding == noSpansEncoding) return AlleleMotifSpans();

    if (encoding.empty())
    {
        BOOST_THROW_EXCEPTION(tranno::common::InputFormatException("Empty motif span encoding"));
    }

    std::vector<std::string> spanTokens;
    boost::algorithm::split(spanTokens, encoding, boost::is_any_of("_"));

    MotifSpans spans;
    for (const auto& spanToken : spanTokens)
    {
        spans.push_back(decodeMotifSpan(spanToken, encoding));
    }
    return AlleleMotifSpans(spans);
}



std::vector<AlleleMotifSpans>
decodeMotifSpans(const std::string& msField)
{
    std::vector<std::string> alleleTokens;
    boost::algorithm::split(alleleTokens, msField, boost::is_any_of(","));

    std::vector<AlleleMotifSpans> spansByAllele;
    for (const auto& alleleToken : alleleTokens)
    {
        spansByAllele.push_back(decodeAlleleMotifSpans(alleleToken));
    }
    return spansByAllele;
}



std::string
encodeAlleleMotifSpans(const AlleleMotifSpans& spans)
{
    if (! spans) return noSpansEncoding;

    std::ostringstream oss;
    bool isFirst(true);
    for (const auto& span : *spans)
    {
        if (! isFirst) oss << '_';
        oss << span;
        isFirst = false;
    }
    return oss.str();
}



std::ostream&
operator<<(std::ostream& os, const MotifSpan& span)
{
    os << span.motifIndex << '(' << span.start << '-' << span.end << ')';
    return os;
}
